#include "test_support.hpp"

#undef NDEBUG
#include <algorithm>
#include <cassert>
#include <string_view>
#include <variant>

#include "../endpoint_resolver.hpp"
#include "../location.hpp"
#include "../process.hpp"
#include "../rsync_command.hpp"
#include "../shell.hpp"
#include "../ssh.hpp"

namespace {

bool contains(const Command &command, const std::string &argument) {
	return std::find(command.begin(), command.end(), argument) != command.end();
}

std::ptrdiff_t position(const Command &command, const std::string &argument) {
	return std::find(command.begin(), command.end(), argument) - command.begin();
}

class ShellQuotingTest final : public PureTest {
	public:
	void perform() override {}

	void assert_validity() override {
		assert(shell_quote("/mnt/usb/docs") == "/mnt/usb/docs");
		assert(shell_quote("") == "''");
		assert(shell_quote("My Documents") == "'My Documents'");
		assert(shell_quote("it's") == "'it'\"'\"'s'");
		assert(shell_join({"rm", "-rf", "/a b"}) == "rm -rf '/a b'");

		assert(script_word("/mnt/usb/snapshots/${NBKP_SNAPSHOT}") == "/mnt/usb/snapshots/\"${NBKP_SNAPSHOT}\"");
		assert(script_word("--link-dest=../${NBKP_LATEST}") == "--link-dest=../\"${NBKP_LATEST}\"");
		assert(script_word("/a b/${X}/c") == "'/a b/'\"${X}\"/c");
		// not a variable reference: quoted literally
		assert(script_word("${1}") == "'${1}'");
		assert(script_word("$HOME") == "'$HOME'");
	}
};

class PrivateAddressTest final : public PureTest {
	public:
	void perform() override {}

	void assert_validity() override {
		assert(is_private_address("10.1.2.3"));
		assert(is_private_address("172.16.0.1"));
		assert(!is_private_address("172.32.0.1"));
		assert(is_private_address("192.168.1.20"));
		assert(is_private_address("127.0.0.1"));
		assert(is_private_address("169.254.10.1"));
		assert(is_private_address("100.64.0.1"));
		assert(!is_private_address("100.128.0.1"));
		assert(!is_private_address("8.8.8.8"));
		assert(is_private_address("::1"));
		assert(is_private_address("fd12:3456::1"));
		assert(is_private_address("fe80::1"));
		assert(!is_private_address("2001:db8::1"));
		assert(!is_private_address("not an address"));
	}
};

/** One volume reachable over a LAN name, a VPN name and a public name. */
class EndpointResolutionTest final : public PureTest {
	Configuration configuration;
	FakeHostResolver hosts;

	EndpointResolution resolve_with(const EndpointFilter &filter, const std::string &volume = "nas") const {
		const EndpointResolver resolver(configuration, hosts, filter);
		return resolver.resolve(std::get<RemoteVolume>(configuration.volumes.at(volume)));
	}

	static std::string chosen(const EndpointResolution &resolution) {
		return std::get<ResolvedEndpoint>(resolution).endpoint.slug;
	}

	public:
	void perform() override {
		configuration = configuration_from({
			{"ssh-endpoints", {
				{"nas-public", {{"host", "nas.example.org"}, {"location", "away"}}},
				{"nas-lan", {{"host", "nas.lan"}, {"location", "home"}}},
				{"nas-vpn", {{"host", "nas.vpn"}, {"location", "away"}, {"proxy-jump", "bastion"}}},
				{"bastion", {{"host", "bastion.example.org"}, {"port", 2200}, {"user", "jump"}}},
				{"offline", {{"host", "offline.example.org"}}},
			}},
			{"volumes", {
				{"nas", {
					{"type", "remote"},
					{"ssh-endpoint", "nas-public"},
					{"ssh-endpoints", {"offline", "nas-public", "nas-lan", "nas-vpn"}},
					{"path", "/srv/backup"},
				}},
				{"gone", {{"type", "remote"}, {"ssh-endpoint", "offline"}, {"path", "/srv"}}},
			}},
		});
		hosts.hosts = {
			{"nas.example.org", {"203.0.113.10"}},
			{"nas.lan", {"192.168.1.10"}},
			{"nas.vpn", {"10.8.0.10"}},
			{"bastion.example.org", {"198.51.100.1"}},
		};
	}

	void assert_validity() override {
		// unresolvable candidates are dropped, then the first declared wins
		assert(chosen(resolve_with({})) == "nas-public");
		assert(chosen(resolve_with({"home", NetworkPreference::any})) == "nas-lan");
		assert(chosen(resolve_with({std::nullopt, NetworkPreference::private_network})) == "nas-lan");
		assert(chosen(resolve_with({"away", NetworkPreference::private_network})) == "nas-vpn");
		assert(chosen(resolve_with({"home", NetworkPreference::public_network})) == "nas-lan");
		// a hint matching nothing is ignored
		assert(chosen(resolve_with({"mars", NetworkPreference::any})) == "nas-public");

		const ResolvedEndpoint vpn = std::get<ResolvedEndpoint>(resolve_with({"away", NetworkPreference::private_network}));
		assert(vpn.proxy_chain.size() == 1);
		assert(vpn.proxy_chain.front().slug == "bastion");

		const EndpointResolution gone = resolve_with({}, "gone");
		const NoReachableEndpoint &failure = std::get<NoReachableEndpoint>(gone);
		assert(failure.volume == "gone");
		assert(failure.candidates == std::vector<std::string>{"offline"});

		const ResolvedEndpoints all = EndpointResolver(configuration, hosts, {}).resolve_all();
		assert(all.size() == 2);
		assert(std::holds_alternative<ResolvedEndpoint>(all.at("nas")));
		assert(std::holds_alternative<NoReachableEndpoint>(all.at("gone")));
	}
};

class SshCommandTest final : public PureTest {
	Command command;
	Command plain;

	public:
	void perform() override {
		SshEndpoint bastion;
		bastion.slug = "bastion";
		bastion.host = "bastion.example.org";
		bastion.user = "jump";
		SshEndpoint relay;
		relay.slug = "relay";
		relay.host = "relay.example.org";
		relay.port = 2200;

		SshEndpoint nas;
		nas.slug = "nas";
		nas.host = "nas.example.org";
		nas.user = "backup";
		nas.port = 2222;
		nas.key = "/home/me/.ssh/id_backup";
		nas.connection_options.connect_timeout = 7;
		nas.connection_options.strict_host_key_checking = false;
		nas.connection_options.server_alive_interval = 30;

		command = build_ssh_command(ResolvedEndpoint{nas, {bastion, relay}}, "ls -1 /srv");

		SshEndpoint simple;
		simple.host = "simple.example.org";
		plain = build_ssh_base_args(ResolvedEndpoint{simple, {}});
	}

	void assert_validity() override {
		assert(command.front() == "ssh");
		assert(contains(command, "ConnectTimeout=7"));
		assert(contains(command, "BatchMode=yes"));
		assert(contains(command, "StrictHostKeyChecking=no"));
		assert(contains(command, "ServerAliveInterval=30"));
		assert(command[position(command, "-p") + 1] == "2222");
		assert(command[position(command, "-i") + 1] == "/home/me/.ssh/id_backup");
		assert(command[position(command, "-J") + 1] == "jump@bastion.example.org,relay.example.org:2200");
		assert(command[command.size() - 2] == "backup@nas.example.org");
		assert(command.back() == "ls -1 /srv");

		assert(plain == (Command{"ssh", "-o", "ConnectTimeout=10", "-o", "BatchMode=yes"}));
		assert(build_ssh_transport_option(ResolvedEndpoint{SshEndpoint{}, {}}) == "ssh -o ConnectTimeout=10 -o BatchMode=yes");
	}
};

/** The five transfer topologies, with filters, options and snapshot sources. */
class RsyncTopologyTest final : public PureTest {
	Configuration configuration;
	ResolvedEndpoints endpoints;

	TransferCommand build(const std::string &slug, const ProgressMode progress = ProgressMode::none) const {
		const SyncConfig &sync = *configuration.find_sync(slug);
		TransferRequest request{
			std::get<Location>(locate_transfer_source(configuration, endpoints, sync)),
			std::get<Location>(locate(configuration, endpoints, sync.destination)),
		};
		request.progress = progress;
		return build_rsync_command(sync, request);
	}

	public:
	void perform() override {
		configuration = configuration_from({
			{"ssh-endpoints", {
				{"nas", {{"host", "nas.lan"}, {"user", "backup"}}},
				{"nas-again", {{"host", "nas.lan"}, {"user", "backup"}}},
				{"cloud", {{"host", "cloud.example.org"}, {"port", 2222}}},
			}},
			{"volumes", {
				{"laptop", {{"type", "local"}, {"path", "/home/me"}}},
				{"usb", {{"type", "local"}, {"path", "/mnt/usb"}}},
				{"nas-a", {{"type", "remote"}, {"ssh-endpoint", "nas"}, {"path", "/srv/a"}}},
				{"nas-b", {{"type", "remote"}, {"ssh-endpoint", "nas-again"}, {"path", "/srv/b"}}},
				{"cloud", {{"type", "remote"}, {"ssh-endpoint", "cloud"}, {"path", "/data"}}},
			}},
			{"syncs", {
				{"local-copy", {
					{"source", {{"volume", "laptop"}, {"subdir", "docs"}}},
					{"destination", {{"volume", "usb"}, {"hard-link-snapshots", {{"enabled", true}}}}},
					{"rsync-options", {{"checksum", true}, {"compress", true}, {"extra-options", {"--bwlimit=500"}}}},
					{"filters", json::array({"- *.tmp", {{"include", "keep/**"}}})},
					{"filter-file", "/home/me/.nbkp-filter"},
				}},
				{"push", {{"source", {{"volume", "laptop"}}}, {"destination", {{"volume", "nas-a"}}}}},
				{"pull", {{"source", {{"volume", "cloud"}}}, {"destination", {{"volume", "laptop"}, {"subdir", "cloud"}}}}},
				{"on-nas", {{"source", {{"volume", "nas-a"}}}, {"destination", {{"volume", "nas-b"}}}}},
				{"nas-to-cloud", {{"source", {{"volume", "nas-b"}}}, {"destination", {{"volume", "cloud"}, {"subdir", "nas"}}}}},
				{"usb-to-cloud", {
					{"source", {{"volume", "usb"}}},
					{"destination", {{"volume", "cloud"}, {"subdir", "usb"}}},
					{"rsync-options", {{"default-options-override", {"-rt"}}}},
				}},
			}},
		});
		FakeHostResolver hosts;
		hosts.hosts = {{"nas.lan", {"192.168.1.10"}}, {"cloud.example.org", {"203.0.113.7"}}};
		endpoints = EndpointResolver(configuration, hosts, {}).resolve_all();
	}

	void assert_validity() override {
		const TransferCommand local = build("local-copy", ProgressMode::overall);
		const Command &rsync = local.rsync;
		assert(!local.channel.has_value());
		assert(local.argv() == rsync);
		assert(rsync.front() == "rsync");
		assert(std::equal(DEFAULT_RSYNC_OPTIONS.begin(), DEFAULT_RSYNC_OPTIONS.end(), rsync.begin() + 1));
		assert(position(rsync, "--checksum") < position(rsync, "--compress"));
		assert(position(rsync, "--compress") < position(rsync, "--bwlimit=500"));
		assert(position(rsync, "--bwlimit=500") < position(rsync, "--info=progress2"));
		assert(position(rsync, "--info=progress2") < position(rsync, "--filter=- *.tmp"));
		assert(position(rsync, "--filter=- *.tmp") < position(rsync, "--filter=+ keep/**"));
		assert(position(rsync, "--filter=+ keep/**") < position(rsync, "--filter=merge /home/me/.nbkp-filter"));
		assert(!contains(rsync, "-e"));
		assert(rsync[rsync.size() - 2] == "/home/me/docs/");
		assert(rsync.back() == "/mnt/usb/");
		assert(classify_topology(
			std::get<Location>(locate(configuration, endpoints, configuration.find_sync("local-copy")->source)),
			std::get<Location>(locate(configuration, endpoints, configuration.find_sync("local-copy")->destination))
		) == Topology::local_to_local);

		const TransferCommand push = build("push");
		assert(!push.channel.has_value());
		assert(push.rsync[position(push.rsync, "-e") + 1] == "ssh -o ConnectTimeout=10 -o BatchMode=yes");
		assert(push.rsync[push.rsync.size() - 2] == "/home/me/");
		assert(push.rsync.back() == "backup@nas.lan:/srv/a/");

		const TransferCommand pull = build("pull");
		assert(!pull.channel.has_value());
		assert(pull.rsync[position(pull.rsync, "-e") + 1] == "ssh -o ConnectTimeout=10 -o BatchMode=yes -p 2222");
		assert(pull.rsync[pull.rsync.size() - 2] == "cloud.example.org:/data/");
		assert(pull.rsync.back() == "/home/me/cloud/");

		// same host, port and user: rsync runs on the server with plain paths
		const TransferCommand on_nas = build("on-nas");
		assert(on_nas.channel.has_value());
		assert(!contains(on_nas.rsync, "-e"));
		assert(on_nas.rsync[on_nas.rsync.size() - 2] == "/srv/a/");
		assert(on_nas.rsync.back() == "/srv/b/");
		const Command on_nas_argv = on_nas.argv();
		assert(on_nas_argv.front() == "ssh");
		assert(on_nas_argv[on_nas_argv.size() - 2] == "backup@nas.lan");
		assert(on_nas_argv.back() == shell_join(on_nas.rsync));

		// different servers: the source server pushes to the destination server
		const TransferCommand relay = build("nas-to-cloud");
		assert(relay.channel.has_value());
		assert(relay.channel->endpoint.slug == "nas-again");
		assert(relay.rsync[position(relay.rsync, "-e") + 1] == "ssh -o ConnectTimeout=10 -o BatchMode=yes -p 2222");
		assert(relay.rsync[relay.rsync.size() - 2] == "/srv/b/");
		assert(relay.rsync.back() == "cloud.example.org:/data/nas/");
		assert(relay.argv()[relay.argv().size() - 2] == "backup@nas.lan");

		// the source is another sync's snapshot destination: read its latest/
		const TransferCommand from_snapshots = build("usb-to-cloud");
		assert(from_snapshots.rsync[1] == "-rt");
		assert(!contains(from_snapshots.rsync, "--delete"));
		assert(from_snapshots.rsync[from_snapshots.rsync.size() - 2] == "/mnt/usb/latest/");
	}
};

class TransferTargetTest final : public PureTest {
	Command into_snapshot;

	public:
	void perform() override {
		SyncConfig sync;
		sync.slug = "docs-to-usb";
		TransferRequest request{LocalLocation{"/home/me/docs"}, LocalLocation{"/mnt/usb"}};
		request.destination_suffix = "snapshots/2026-03-01T08:00:00Z";
		request.link_dest = "../2026-02-28T08:00:00Z";
		into_snapshot = build_rsync_command(sync, request).argv();
	}

	void assert_validity() override {
		assert(contains(into_snapshot, "--link-dest=../2026-02-28T08:00:00Z"));
		assert(into_snapshot.back() == "/mnt/usb/snapshots/2026-03-01T08:00:00Z/");
		assert(parse_progress_mode("per-file") == ProgressMode::per_file);
		assert(!parse_progress_mode("loud").has_value());
	}
};

/** Streamed output reaches the sink while the command still runs; only its tail is kept. */
class ProcessStreamingTest final : public Test {
	fs::path root;
	ProcessResult handshake;
	std::string streamed;
	ProcessResult large;
	std::size_t large_streamed = 0;
	ProcessResult buffered;
	std::string buffered_streamed;

	public:
	ProcessStreamingTest() : root(scratch_directory("process-streaming")) {}

	void prepare() override {}

	void perform() override {
		SystemProcessRunner runner;

		// the command only finishes once the sink has seen its first line
		const fs::path answer = root / "answer";
		const std::string script = "echo ready; i=0; while [ ! -e " + shell_quote(answer.string()) + " ]; do "
			"i=$((i + 1)); [ \"$i\" -gt 100 ] && exit 1; sleep 0.05; done; echo done";
		handshake = runner.run_streaming({"sh", "-c", script}, [&](const std::string_view chunk) {
			streamed += chunk;
			if (streamed.find("ready") != std::string::npos && !fs::exists(answer))
				create_file(answer);
		});

		large = runner.run_streaming({"sh", "-c", "head -c 200000 /dev/zero | tr '\\0' x"},
			[&](const std::string_view chunk) { large_streamed += chunk.size(); });

		ScriptedProcessRunner scripted;
		buffered = scripted.run_streaming({"echo", "hello"},
			[&](const std::string_view chunk) { buffered_streamed += chunk; });
	}

	void assert_validity() override {
		assert(handshake.succeeded());
		assert(streamed == "ready\ndone\n");
		assert(handshake.output == streamed);

		assert(large.succeeded());
		assert(large_streamed == 200000);
		assert(large.output.size() == OUTPUT_TAIL_LIMIT);
		assert(large.output.back() == 'x');

		// runners that cannot stream hand over everything at exit
		assert(buffered.succeeded());
		assert(buffered_streamed == "hello\n");
	}

	void cleanup() override {
		remove_recursively(root);
	}
};

}

void run_transfer_tests() {
	ShellQuotingTest quoting;
	run_test("shell quoting for live commands and generated scripts", quoting);

	PrivateAddressTest addresses;
	run_test("private and public address classification", addresses);

	EndpointResolutionTest resolution;
	run_test("endpoint resolution by reachability, location and network", resolution);

	SshCommandTest ssh;
	run_test("ssh invocation with options, key, port and proxy chain", ssh);

	RsyncTopologyTest topologies;
	run_test("rsync commands for all five topologies", topologies);

	TransferTargetTest target;
	run_test("rsync into a snapshot directory with link-dest", target);

	ProcessStreamingTest streaming;
	run_test("streamed process output with a bounded tail", streaming);
}
