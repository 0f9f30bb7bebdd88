#include "test_support.hpp"

#undef NDEBUG
#include <algorithm>
#include <cassert>
#include <fstream>
#include <sstream>
#include <variant>

#include "../arguments.hpp"
#include "../availability.hpp"
#include "../commands.hpp"
#include "../constants.hpp"
#include "../endpoint_resolver.hpp"
#include "../orchestrator.hpp"
#include "../snapshot.hpp"
#include "../sync_selection.hpp"

namespace {

template<typename T>
bool contains(const std::vector<T> &items, const T &item) {
	return std::find(items.begin(), items.end(), item) != items.end();
}

/** A local `docs` volume, a local `usb` volume and a remote `nas` volume. */
class VolumeFixture : public Test {
	protected:
	fs::path root;
	fs::path docs;
	fs::path usb;
	fs::path nas;
	Configuration configuration;
	ResolvedEndpoints endpoints;
	ScriptedProcessRunner runner;
	FakeHostResolver hosts;

	explicit VolumeFixture(const std::string &name) : root(scratch_directory(name)) {
		docs = root / "docs";
		usb = root / "usb";
		nas = root / "nas";
		hosts.hosts["nas.lan"] = {"192.168.1.20"};
	}

	json volumes_json() const {
		return {
			{"docs", {{"type", "local"}, {"path", docs.string()}}},
			{"usb", {{"type", "local"}, {"path", usb.string()}}},
			{"nas", {{"type", "remote"}, {"ssh-endpoint", "nas-lan"}, {"path", "/srv/backup"}}},
		};
	}

	json document_with(const json &syncs) const {
		return {
			{"ssh-endpoints", {{"nas-lan", {{"host", "nas.lan"}, {"user", "backup"}}}}},
			{"volumes", volumes_json()},
			{"syncs", syncs},
		};
	}

	void load(const json &syncs) {
		configuration = configuration_from(document_with(syncs));
		endpoints = EndpointResolver(configuration, hosts, {}).resolve_all();
	}

	RunReport run_all(const RunOptions &options = {}) {
		AvailabilityChecker checker(configuration, endpoints, runner);
		SyncOrchestrator orchestrator(configuration, endpoints, runner, checker, options);
		return orchestrator.run();
	}

	public:
	void cleanup() override {
		remove_recursively(root);
	}
};

class AvailabilityGatingTest final : public VolumeFixture {
	RunReport report;
	CheckReport check;

	public:
	AvailabilityGatingTest() : VolumeFixture("availability-gating") {}

	void prepare() override {
		mark_volume(docs, true, false);
		// usb lacks its destination marker
		mark_volume(usb, false, false);
		create_file(docs / "notes.txt", "draft");
		load({
			{"docs-to-usb", {{"source", {{"volume", "docs"}}}, {"destination", {{"volume", "usb"}}}}},
			{"nas-to-usb", {{"source", {{"volume", "nas"}}}, {"destination", {{"volume", "usb"}}}}},
			{"docs-to-nas", {
				{"source", {{"volume", "docs"}}},
				{"destination", {{"volume", "nas"}}},
				{"enabled", false},
			}},
		});
		runner.unreachable_hosts.insert("backup@nas.lan");
	}

	void perform() override {
		AvailabilityChecker checker(configuration, endpoints, runner);
		check = check_all(checker, configuration, {});
		report = run_all();
	}

	void assert_validity() override {
		assert(!check.all_active());
		assert(check.syncs.size() == 3);
		for (const VolumeStatus &volume : check.volumes) {
			if (volume.slug == "nas")
				assert(volume.reasons == std::vector<VolumeReason>{VolumeReason::unreachable});
			else
				assert(volume.available());
		}

		assert(report.outcomes.size() == 3);
		for (const RunOutcome &outcome : report.outcomes) {
			assert(outcome.status == RunStatus::skipped);
			assert(!outcome.transfer.has_value());
			if (outcome.sync == "docs-to-usb")
				assert(outcome.skip_reasons == std::vector<SyncReason>{SyncReason::destination_marker_not_found});
			if (outcome.sync == "nas-to-usb") {
				assert(contains(outcome.skip_reasons, SyncReason::source_unavailable));
				assert(contains(outcome.skip_reasons, SyncReason::destination_marker_not_found));
			}
			if (outcome.sync == "docs-to-nas")
				assert(contains(outcome.skip_reasons, SyncReason::disabled));
		}
		// skipped syncs are not failures
		assert(report.exit_code() == EXIT_CODE_SUCCESS);
		assert(runner.count("rsync") == 0);
		assert(list_directory(usb) == (std::vector<std::string>{VOLUME_MARKER}));
	}
};

/** A hard-link backup to `usb` feeding a plain mirror of `usb` in `mirror`. */
class ChainedSyncTest final : public VolumeFixture {
	fs::path mirror;
	RunReport report;

	public:
	ChainedSyncTest() : VolumeFixture("chained-sync") {}

	void prepare() override {
		mirror = root / "mirror";
		mark_volume(docs, true, false);
		mark_volume(usb, true, true);
		mark_volume(mirror, false, true);
		create_file(docs / "notes.txt", "draft");
		create_file(docs / "photos" / "cat.jpg", "meow");

		json document = document_with({
			// declared first, but runs after the sync that fills usb
			{"usb-to-mirror", {{"source", {{"volume", "usb"}}}, {"destination", {{"volume", "mirror"}}}}},
			{"docs-to-usb", {
				{"source", {{"volume", "docs"}}},
				{"destination", {{"volume", "usb"}, {"hard-link-snapshots", {{"enabled", true}}}}},
			}},
		});
		document["volumes"]["mirror"] = {{"type", "local"}, {"path", mirror.string()}};
		configuration = configuration_from(document);
		endpoints = EndpointResolver(configuration, hosts, {}).resolve_all();
	}

	void perform() override {
		RunOptions options;
		options.clock = [] { return test_time(0); };
		report = run_all(options);
	}

	void assert_validity() override {
		assert(report.outcomes.size() == 2);
		assert(report.outcomes[0].sync == "docs-to-usb");
		assert(report.outcomes[1].sync == "usb-to-mirror");
		for (const RunOutcome &outcome : report.outcomes)
			assert(outcome.status == RunStatus::succeeded);

		const std::vector<Command> transfers = runner.of("rsync");
		assert(transfers.size() == 2);
		assert(transfers[1][transfers[1].size() - 2] == (usb / LATEST_NAME).string() + "/");

		// the mirror holds the snapshot contents, not the snapshot tree
		assert(file_content_equals(mirror / "notes.txt", "draft"));
		assert(file_content_equals(mirror / "photos" / "cat.jpg", "meow"));
		assert(!fs::exists(mirror / SNAPSHOTS_DIRECTORY));
		assert(report.exit_code() == EXIT_CODE_SUCCESS);
	}
};

class FailedTransferTest final : public VolumeFixture {
	RunReport report;

	public:
	FailedTransferTest() : VolumeFixture("failed-transfer") {}

	void prepare() override {
		mark_volume(docs, true, false);
		mark_volume(usb, false, true);
		load({{"docs-to-usb", {{"source", {{"volume", "docs"}}}, {"destination", {{"volume", "usb"}}}}}});
		runner.rsync_exit_code = 23;
	}

	void perform() override {
		report = run_all();
	}

	void assert_validity() override {
		const RunOutcome &outcome = report.outcomes.front();
		assert(outcome.status == RunStatus::failed);
		assert(outcome.error.has_value() && outcome.error->kind == SyncErrorKind::transfer);
		assert(outcome.transfer.has_value() && outcome.transfer->exit_code == 23);
		assert(report.exit_code() == EXIT_CODE_SYNC_FAILED);
	}
};

class ArgumentParsingTest final : public PureTest {
	public:
	void perform() override {}

	void assert_validity() override {
		const auto parsed = ProgramArguments::try_parse({
			"nbkp", "run", "--dry-run", "--sync", "docs-*", "-s", "nas-to-usb",
			"--private", "--output", "json", "--progress", "overall", "-c", "/etc/nbkp/test.json", "--no-prune",
		});
		assert(parsed.has_value());
		assert(parsed->get_mode() == ProgramMode::run);
		assert(parsed->is_dry_run());
		assert(!parsed->should_prune());
		assert(!parsed->is_verbose());
		assert(parsed->get_sync_patterns() == (std::vector<std::string>{"docs-*", "nas-to-usb"}));
		assert(parsed->get_endpoint_filter().network == NetworkPreference::private_network);
		assert(parsed->get_output_format() == OutputFormat::json);
		assert(parsed->get_progress() == ProgressMode::overall);
		assert(parsed->get_config_path() == "/etc/nbkp/test.json");

		const auto script = ProgramArguments::try_parse({"nbkp", "sh", "-o", "backup.sh", "--location", "home"});
		assert(script.has_value() && script->get_mode() == ProgramMode::script);
		assert(script->get_script_path() == "backup.sh");
		assert(script->get_endpoint_filter().location == "home");

		assert(ProgramArguments::try_parse({"nbkp", "--version"})->get_mode() == ProgramMode::version);
		assert(ProgramArguments::try_parse({"nbkp", "check", "--help"})->get_mode() == ProgramMode::help);

		assert(!ProgramArguments::try_parse({"nbkp"}).has_value());
		assert(!ProgramArguments::try_parse({"nbkp", "backup"}).has_value());
		assert(!ProgramArguments::try_parse({"nbkp", "run", "--fast"}).has_value());
		assert(!ProgramArguments::try_parse({"nbkp", "run", "--private", "--public"}).has_value());
		assert(!ProgramArguments::try_parse({"nbkp", "run", "--sync"}).has_value());
		assert(!ProgramArguments::try_parse({"nbkp", "check", "--output", "xml"}).has_value());
	}
};

class SyncSelectionTest final : public PureTest {
	Configuration configuration;

	public:
	void perform() override {
		configuration = configuration_from({
			{"volumes", {
				{"docs", {{"type", "local"}, {"path", "/home/me/docs"}}},
				{"usb", {{"type", "local"}, {"path", "/mnt/usb"}}},
				{"archive", {{"type", "local"}, {"path", "/mnt/archive"}}},
			}},
			{"syncs", {
				{"usb-to-archive", {{"source", {{"volume", "usb"}}}, {"destination", {{"volume", "archive"}}}}},
				{"docs-to-usb", {{"source", {{"volume", "docs"}}}, {"destination", {{"volume", "usb"}}}}},
				{"docs-to-archive", {{"source", {{"volume", "docs"}}}, {"destination", {{"volume", "archive"}, {"subdir", "docs"}}}}},
			}},
		});
	}

	void assert_validity() override {
		assert(slug_matches("docs-to-usb", "docs-to-usb"));
		assert(slug_matches("docs-*", "docs-to-usb"));
		assert(slug_matches("*-usb", "docs-to-usb"));
		assert(slug_matches("*", "docs-to-usb"));
		assert(slug_matches("docs-to-us?", "docs-to-usb"));
		assert(!slug_matches("docs-to-us?", "docs-to-us"));
		assert(!slug_matches("docs", "docs-to-usb"));
		assert(!slug_matches("*-nas", "docs-to-usb"));

		const SyncSelection all = select_syncs(configuration, {});
		assert(std::get<std::vector<std::string>>(all).empty());

		// execution order, each slug once
		const SyncSelection docs = select_syncs(configuration, {"*-archive", "docs-*"});
		assert(std::get<std::vector<std::string>>(docs)
			== (std::vector<std::string>{"docs-to-usb", "usb-to-archive", "docs-to-archive"}));

		const SyncSelection unmatched = select_syncs(configuration, {"docs-*", "phone-*"});
		assert(std::holds_alternative<UnmatchedPattern>(unmatched));
		assert(std::get<UnmatchedPattern>(unmatched).pattern == "phone-*");
	}
};

/** The commands end to end against a configuration file on disk. */
class CommandExecutionTest final : public VolumeFixture {
	fs::path config_path;
	std::ostringstream check_output;
	int check_code = -1;
	int run_code = -1;
	int prune_code = -1;
	int missing_code = -1;
	int unmatched_code = -1;

	int execute(const std::vector<std::string> &arguments, std::ostream &output) {
		const auto parsed = ProgramArguments::try_parse(arguments);
		assert(parsed.has_value());
		CommandEnvironment environment{runner, hosts, output, [] { return test_time(0); }};
		return execute_command(*parsed, environment);
	}

	public:
	CommandExecutionTest() : VolumeFixture("command-execution") {}

	void prepare() override {
		mark_volume(docs, true, false);
		mark_volume(usb, false, true);
		create_file(docs / "notes.txt", "draft");

		config_path = root / "config.json";
		std::ofstream file(config_path);
		file << document_with({
			{"docs-to-usb", {
				{"source", {{"volume", "docs"}}},
				{"destination", {{"volume", "usb"}, {"hard-link-snapshots", {{"enabled", true}, {"max-snapshots", 1}}}}},
			}},
		}).dump(2);
	}

	void perform() override {
		const std::string config = config_path.string();
		check_code = execute({"nbkp", "check", "-c", config, "--output", "json"}, check_output);

		std::ostringstream ignored;
		run_code = execute({"nbkp", "run", "-c", config}, ignored);
		prune_code = execute({"nbkp", "prune", "-c", config, "--output", "json"}, ignored);
		missing_code = execute({"nbkp", "check", "-c", (root / "missing.json").string()}, ignored);
		unmatched_code = execute({"nbkp", "run", "-c", config, "--sync", "phone-*"}, ignored);
	}

	void assert_validity() override {
		assert(check_code == EXIT_CODE_SUCCESS);
		const json report = json::parse(check_output.str());
		assert(report["syncs"].size() == 1);
		assert(report["syncs"][0]["slug"] == "docs-to-usb");
		assert(report["syncs"][0]["active"] == true);
		assert(report["syncs"][0]["snapshot-mode"] == "hard-link");

		assert(run_code == EXIT_CODE_SUCCESS);
		assert(file_content_equals(usb / LATEST_NAME / "notes.txt", "draft"));
		assert(prune_code == EXIT_CODE_SUCCESS);
		assert(list_directory(usb / SNAPSHOTS_DIRECTORY).size() == 1);

		assert(missing_code == EXIT_CODE_CONFIGURATION_ERROR);
		assert(unmatched_code == EXIT_CODE_INCORRECT_USAGE);
		// only the one run transferred anything
		assert(runner.count("rsync") == 1);
	}
};

}

void run_orchestrator_tests() {
	{
		AvailabilityGatingTest test;
		run_test("Unavailable volumes and missing markers skip syncs", test);
	}
	{
		ChainedSyncTest test;
		run_test("A sync reading a snapshot destination copies its latest snapshot", test);
	}
	{
		FailedTransferTest test;
		run_test("A failed transfer fails the sync and the run", test);
	}
	{
		ArgumentParsingTest test;
		run_test("Command line parsing", test);
	}
	{
		SyncSelectionTest test;
		run_test("Sync selection by wildcard patterns", test);
	}
	{
		CommandExecutionTest test;
		run_test("check, run and prune against a configuration file", test);
	}
}
