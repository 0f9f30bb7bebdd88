#include "rsync_command.hpp"

const std::vector<std::string> DEFAULT_RSYNC_OPTIONS = {
	"-a",
	"--delete",
	"--delete-excluded",
	"--partial-dir=.rsync-partial",
	"--safe-links",
	"--filter=P .nbkp-*",
	"--exclude=.nbkp-*",
};

const char *to_string(const ProgressMode mode) {
	switch (mode) {
		case ProgressMode::none: return "none";
		case ProgressMode::overall: return "overall";
		case ProgressMode::per_file: return "per-file";
		case ProgressMode::full: return "full";
	}
	return "none";
}

std::optional<ProgressMode> parse_progress_mode(const std::string &text) {
	for (const ProgressMode mode : {ProgressMode::none, ProgressMode::overall, ProgressMode::per_file, ProgressMode::full}) {
		if (text == to_string(mode)) return mode;
	}
	return std::nullopt;
}

const char *to_string(const Topology topology) {
	switch (topology) {
		case Topology::local_to_local: return "local-to-local";
		case Topology::local_to_remote: return "local-to-remote";
		case Topology::remote_to_local: return "remote-to-local";
		case Topology::remote_same_endpoint: return "remote-same-endpoint";
		case Topology::remote_to_remote: return "remote-to-remote";
	}
	return "unknown";
}

Topology classify_topology(const Location &source, const Location &destination) {
	const RemoteLocation *remote_source = std::get_if<RemoteLocation>(&source);
	const RemoteLocation *remote_destination = std::get_if<RemoteLocation>(&destination);

	if (remote_source == nullptr)
		return remote_destination == nullptr ? Topology::local_to_local : Topology::local_to_remote;
	if (remote_destination == nullptr)
		return Topology::remote_to_local;
	if (remote_source->endpoint.same_channel_as(remote_destination->endpoint))
		return Topology::remote_same_endpoint;
	return Topology::remote_to_remote;
}

namespace {

void append(Command &command, const std::vector<std::string> &arguments) {
	command.insert(command.end(), arguments.begin(), arguments.end());
}

Command base_rsync_args(const SyncConfig &sync, const TransferRequest &request) {
	const RsyncOptions &options = sync.rsync_options;

	Command args = {"rsync"};
	append(args, options.default_options_override.value_or(DEFAULT_RSYNC_OPTIONS));
	if (options.checksum) args.push_back("--checksum");
	if (options.compress) args.push_back("--compress");
	append(args, options.extra_options);

	switch (request.progress) {
		case ProgressMode::overall:
			append(args, {"--info=progress2", "--stats", "--human-readable"});
			break;
		case ProgressMode::per_file:
			append(args, {"-v", "--progress", "--human-readable"});
			break;
		case ProgressMode::full:
			append(args, {"-v", "--progress", "--info=progress2", "--stats", "--human-readable"});
			break;
		case ProgressMode::none:
			break;
	}

	if (request.link_dest.has_value())
		args.push_back("--link-dest=" + *request.link_dest);

	for (const std::string &rule : sync.filters)
		args.push_back("--filter=" + rule);
	if (sync.filter_file.has_value())
		args.push_back("--filter=merge " + *sync.filter_file);
	return args;
}

std::string destination_path(const TransferRequest &request) {
	const std::string &path = location_path(request.destination);
	if (request.destination_suffix.has_value())
		return path + "/" + *request.destination_suffix + "/";
	return path + "/";
}

}

TransferCommand build_rsync_command(const SyncConfig &sync, const TransferRequest &request) {
	TransferCommand result;
	result.rsync = base_rsync_args(sync, request);
	Command &rsync = result.rsync;

	const std::string source_path = location_path(request.source) + "/";
	const std::string target_path = destination_path(request);

	switch (classify_topology(request.source, request.destination)) {
		case Topology::local_to_local:
			append(rsync, {source_path, target_path});
			break;

		case Topology::local_to_remote: {
			const ResolvedEndpoint &destination = std::get<RemoteLocation>(request.destination).endpoint;
			append(rsync, {
				"-e", build_ssh_transport_option(destination),
				source_path,
				format_remote_path(destination.endpoint, target_path),
			});
			break;
		}

		case Topology::remote_to_local: {
			const ResolvedEndpoint &source = std::get<RemoteLocation>(request.source).endpoint;
			append(rsync, {
				"-e", build_ssh_transport_option(source),
				format_remote_path(source.endpoint, source_path),
				target_path,
			});
			break;
		}

		case Topology::remote_same_endpoint:
			append(rsync, {source_path, target_path});
			result.channel = std::get<RemoteLocation>(request.source).endpoint;
			break;

		case Topology::remote_to_remote: {
			// the source host pushes to the destination host
			const ResolvedEndpoint &destination = std::get<RemoteLocation>(request.destination).endpoint;
			append(rsync, {
				"-e", build_ssh_transport_option(destination),
				source_path,
				format_remote_path(destination.endpoint, target_path),
			});
			result.channel = std::get<RemoteLocation>(request.source).endpoint;
			break;
		}
	}
	return result;
}

Command TransferCommand::argv(const CommandJoiner joiner) const {
	if (!channel.has_value()) return rsync;
	return build_ssh_command(*channel, joiner(rsync));
}

LocateResult locate_transfer_source(
	const Configuration &configuration,
	const ResolvedEndpoints &endpoints,
	const SyncConfig &sync
) {
	LocateResult located = locate(configuration, endpoints, sync.source);
	if (const Location *location = std::get_if<Location>(&located)) {
		if (snapshot_mode_at(configuration, sync.source) != SnapshotMode::none)
			return with_subpath(*location, "latest");
	}
	return located;
}
