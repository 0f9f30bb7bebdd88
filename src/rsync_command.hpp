#ifndef NBKP_RSYNC_COMMAND_HPP
#define NBKP_RSYNC_COMMAND_HPP

#include <optional>
#include <string>
#include <vector>

#include "configuration/configuration.hpp"
#include "location.hpp"
#include "shell.hpp"
#include "ssh.hpp"

extern const std::vector<std::string> DEFAULT_RSYNC_OPTIONS;

enum class ProgressMode {
	none,
	overall,
	per_file,
	full,
};

const char *to_string(ProgressMode mode);
std::optional<ProgressMode> parse_progress_mode(const std::string &text);

enum class Topology {
	local_to_local,
	local_to_remote,
	remote_to_local,
	// both sides behind the same host, port and user
	remote_same_endpoint,
	remote_to_remote,
};

const char *to_string(Topology topology);

Topology classify_topology(const Location &source, const Location &destination);

struct TransferRequest {
	Location source;
	Location destination;
	// appended to the destination path, e.g. `latest` or `snapshots/<name>`
	std::optional<std::string> destination_suffix;
	std::optional<std::string> link_dest;
	ProgressMode progress = ProgressMode::none;
};

/** The rsync argument vector and, for transfers between two remote sides,
 * the endpoint whose shell runs it. */
struct TransferCommand {
	Command rsync;
	std::optional<ResolvedEndpoint> channel;

	/** The argument vector to execute. A channelled rsync is joined by
	 * `joiner` into the remote command line of ssh. */
	Command argv(CommandJoiner joiner = shell_join) const;
};

/** rsync options, filters, transport and the two trailing-slashed paths
 * for one of the topologies. Pure: nothing is executed. */
TransferCommand build_rsync_command(const SyncConfig &sync, const TransferRequest &request);

/** The location rsync reads from: the source side itself, or its `latest/`
 * when another sync keeps snapshots there. */
LocateResult locate_transfer_source(
	const Configuration &configuration,
	const ResolvedEndpoints &endpoints,
	const SyncConfig &sync
);

#endif // NBKP_RSYNC_COMMAND_HPP
