#include "scriptgen.hpp"

#include <algorithm>
#include <sstream>

#include "availability.hpp"
#include "location.hpp"
#include "rsync_command.hpp"
#include "shell.hpp"
#include "snapshot.hpp"
#include "ssh.hpp"

namespace {

const char *SNAPSHOT_VARIABLE = "NBKP_SNAPSHOT";
const char *LATEST_VARIABLE = "NBKP_LATEST";
const char *ORPHAN_VARIABLE = "NBKP_ORPHAN";
const char *PRUNE_VARIABLE = "NBKP_PRUNE";

// return codes of the generated sync functions
constexpr int SCRIPT_SYNC_FAILED = 1;
constexpr int SCRIPT_SYNC_SKIPPED = 2;

const char *PRELUDE = R"(set -uo pipefail

NBKP_DRY_RUN=false
NBKP_VERBOSE=false
while [ $# -gt 0 ]; do
    case "$1" in
        -n|--dry-run) NBKP_DRY_RUN=true ;;
        -v|--verbose) NBKP_VERBOSE=true ;;
        -h|--help) echo "Usage: $0 [-n|--dry-run] [-v|--verbose]"; exit 0 ;;
        *) echo "Unknown option: $1" >&2; exit 1 ;;
    esac
    shift
done

nbkp_log() {
    echo "[nbkp] $*" >&2
}

# Runs a command that changes a volume; only logs it in dry-run mode.
nbkp_run() {
    if [ "$NBKP_DRY_RUN" = true ]; then
        nbkp_log "would run: $*"
        return 0
    fi
    if [ "$NBKP_VERBOSE" = true ]; then
        nbkp_log "running: $*"
    fi
    "$@"
}

NBKP_SNAPSHOT_PATTERN='^[0-9]{4}-[0-9]{2}-[0-9]{2}T[0-9]{2}:[0-9]{2}:[0-9]{2}Z(\.[1-9][0-9]{0,8})?$'

# Reads snapshot names on stdin and prints them oldest first.
nbkp_sort_snapshots() {
    grep -E "$NBKP_SNAPSHOT_PATTERN" | sort -t . -k1,1 -k2,2n
}

# Succeeds if $1 is a snapshot name.
nbkp_is_snapshot() {
    printf '%s\n' "$1" | grep -qE "$NBKP_SNAPSHOT_PATTERN"
}

# Succeeds if snapshot name $1 sorts after $2.
nbkp_newer() {
    local a_seq=0 b_seq=0
    case "$1" in *.*) a_seq="${1#*.}" ;; esac
    case "$2" in *.*) b_seq="${2#*.}" ;; esac
    if [[ "${1%%.*}" > "${2%%.*}" ]]; then return 0; fi
    if [[ "${1%%.*}" < "${2%%.*}" ]]; then return 1; fi
    [ "$a_seq" -gt "$b_seq" ]
}

# Prints the name for a new snapshot, after every listed one of the same second.
nbkp_next_name() {
    local ts name next=0
    ts=$(date -u +%Y-%m-%dT%H:%M:%SZ)
    while IFS= read -r name; do
        if [ "$name" = "$ts" ]; then
            [ "$next" -lt 1 ] && next=1
        elif [ "${name%%.*}" = "$ts" ] && [ "${name#*.}" -ge "$next" ]; then
            next=$(( ${name#*.} + 1 ))
        fi
    done <<< "$1"
    if [ "$next" -eq 0 ]; then echo "$ts"; else echo "$ts.$next"; fi
}

# Prints the listed snapshots not newer than $2 (all if $2 is empty).
nbkp_published() {
    local name
    for name in $1; do
        if [ -z "$2" ] || ! nbkp_newer "$name" "$2"; then
            echo "$name"
        fi
    done
}

# Counts the listed snapshots, plus $2 if it is not listed yet (dry-run mode).
nbkp_count() {
    local count
    count=$(printf '%s\n' "$1" | grep -c .)
    if [ -n "$2" ] && ! printf '%s\n' "$1" | grep -qxF -- "$2"; then
        count=$((count + 1))
    fi
    echo "$count"
}
)";

const char *EPILOGUE = R"(NBKP_FAILED=0

nbkp_call() {
    "$1"
    case $? in
        0) nbkp_log "$2: done" ;;
        2) nbkp_log "WARNING: $2 skipped" ;;
        *) nbkp_log "ERROR: $2 failed"; NBKP_FAILED=1 ;;
    esac
}
)";

/** Accumulates indented script lines; commented mode prefixes every line with `# `. */
class ScriptWriter {
	std::ostringstream text;
	std::size_t depth = 0;
	bool commented = false;

	public:
	void line(const std::string &content = "") {
		if (commented) text << "# ";
		if (!content.empty()) text << std::string(depth * 4, ' ') << content;
		text << '\n';
	}
	void open(const std::string &content) {
		line(content);
		++depth;
	}
	void close(const std::string &content) {
		--depth;
		line(content);
	}
	/** A line at the enclosing depth inside a block, such as `else`. */
	void middle(const std::string &content) {
		--depth;
		line(content);
		++depth;
	}
	void set_commented(const bool value) { commented = value; }
	std::string str() const { return text.str(); }
};

/** The command as script text, wrapped in ssh for remote locations. */
std::string located(const Location &location, const Command &command) {
	return script_join(command_at(location, command, script_join));
}

std::string quoted_variable(const char *name) {
	return "\"$" + std::string(name) + "\"";
}

std::string skip_line(const std::string &slug, const std::string &reason) {
	return "{ nbkp_log \"SKIP " + slug + ": " + reason + "\"; return " + std::to_string(SCRIPT_SYNC_SKIPPED) + "; }";
}

std::string fail_line(const std::string &slug, const std::string &reason) {
	return "{ nbkp_log \"ERROR: " + slug + ": " + reason + "\"; return " + std::to_string(SCRIPT_SYNC_FAILED) + "; }";
}

std::string sync_endpoint_display(const SyncEndpoint &endpoint) {
	if (endpoint.subdir.has_value()) return endpoint.volume + ":/" + *endpoint.subdir;
	return endpoint.volume;
}

void write_volume_checks(
	ScriptWriter &out,
	const std::string &sync,
	const std::string &volume,
	const Location &root
) {
	const std::string &path = location_path(root);
	out.line(located(root, {"test", "-d", path}) + " 2>/dev/null || "
		+ skip_line(sync, "volume " + volume + ": " + to_string(VolumeReason::path_not_found)));
	out.line(located(root, {"test", "-e", path + "/" + VOLUME_MARKER}) + " 2>/dev/null || "
		+ skip_line(sync, "volume " + volume + ": " + to_string(VolumeReason::marker_not_found)));
}

void write_probe(
	ScriptWriter &out,
	const std::string &sync,
	const Location &location,
	const char *flag,
	const std::string &path,
	const SyncReason reason
) {
	out.line(located(location, {"test", flag, path}) + " 2>/dev/null || " + skip_line(sync, to_string(reason)));
}

void write_listing(ScriptWriter &out, const Location &destination) {
	out.line("listing=$(" + located(destination, list_snapshots_command(location_path(destination)))
		+ " 2>/dev/null | nbkp_sort_snapshots)");
}

/** Sets NBKP_LATEST to the snapshot `latest` names, or to nothing if there is
 * no `latest`. An unreadable link runs `on_failure`. */
void write_read_latest(ScriptWriter &out, const Location &destination, const std::string &on_failure) {
	const std::string variable = LATEST_VARIABLE;
	const std::string path = latest_path(location_path(destination));
	if (is_remote(destination)) {
		out.line(variable + "=$(" + located(destination, read_latest_command(location_path(destination)))
			+ " 2>/dev/null)");
		// readlink exits 1 when there is no symlink
		out.line("case $? in 0|1) ;; *) " + on_failure + " ;; esac");
	} else {
		out.line(variable + "=");
		out.open("if [ -L " + shell_quote(path) + " ]; then");
		out.line(variable + "=$(" + located(destination, read_latest_command(location_path(destination)))
			+ " 2>/dev/null) || " + on_failure);
		out.close("fi");
	}
	out.line(variable + "=\"${" + variable + "%/}\"");
	out.line(variable + "=\"${" + variable + "##*/}\"");
	out.line("[ -z " + quoted_variable(LATEST_VARIABLE) + " ] || nbkp_is_snapshot " + quoted_variable(LATEST_VARIABLE)
		+ " || " + on_failure);
}

void write_transfer(ScriptWriter &out, const SyncConfig &sync, const TransferRequest &request) {
	const Command argv = build_rsync_command(sync, request).argv(script_join);
	out.line("nbkp_run " + script_join(argv) + " || " + fail_line(sync.slug, "rsync failed"));
}

void write_prune(ScriptWriter &out, const SyncConfig &sync, const Location &destination) {
	if (!sync.snapshots.max_snapshots.has_value()) return;

	const std::string &path = location_path(destination);
	const std::string victim = snapshot_path(path, script_variable(PRUNE_VARIABLE));
	const bool hard_link = sync.snapshots.mode == SnapshotMode::hard_link;

	out.line("# keep at most " + std::to_string(*sync.snapshots.max_snapshots) + " snapshots");
	write_listing(out, destination);
	if (hard_link) {
		write_read_latest(out, destination, "{ nbkp_log \"WARNING: " + sync.slug
			+ ": cannot read latest, not pruning\"; return 0; }");
		out.open("if [ \"$NBKP_DRY_RUN\" = true ]; then");
		out.line("# nothing was swept or published: prune the state a real run leaves behind");
		out.line("listing=$(nbkp_published \"$listing\" " + quoted_variable(LATEST_VARIABLE) + ")");
		out.line(std::string(LATEST_VARIABLE) + "=" + quoted_variable(SNAPSHOT_VARIABLE));
		out.close("fi");
	}
	out.line("count=$(nbkp_count \"$listing\" " + quoted_variable(SNAPSHOT_VARIABLE) + ")");
	out.line("excess=$((count - " + std::to_string(*sync.snapshots.max_snapshots) + "))");
	out.open("for " + std::string(PRUNE_VARIABLE) + " in $listing; do");
	out.line("[ \"$excess\" -gt 0 ] || break");
	out.line("[ " + quoted_variable(PRUNE_VARIABLE) + " = " + quoted_variable(SNAPSHOT_VARIABLE) + " ] && continue");
	if (hard_link) {
		out.line("[ " + quoted_variable(PRUNE_VARIABLE) + " = " + quoted_variable(LATEST_VARIABLE) + " ] && continue");
		out.line("nbkp_run " + located(destination, remove_tree_command(victim))
			+ " || nbkp_log \"WARNING: " + sync.slug + ": cannot prune snapshot $" + PRUNE_VARIABLE + "\"");
	} else {
		out.line("{ nbkp_run " + located(destination, btrfs_writable_command(victim))
			+ " && nbkp_run " + located(destination, btrfs_delete_command(victim)) + "; }"
			+ " || nbkp_log \"WARNING: " + sync.slug + ": cannot prune snapshot $" + PRUNE_VARIABLE + "\"");
	}
	out.line("excess=$((excess - 1))");
	out.close("done");
}

void write_sync_function(
	ScriptWriter &out,
	const Configuration &configuration,
	const ResolvedEndpoints &endpoints,
	const SyncConfig &sync
) {
	out.line("# " + sync.slug + ": " + sync_endpoint_display(sync.source) + " -> "
		+ sync_endpoint_display(sync.destination) + " (snapshots: " + to_string(sync.snapshots.mode) + ")");
	out.open(sync_function_name(sync.slug) + "() {");
	out.line("local listing count excess " + std::string(SNAPSHOT_VARIABLE) + "=\"\" " + LATEST_VARIABLE + "=\"\" "
		+ ORPHAN_VARIABLE + " " + PRUNE_VARIABLE);

	const LocateResult source_root = locate_volume(configuration, endpoints, sync.source.volume);
	const LocateResult destination_root = locate_volume(configuration, endpoints, sync.destination.volume);
	const LocateResult transfer_source = locate_transfer_source(configuration, endpoints, sync);
	const LocateResult destination_side = locate(configuration, endpoints, sync.destination);

	for (const LocateResult *located_side : {&source_root, &destination_root}) {
		if (const NoReachableEndpoint *failure = std::get_if<NoReachableEndpoint>(located_side)) {
			out.line(skip_line(sync.slug, describe(*failure)));
			out.close("}");
			return;
		}
	}

	out.line("# checks");
	write_volume_checks(out, sync.slug, sync.source.volume, std::get<Location>(source_root));
	write_volume_checks(out, sync.slug, sync.destination.volume, std::get<Location>(destination_root));

	const Location source = std::get<Location>(locate(configuration, endpoints, sync.source));
	const Location destination = std::get<Location>(destination_side);
	const std::string &destination_path = location_path(destination);
	write_probe(out, sync.slug, source, "-e", location_path(source) + "/" + SOURCE_MARKER,
		SyncReason::source_marker_not_found);
	write_probe(out, sync.slug, destination, "-e", destination_path + "/" + DESTINATION_MARKER,
		SyncReason::destination_marker_not_found);
	if (sync.snapshots.mode == SnapshotMode::btrfs) {
		write_probe(out, sync.slug, destination, "-d", latest_path(destination_path),
			SyncReason::destination_latest_not_found);
		write_probe(out, sync.slug, destination, "-d", snapshots_path(destination_path),
			SyncReason::destination_snapshots_not_found);
	}

	TransferRequest request{std::get<Location>(transfer_source), destination};
	const std::string new_snapshot = snapshot_path(destination_path, script_variable(SNAPSHOT_VARIABLE));

	switch (sync.snapshots.mode) {
		case SnapshotMode::none:
			out.line("# transfer");
			write_transfer(out, sync, request);
			break;

		case SnapshotMode::btrfs:
			out.line("# transfer into latest/, then snapshot it");
			request.destination_suffix = LATEST_NAME;
			write_transfer(out, sync, request);
			write_listing(out, destination);
			out.line(std::string(SNAPSHOT_VARIABLE) + "=$(nbkp_next_name \"$listing\")");
			out.line("nbkp_run " + located(destination, btrfs_snapshot_command(destination_path, script_variable(SNAPSHOT_VARIABLE)))
				+ " || " + fail_line(sync.slug, "btrfs snapshot failed"));
			break;

		case SnapshotMode::hard_link: {
			out.line("# remove snapshots that were never published");
			write_listing(out, destination);
			write_read_latest(out, destination, fail_line(sync.slug, "cannot read latest"));
			out.open("for " + std::string(ORPHAN_VARIABLE) + " in $listing; do");
			out.open("if [ -n " + quoted_variable(LATEST_VARIABLE) + " ] && nbkp_newer "
				+ quoted_variable(ORPHAN_VARIABLE) + " " + quoted_variable(LATEST_VARIABLE) + "; then");
			out.line("nbkp_run " + located(destination, remove_tree_command(snapshot_path(destination_path, script_variable(ORPHAN_VARIABLE))))
				+ " || " + fail_line(sync.slug, "cannot remove orphaned snapshot"));
			out.close("fi");
			out.close("done");

			out.line("# transfer into a new snapshot, hard-linking unchanged files");
			out.line(std::string(SNAPSHOT_VARIABLE) + "=$(nbkp_next_name \"$listing\")");
			out.line("nbkp_run " + located(destination, make_directory_command(new_snapshot))
				+ " || " + fail_line(sync.slug, "cannot create snapshot directory"));
			request.destination_suffix = std::string(SNAPSHOTS_DIRECTORY) + "/" + script_variable(SNAPSHOT_VARIABLE);
			out.open("if [ -n " + quoted_variable(LATEST_VARIABLE) + " ]; then");
			TransferRequest linked = request;
			linked.link_dest = "../" + script_variable(LATEST_VARIABLE);
			write_transfer(out, sync, linked);
			out.middle("else");
			write_transfer(out, sync, request);
			out.close("fi");

			out.line("# publish atomically");
			for (const Command &command : repoint_latest_commands(destination_path, script_variable(SNAPSHOT_VARIABLE)))
				out.line("nbkp_run " + located(destination, command) + " || " + fail_line(sync.slug, "cannot repoint latest"));
			break;
		}
	}

	write_prune(out, sync, destination);
	out.line("return 0");
	out.close("}");
}

}

std::string sync_function_name(const std::string &slug) {
	std::string name = "nbkp_sync_" + slug;
	for (char &c : name) {
		if (c == '-') c = '_';
	}
	return name;
}

std::string generate_script(
	const Configuration &configuration,
	const ResolvedEndpoints &endpoints,
	const std::chrono::system_clock::time_point now,
	const ScriptOptions &options
) {
	std::ostringstream header;
	header << "#!/usr/bin/env bash\n"
		<< "# Generated by nbkp " << PROGRAM_VERSION << " at " << format_snapshot_timestamp(now) << ".\n";
	if (options.config_path.has_value())
		header << "# Configuration: " << *options.config_path << "\n";
	header << "# Usage: $0 [-n|--dry-run] [-v|--verbose]\n\n";

	std::vector<std::string> selected;
	for (const std::string &slug : configuration.execution_order) {
		const auto &only = options.only_syncs;
		if (only.empty() || std::find(only.begin(), only.end(), slug) != only.end())
			selected.push_back(slug);
	}

	ScriptWriter functions;
	for (const std::string &slug : selected) {
		const SyncConfig &sync = *configuration.find_sync(slug);
		functions.set_commented(!sync.enabled);
		if (!sync.enabled) functions.line("disabled");
		write_sync_function(functions, configuration, endpoints, sync);
		functions.set_commented(false);
		functions.line();
	}

	ScriptWriter calls;
	for (const std::string &slug : selected) {
		const SyncConfig &sync = *configuration.find_sync(slug);
		const std::string call = "nbkp_call " + sync_function_name(slug) + " " + slug;
		calls.line(sync.enabled ? call : "# " + call + "  # disabled");
	}
	calls.line();
	calls.line("exit \"$NBKP_FAILED\"");

	return header.str() + PRELUDE + "\n" + functions.str() + EPILOGUE + "\n" + calls.str();
}
