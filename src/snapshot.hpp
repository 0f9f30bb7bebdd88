#ifndef NBKP_SNAPSHOT_HPP
#define NBKP_SNAPSHOT_HPP

#include <chrono>
#include <compare>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "configuration/configuration.hpp"
#include "errors.hpp"
#include "location.hpp"
#include "process.hpp"
#include "shell.hpp"

constexpr char SNAPSHOTS_DIRECTORY[] = "snapshots";
constexpr char LATEST_NAME[] = "latest";
constexpr char LATEST_TEMPORARY_NAME[] = ".nbkp-latest.tmp";

/** A snapshot directory name: a UTC timestamp with seconds precision,
 * plus a `.N` suffix for snapshots created within the same second.
 * Names order chronologically, then by sequence. */
struct SnapshotName {
	// YYYY-MM-DDTHH:MM:SSZ
	std::string timestamp;
	unsigned sequence = 0;

	std::strong_ordering operator<=>(const SnapshotName &) const = default;
	bool operator==(const SnapshotName &) const = default;

	std::string str() const;

	/** Parses a directory name. Foreign entries give no value. */
	static std::optional<SnapshotName> parse(const std::string &text);
};

std::string format_snapshot_timestamp(std::chrono::system_clock::time_point time);

/** The name for a snapshot created at `now`, after every name in `existing`
 * sharing the same second. */
SnapshotName next_snapshot_name(
	const std::vector<SnapshotName> &existing,
	std::chrono::system_clock::time_point now
);

// COMMAND PLANS: pure, shared by the orchestrator and the script renderer.

std::string snapshots_path(const std::string &destination);
std::string snapshot_path(const std::string &destination, const std::string &name);
std::string latest_path(const std::string &destination);

Command list_snapshots_command(const std::string &destination);
Command read_latest_command(const std::string &destination);
Command make_directory_command(const std::string &path);
Command remove_tree_command(const std::string &path);
Command btrfs_snapshot_command(const std::string &destination, const std::string &name);
Command btrfs_writable_command(const std::string &path);
Command btrfs_delete_command(const std::string &path);

/** Two commands: a temporary symlink to `snapshots/<name>`, then its rename
 * over `latest`. The rename is the single atomic publication step. */
std::vector<Command> repoint_latest_commands(const std::string &destination, const std::string &name);

/** Parses the output of `ls -1 snapshots`, oldest first. */
std::vector<SnapshotName> parse_snapshot_listing(const std::string &output);

/** Extracts the snapshot name from the `readlink latest` output. */
std::optional<SnapshotName> parse_latest_target(const std::string &output);

/** Snapshots after the one `latest` references: the leftovers of transfers
 * that never got published. None without a `latest`. */
std::vector<SnapshotName> orphaned_snapshots(
	const std::vector<SnapshotName> &snapshots,
	const std::optional<SnapshotName> &latest
);

/** The oldest snapshots beyond `max_snapshots`, never one of the `protected_names`. */
std::vector<SnapshotName> snapshots_to_prune(
	const std::vector<SnapshotName> &snapshots,
	int max_snapshots,
	const std::vector<SnapshotName> &protected_names
);

/** Where snapshot commands run, and whether they really run.
 * In dry-run mode, mutating commands are only recorded in `planned`;
 * read-only queries always run. */
class SnapshotContext {
	ProcessRunner &runner;
	Location destination;
	bool dry_run;
	bool verbose;
	std::chrono::system_clock::time_point now;
	std::vector<std::string> planned;

	public:
	SnapshotContext(
		ProcessRunner &runner,
		Location destination,
		const bool dry_run,
		const bool verbose,
		const std::chrono::system_clock::time_point now
	) : runner(runner), destination(std::move(destination)), dry_run(dry_run), verbose(verbose), now(now) {}

	const Location &get_destination() const { return destination; }
	const std::string &destination_path() const { return location_path(destination); }
	bool is_dry_run() const { return dry_run; }
	std::chrono::system_clock::time_point get_now() const { return now; }

	/** Runs a command that changes the destination. */
	ProcessResult execute(const Command &command);

	/** Runs a read-only command. */
	ProcessResult query(const Command &command);

	/** Records a complete argument vector as planned without running it,
	 * e.g. the transfer in dry-run mode. */
	void plan(const Command &argv);

	const std::vector<std::string> &get_planned() const { return planned; }
};

/** What the transfer writes into, decided by `prepare`. */
struct TransferTarget {
	// relative to the destination path; empty for the destination itself
	std::optional<std::string> destination_suffix;
	std::optional<std::string> link_dest;
	std::optional<SnapshotName> snapshot;
	std::vector<std::string> removed_orphans;
};

using PrepareResult = std::variant<TransferTarget, SyncError>;
using PublishResult = std::variant<std::optional<SnapshotName>, SyncError>;

struct PruneReport {
	std::vector<std::string> removed;
	std::vector<SyncError> warnings;
};

/** The snapshot lifecycle wrapped around one transfer:
 * `prepare` before it, `publish` after it, `prune` last. */
class SnapshotStrategy {
	public:
	virtual SnapshotMode mode() const = 0;

	virtual PrepareResult prepare(const SyncConfig &sync, SnapshotContext &context) = 0;

	/** Publishes the snapshot if the transfer succeeded. A failed transfer
	 * publishes nothing and leaves the previous `latest` untouched. */
	virtual PublishResult publish(
		const SyncConfig &sync,
		SnapshotContext &context,
		const TransferTarget &target,
		const ProcessResult &transfer
	) = 0;

	/** Removes the oldest snapshots beyond the sync's `max-snapshots`.
	 * Every deletion failure is a warning; none aborts the prune. */
	virtual PruneReport prune(
		const SyncConfig &sync,
		SnapshotContext &context,
		const std::optional<SnapshotName> &just_created
	) = 0;

	virtual ~SnapshotStrategy() = default;
};

/** Transfers straight into the destination; no snapshots. */
class PlainStrategy final : public SnapshotStrategy {
	public:
	SnapshotMode mode() const override { return SnapshotMode::none; }
	PrepareResult prepare(const SyncConfig &sync, SnapshotContext &context) override;
	PublishResult publish(
		const SyncConfig &sync,
		SnapshotContext &context,
		const TransferTarget &target,
		const ProcessResult &transfer
	) override;
	PruneReport prune(
		const SyncConfig &sync,
		SnapshotContext &context,
		const std::optional<SnapshotName> &just_created
	) override;
};

std::unique_ptr<SnapshotStrategy> make_snapshot_strategy(SnapshotMode mode);

using SnapshotListResult = std::variant<std::vector<SnapshotName>, SyncError>;

/** Lists the snapshots of the destination, oldest first. A missing
 * `snapshots` directory is an empty list; an unreachable host is an error. */
SnapshotListResult list_snapshots(const SyncConfig &sync, SnapshotContext &context);

/** No value if `latest` does not exist or is not a symlink. */
using LatestResult = std::variant<std::optional<SnapshotName>, SyncError>;

/** Reads the snapshot `latest` links to. A link that cannot be read or
 * does not name a snapshot is an error, never an absent `latest`. */
LatestResult read_latest(const SyncConfig &sync, SnapshotContext &context);

/** The first line of a command's diagnostics, or its exit code. */
std::string failure_detail(const ProcessResult &result);

#endif // NBKP_SNAPSHOT_HPP
