#include "snapshot_hard_link.hpp"

#include <variant>
#include <vector>

PrepareResult HardLinkStrategy::prepare(const SyncConfig &sync, SnapshotContext &context) {
	const std::string &destination = context.destination_path();

	const SnapshotListResult listed = list_snapshots(sync, context);
	if (const SyncError *error = std::get_if<SyncError>(&listed))
		return *error;
	const std::vector<SnapshotName> &snapshots = std::get<std::vector<SnapshotName>>(listed);
	const LatestResult read = read_latest(sync, context);
	if (const SyncError *error = std::get_if<SyncError>(&read))
		return *error;
	const std::optional<SnapshotName> &latest = std::get<std::optional<SnapshotName>>(read);

	TransferTarget target;
	for (const SnapshotName &orphan : orphaned_snapshots(snapshots, latest)) {
		const std::string path = snapshot_path(destination, orphan.str());
		const ProcessResult result = context.execute(remove_tree_command(path));
		if (!result.succeeded())
			return SyncError{SyncErrorKind::snapshot, sync.slug, path,
				"cannot remove orphaned snapshot: " + failure_detail(result)};
		target.removed_orphans.push_back(orphan.str());
	}

	const SnapshotName name = next_snapshot_name(snapshots, context.get_now());
	const std::string path = snapshot_path(destination, name.str());
	const ProcessResult created = context.execute(make_directory_command(path));
	if (!created.succeeded())
		return SyncError{SyncErrorKind::snapshot, sync.slug, path,
			"cannot create snapshot directory: " + failure_detail(created)};

	target.destination_suffix = std::string(SNAPSHOTS_DIRECTORY) + "/" + name.str();
	target.snapshot = name;
	// relative to the new snapshot directory
	if (latest.has_value())
		target.link_dest = "../" + latest->str();
	return target;
}

PublishResult HardLinkStrategy::publish(
	const SyncConfig &sync,
	SnapshotContext &context,
	const TransferTarget &target,
	const ProcessResult &transfer
) {
	// a failed transfer leaves an orphan for the next sweep
	if (!transfer.succeeded() || !target.snapshot.has_value())
		return std::optional<SnapshotName>{};

	for (const Command &command : repoint_latest_commands(context.destination_path(), target.snapshot->str())) {
		const ProcessResult result = context.execute(command);
		if (!result.succeeded())
			return SyncError{SyncErrorKind::snapshot, sync.slug, latest_path(context.destination_path()),
				"cannot repoint latest: " + failure_detail(result)};
	}
	return target.snapshot;
}

PruneReport HardLinkStrategy::prune(
	const SyncConfig &sync,
	SnapshotContext &context,
	const std::optional<SnapshotName> &just_created
) {
	PruneReport report;
	if (!sync.snapshots.max_snapshots.has_value()) return report;

	const SnapshotListResult listed = list_snapshots(sync, context);
	if (const SyncError *error = std::get_if<SyncError>(&listed)) {
		report.warnings.push_back(SyncError{SyncErrorKind::prune, error->sync, error->subject, error->detail});
		return report;
	}

	std::vector<SnapshotName> snapshots = std::get<std::vector<SnapshotName>>(listed);
	const LatestResult read = read_latest(sync, context);
	if (const SyncError *error = std::get_if<SyncError>(&read)) {
		report.warnings.push_back(SyncError{SyncErrorKind::prune, error->sync, error->subject, error->detail});
		return report;
	}
	std::optional<SnapshotName> latest = std::get<std::optional<SnapshotName>>(read);
	if (context.is_dry_run() && just_created.has_value()) {
		// nothing was swept or published: prune the state a real run leaves behind
		for (const SnapshotName &orphan : orphaned_snapshots(snapshots, latest))
			std::erase(snapshots, orphan);
		snapshots.push_back(*just_created);
		latest = just_created;
	}

	std::vector<SnapshotName> protected_names;
	if (latest.has_value())
		protected_names.push_back(*latest);
	if (just_created.has_value())
		protected_names.push_back(*just_created);

	for (const SnapshotName &name : snapshots_to_prune(snapshots, *sync.snapshots.max_snapshots, protected_names)) {
		const std::string path = snapshot_path(context.destination_path(), name.str());
		const ProcessResult result = context.execute(remove_tree_command(path));
		if (result.succeeded())
			report.removed.push_back(name.str());
		else
			report.warnings.push_back(SyncError{SyncErrorKind::prune, sync.slug, path, failure_detail(result)});
	}
	return report;
}
