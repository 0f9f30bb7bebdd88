#include "snapshot_btrfs.hpp"

#include <algorithm>

PrepareResult BtrfsStrategy::prepare(const SyncConfig &, SnapshotContext &) {
	TransferTarget target;
	target.destination_suffix = LATEST_NAME;
	return target;
}

PublishResult BtrfsStrategy::publish(
	const SyncConfig &sync,
	SnapshotContext &context,
	const TransferTarget &,
	const ProcessResult &transfer
) {
	if (!transfer.succeeded())
		return std::optional<SnapshotName>{};

	const SnapshotListResult listed = list_snapshots(sync, context);
	if (const SyncError *error = std::get_if<SyncError>(&listed))
		return *error;

	const SnapshotName name = next_snapshot_name(std::get<std::vector<SnapshotName>>(listed), context.get_now());
	const ProcessResult result = context.execute(btrfs_snapshot_command(context.destination_path(), name.str()));
	if (!result.succeeded())
		return SyncError{SyncErrorKind::snapshot, sync.slug, snapshot_path(context.destination_path(), name.str()),
			"btrfs snapshot failed: " + failure_detail(result)};
	return std::optional<SnapshotName>(name);
}

PruneReport BtrfsStrategy::prune(
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
	std::vector<SnapshotName> protected_names;
	if (just_created.has_value()) {
		protected_names.push_back(*just_created);
		// in dry-run mode the new snapshot only exists in the plan
		if (std::find(snapshots.begin(), snapshots.end(), *just_created) == snapshots.end())
			snapshots.push_back(*just_created);
	}

	for (const SnapshotName &name : snapshots_to_prune(snapshots, *sync.snapshots.max_snapshots, protected_names)) {
		const std::string path = snapshot_path(context.destination_path(), name.str());

		ProcessResult result = context.execute(btrfs_writable_command(path));
		if (result.succeeded())
			result = context.execute(btrfs_delete_command(path));

		if (result.succeeded())
			report.removed.push_back(name.str());
		else
			report.warnings.push_back(SyncError{SyncErrorKind::prune, sync.slug, path, failure_detail(result)});
	}
	return report;
}
