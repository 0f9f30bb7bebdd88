#ifndef NBKP_SNAPSHOT_BTRFS_HPP
#define NBKP_SNAPSHOT_BTRFS_HPP

#include "snapshot.hpp"

/** Copy-on-write snapshots: rsync writes into the `latest/` subvolume,
 * which is then captured with `btrfs subvolume snapshot -r`. */
class BtrfsStrategy final : public SnapshotStrategy {
	public:
	SnapshotMode mode() const override { return SnapshotMode::btrfs; }
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

#endif // NBKP_SNAPSHOT_BTRFS_HPP
