#ifndef NBKP_SNAPSHOT_HARD_LINK_HPP
#define NBKP_SNAPSHOT_HARD_LINK_HPP

#include "snapshot.hpp"

/** Hard-link snapshots: every run writes a new `snapshots/<name>` directory,
 * hard-linking unchanged files to the previous snapshot via `--link-dest`.
 * `latest` is a relative symlink, repointed atomically after a good transfer. */
class HardLinkStrategy final : public SnapshotStrategy {
	public:
	SnapshotMode mode() const override { return SnapshotMode::hard_link; }
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

#endif // NBKP_SNAPSHOT_HARD_LINK_HPP
