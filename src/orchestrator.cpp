#include "orchestrator.hpp"

#include <algorithm>
#include <iostream>
#include <memory>
#include <string_view>

#include "snapshot.hpp"

const char *to_string(const RunStatus status) {
	switch (status) {
		case RunStatus::skipped: return "skipped";
		case RunStatus::succeeded: return "succeeded";
		case RunStatus::failed: return "failed";
	}
	return "unknown";
}

int RunReport::exit_code() const {
	const bool any_failed = std::any_of(outcomes.begin(), outcomes.end(),
		[](const RunOutcome &outcome) { return outcome.status == RunStatus::failed; });
	return any_failed ? EXIT_CODE_SYNC_FAILED : EXIT_CODE_SUCCESS;
}

std::vector<const SyncConfig *> SyncOrchestrator::selected_syncs() const {
	std::vector<const SyncConfig *> result;
	for (const std::string &slug : configuration.execution_order) {
		const auto &only = options.only_syncs;
		if (!only.empty() && std::find(only.begin(), only.end(), slug) == only.end())
			continue;
		result.push_back(configuration.find_sync(slug));
	}
	return result;
}

RunReport SyncOrchestrator::run() {
	RunReport report;
	report.dry_run = options.dry_run;
	for (const SyncConfig *sync : selected_syncs()) {
		if (options.verbose)
			std::cout << "Sync '" << sync->slug << "' started." << std::endl;
		report.outcomes.push_back(run_sync(*sync));
	}
	return report;
}

namespace {

RunOutcome failed(RunOutcome outcome, SyncError error) {
	outcome.status = RunStatus::failed;
	outcome.error = std::move(error);
	return outcome;
}

}

RunOutcome SyncOrchestrator::run_sync(const SyncConfig &sync) {
	RunOutcome outcome;
	outcome.sync = sync.slug;
	outcome.dry_run = options.dry_run;

	const SyncStatus status = checker.check_sync(sync);
	if (!status.active()) {
		outcome.status = RunStatus::skipped;
		outcome.skip_reasons = status.reasons;
		if (options.verbose) {
			std::cout << "Sync '" << sync.slug << "' skipped:";
			for (const SyncReason reason : status.reasons)
				std::cout << " [" << to_string(reason) << "]";
			std::cout << std::endl;
		}
		return outcome;
	}

	const LocateResult source = locate_transfer_source(configuration, endpoints, sync);
	if (const NoReachableEndpoint *failure = std::get_if<NoReachableEndpoint>(&source))
		return failed(outcome, SyncError{SyncErrorKind::endpoint_resolution, sync.slug, failure->volume, describe(*failure)});

	const std::unique_ptr<SnapshotStrategy> strategy = make_snapshot_strategy(sync.snapshots.mode);
	SnapshotContext context(runner, *status.destination, options.dry_run, options.verbose, options.clock());

	const PrepareResult prepared = strategy->prepare(sync, context);
	if (const SyncError *error = std::get_if<SyncError>(&prepared)) {
		outcome.planned = context.get_planned();
		return failed(outcome, *error);
	}
	const TransferTarget &target = std::get<TransferTarget>(prepared);
	outcome.removed_orphans = target.removed_orphans;

	TransferRequest request{std::get<Location>(source), *status.destination};
	request.destination_suffix = target.destination_suffix;
	request.link_dest = target.link_dest;
	request.progress = options.progress;
	const Command transfer_command = build_rsync_command(sync, request).argv();

	ProcessResult transfer;
	TransferStatistics statistics;
	if (options.dry_run) {
		context.plan(transfer_command);
		transfer.exit_code = 0;
	} else {
		if (options.verbose)
			std::cout << "Running: " << shell_join(transfer_command) << std::endl;
		const auto started = std::chrono::steady_clock::now();
		if (options.progress != ProgressMode::none) {
			transfer = runner.run_streaming(transfer_command, [](const std::string_view chunk) {
				std::cout << chunk << std::flush;
			});
		} else {
			transfer = runner.run(transfer_command);
		}
		const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
		statistics.elapsed_seconds = elapsed.count();
	}
	statistics.exit_code = transfer.exit_code;
	statistics.output = transfer.output + transfer.error_output;
	outcome.transfer = statistics;

	const PublishResult published = strategy->publish(sync, context, target, transfer);
	if (!transfer.succeeded()) {
		outcome.planned = context.get_planned();
		return failed(outcome, SyncError{SyncErrorKind::transfer, sync.slug, sync.destination.volume,
			"rsync exited with code " + std::to_string(transfer.exit_code)});
	}
	if (const SyncError *error = std::get_if<SyncError>(&published)) {
		outcome.planned = context.get_planned();
		return failed(outcome, *error);
	}

	const std::optional<SnapshotName> &snapshot = std::get<std::optional<SnapshotName>>(published);
	if (snapshot.has_value())
		outcome.snapshot = snapshot->str();

	if (options.prune) {
		PruneReport pruned = strategy->prune(sync, context, snapshot);
		outcome.pruned = std::move(pruned.removed);
		outcome.warnings = std::move(pruned.warnings);
		for (const SyncError &warning : outcome.warnings)
			std::cerr << "Warning: " << describe(warning) << std::endl;
	}

	outcome.planned = context.get_planned();
	outcome.status = RunStatus::succeeded;
	return outcome;
}

RunReport SyncOrchestrator::prune() {
	RunReport report;
	report.dry_run = options.dry_run;
	for (const SyncConfig *sync : selected_syncs()) {
		if (sync->snapshots.mode == SnapshotMode::none) continue;

		RunOutcome outcome;
		outcome.sync = sync->slug;
		outcome.dry_run = options.dry_run;

		const VolumeStatus &volume = checker.check_volume(sync->destination.volume);
		if (!volume.available()) {
			outcome.skip_reasons.push_back(SyncReason::destination_unavailable);
			report.outcomes.push_back(outcome);
			continue;
		}

		const Location destination = std::get<Location>(locate(configuration, endpoints, sync->destination));
		SnapshotContext context(runner, destination, options.dry_run, options.verbose, options.clock());
		PruneReport pruned = make_snapshot_strategy(sync->snapshots.mode)->prune(*sync, context, std::nullopt);

		outcome.pruned = std::move(pruned.removed);
		outcome.warnings = std::move(pruned.warnings);
		outcome.planned = context.get_planned();
		outcome.status = outcome.warnings.empty() ? RunStatus::succeeded : RunStatus::failed;
		if (!outcome.warnings.empty())
			outcome.error = outcome.warnings.front();
		report.outcomes.push_back(outcome);
	}
	return report;
}
