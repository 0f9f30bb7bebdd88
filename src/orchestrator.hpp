#ifndef NBKP_ORCHESTRATOR_HPP
#define NBKP_ORCHESTRATOR_HPP

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "availability.hpp"
#include "configuration/configuration.hpp"
#include "endpoint_resolver.hpp"
#include "errors.hpp"
#include "process.hpp"
#include "rsync_command.hpp"

using Clock = std::function<std::chrono::system_clock::time_point()>;

struct RunOptions {
	bool dry_run = false;
	bool prune = true;
	bool verbose = false;
	ProgressMode progress = ProgressMode::none;
	// all syncs if empty
	std::vector<std::string> only_syncs;
	Clock clock = [] { return std::chrono::system_clock::now(); };
};

enum class RunStatus {
	skipped,
	succeeded,
	failed,
};

const char *to_string(RunStatus status);

struct TransferStatistics {
	int exit_code = -1;
	std::string output;
	double elapsed_seconds = 0;
};

/** The result of one sync in one invocation. */
struct RunOutcome {
	std::string sync;
	RunStatus status = RunStatus::skipped;
	std::vector<SyncReason> skip_reasons;
	std::optional<SyncError> error;
	std::optional<TransferStatistics> transfer;
	std::optional<std::string> snapshot;
	std::vector<std::string> removed_orphans;
	std::vector<std::string> pruned;
	std::vector<SyncError> warnings;
	// dry-run only: the commands a real run would execute
	std::vector<std::string> planned;
	bool dry_run = false;
};

struct RunReport {
	std::vector<RunOutcome> outcomes;
	bool dry_run = false;

	/** EXIT_CODE_SYNC_FAILED if any sync failed. Skipped syncs do not count. */
	int exit_code() const;
};

/** Drives every selected sync through check, transfer, snapshot and prune,
 * one after another in dependency order. */
class SyncOrchestrator {
	const Configuration &configuration;
	const ResolvedEndpoints &endpoints;
	ProcessRunner &runner;
	AvailabilityChecker &checker;
	RunOptions options;

	public:
	SyncOrchestrator(
		const Configuration &configuration,
		const ResolvedEndpoints &endpoints,
		ProcessRunner &runner,
		AvailabilityChecker &checker,
		RunOptions options
	) : configuration(configuration), endpoints(endpoints), runner(runner), checker(checker), options(std::move(options)) {}

	RunReport run();

	RunOutcome run_sync(const SyncConfig &sync);

	/** Runs only the prune step of every selected snapshotting sync. */
	RunReport prune();

	private:
	std::vector<const SyncConfig *> selected_syncs() const;
};

#endif // NBKP_ORCHESTRATOR_HPP
