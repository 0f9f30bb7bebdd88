#ifndef NBKP_AVAILABILITY_HPP
#define NBKP_AVAILABILITY_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "configuration/configuration.hpp"
#include "endpoint_resolver.hpp"
#include "location.hpp"
#include "process.hpp"

enum class VolumeReason {
	no_reachable_endpoint,
	unreachable,
	path_not_found,
	marker_not_found,
};

enum class SyncReason {
	disabled,
	source_unavailable,
	destination_unavailable,
	source_marker_not_found,
	destination_marker_not_found,
	destination_latest_not_found,
	destination_snapshots_not_found,
};

const char *to_string(VolumeReason reason);
const char *to_string(SyncReason reason);

struct VolumeStatus {
	std::string slug;
	std::vector<VolumeReason> reasons;
	// the volume root; no value if no endpoint could be chosen
	std::optional<Location> location;

	bool available() const { return reasons.empty(); }
};

struct SyncStatus {
	std::string slug;
	std::vector<SyncReason> reasons;
	std::optional<Location> source;
	std::optional<Location> destination;

	bool active() const { return reasons.empty(); }
};

struct CheckReport {
	std::vector<VolumeStatus> volumes;
	std::vector<SyncStatus> syncs;

	bool all_active() const;
};

/** The three outcomes of looking for a file on a possibly remote host. */
enum class Probe {
	present,
	missing,
	unreachable,
};

/** Checks volumes and syncs before anything is transferred.
 * Every volume is checked at most once per instance. */
class AvailabilityChecker {
	const Configuration &configuration;
	const ResolvedEndpoints &endpoints;
	ProcessRunner &runner;
	std::map<std::string, VolumeStatus> volume_cache;

	public:
	AvailabilityChecker(const Configuration &configuration, const ResolvedEndpoints &endpoints, ProcessRunner &runner)
		: configuration(configuration), endpoints(endpoints), runner(runner) {}

	const VolumeStatus &check_volume(const std::string &slug);

	/** Collects every reason the sync cannot run; an empty list means it can. */
	SyncStatus check_sync(const SyncConfig &sync);

	private:
	/** `test -f` / `test -d` at a location: std::filesystem locally, ssh remotely. */
	Probe probe(const Location &location, const std::string &path, bool directory);
};

/** Checks the named syncs (all if `only_syncs` is empty) and the volumes they use. */
CheckReport check_all(
	AvailabilityChecker &checker,
	const Configuration &configuration,
	const std::vector<std::string> &only_syncs
);

#endif // NBKP_AVAILABILITY_HPP
