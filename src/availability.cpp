#include "availability.hpp"

#include <algorithm>
#include <filesystem>
#include <set>

#include "snapshot.hpp"
#include "ssh.hpp"

namespace fs = std::filesystem;

const char *to_string(const VolumeReason reason) {
	switch (reason) {
		case VolumeReason::no_reachable_endpoint: return "no reachable endpoint";
		case VolumeReason::unreachable: return "unreachable";
		case VolumeReason::path_not_found: return "path not found";
		case VolumeReason::marker_not_found: return ".nbkp-vol volume marker not found";
	}
	return "unknown";
}

const char *to_string(const SyncReason reason) {
	switch (reason) {
		case SyncReason::disabled: return "disabled";
		case SyncReason::source_unavailable: return "source unavailable";
		case SyncReason::destination_unavailable: return "destination unavailable";
		case SyncReason::source_marker_not_found: return "source .nbkp-src marker not found";
		case SyncReason::destination_marker_not_found: return "destination .nbkp-dst marker not found";
		case SyncReason::destination_latest_not_found: return "destination latest/ not found";
		case SyncReason::destination_snapshots_not_found: return "destination snapshots/ not found";
	}
	return "unknown";
}

bool CheckReport::all_active() const {
	return std::all_of(syncs.begin(), syncs.end(), [](const SyncStatus &s) { return s.active(); });
}

Probe AvailabilityChecker::probe(const Location &location, const std::string &path, const bool directory) {
	if (std::holds_alternative<LocalLocation>(location)) {
		std::error_code error;
		const fs::file_status status = fs::status(path, error);
		if (error || !fs::exists(status)) return Probe::missing;
		if (directory) return fs::is_directory(status) ? Probe::present : Probe::missing;
		return Probe::present;
	}

	const ProcessResult result = run_at(runner, location, {"test", directory ? "-d" : "-e", path});
	if (result.succeeded()) return Probe::present;
	if (result.exit_code == EXIT_CODE_SSH_CONNECTION_FAILED) return Probe::unreachable;
	return Probe::missing;
}

const VolumeStatus &AvailabilityChecker::check_volume(const std::string &slug) {
	if (const auto cached = volume_cache.find(slug); cached != volume_cache.end())
		return cached->second;

	VolumeStatus status;
	status.slug = slug;

	const LocateResult located = locate_volume(configuration, endpoints, slug);
	if (std::holds_alternative<NoReachableEndpoint>(located)) {
		status.reasons.push_back(VolumeReason::no_reachable_endpoint);
		return volume_cache[slug] = status;
	}

	const Location &location = std::get<Location>(located);
	status.location = location;
	const std::string &root = location_path(location);

	const Probe root_probe = probe(location, root, true);
	if (root_probe == Probe::unreachable) {
		status.reasons.push_back(VolumeReason::unreachable);
	} else if (root_probe == Probe::missing) {
		status.reasons.push_back(VolumeReason::path_not_found);
	} else {
		const Probe marker = probe(location, root + "/" + VOLUME_MARKER, false);
		if (marker == Probe::unreachable)
			status.reasons.push_back(VolumeReason::unreachable);
		else if (marker == Probe::missing)
			status.reasons.push_back(VolumeReason::marker_not_found);
	}
	return volume_cache[slug] = status;
}

SyncStatus AvailabilityChecker::check_sync(const SyncConfig &sync) {
	SyncStatus status;
	status.slug = sync.slug;
	if (!sync.enabled)
		status.reasons.push_back(SyncReason::disabled);

	const VolumeStatus &source_volume = check_volume(sync.source.volume);
	if (source_volume.available()) {
		const Location source = std::get<Location>(locate(configuration, endpoints, sync.source));
		status.source = source;
		if (probe(source, location_path(source) + "/" + SOURCE_MARKER, false) != Probe::present)
			status.reasons.push_back(SyncReason::source_marker_not_found);
	} else {
		status.reasons.push_back(SyncReason::source_unavailable);
	}

	const VolumeStatus &destination_volume = check_volume(sync.destination.volume);
	if (destination_volume.available()) {
		const Location destination = std::get<Location>(locate(configuration, endpoints, sync.destination));
		status.destination = destination;
		const std::string &path = location_path(destination);
		if (probe(destination, path + "/" + DESTINATION_MARKER, false) != Probe::present)
			status.reasons.push_back(SyncReason::destination_marker_not_found);

		if (sync.snapshots.mode == SnapshotMode::btrfs) {
			if (probe(destination, latest_path(path), true) != Probe::present)
				status.reasons.push_back(SyncReason::destination_latest_not_found);
			if (probe(destination, snapshots_path(path), true) != Probe::present)
				status.reasons.push_back(SyncReason::destination_snapshots_not_found);
		}
	} else {
		status.reasons.push_back(SyncReason::destination_unavailable);
	}
	return status;
}

CheckReport check_all(
	AvailabilityChecker &checker,
	const Configuration &configuration,
	const std::vector<std::string> &only_syncs
) {
	CheckReport report;
	std::set<std::string> used_volumes;
	for (const std::string &slug : configuration.execution_order) {
		if (!only_syncs.empty() && std::find(only_syncs.begin(), only_syncs.end(), slug) == only_syncs.end())
			continue;
		const SyncConfig &sync = *configuration.find_sync(slug);
		report.syncs.push_back(checker.check_sync(sync));
		used_volumes.insert(sync.source.volume);
		used_volumes.insert(sync.destination.volume);
	}

	for (const auto &[slug, volume] : configuration.volumes) {
		if (only_syncs.empty() || used_volumes.contains(slug))
			report.volumes.push_back(checker.check_volume(slug));
	}
	return report;
}
