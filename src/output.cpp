#include "output.hpp"

#include <iomanip>

#include "ssh.hpp"

using Json = nlohmann::ordered_json;

std::optional<OutputFormat> parse_output_format(const std::string &text) {
	if (text == "human") return OutputFormat::human;
	if (text == "json") return OutputFormat::json;
	return std::nullopt;
}

void to_json(Json &j, const SyncError &error) {
	j = Json{
		{"kind", to_string(error.kind)},
		{"sync", error.sync},
		{"subject", error.subject},
		{"detail", error.detail},
	};
}

std::string format_volume_display(const Volume &volume, const ResolvedEndpoints &endpoints) {
	const RemoteVolume *remote = std::get_if<RemoteVolume>(&volume);
	if (remote == nullptr) return volume_path(volume);

	const EndpointResolution &resolution = endpoints.at(remote->slug);
	if (const ResolvedEndpoint *resolved = std::get_if<ResolvedEndpoint>(&resolution))
		return format_proxy_jump(resolved->endpoint) + ":" + remote->path;
	return "?:" + remote->path;
}

namespace {

std::string sync_endpoint_display(const SyncEndpoint &endpoint) {
	if (endpoint.subdir.has_value()) return endpoint.volume + ":/" + *endpoint.subdir;
	return endpoint.volume;
}

std::string sync_options_display(const SyncConfig &sync) {
	std::string result;
	if (!sync.filters.empty() || sync.filter_file.has_value())
		result = "rsync-filter";
	if (sync.snapshots.mode != SnapshotMode::none) {
		if (!result.empty()) result += ", ";
		result += std::string(to_string(sync.snapshots.mode)) + "-snapshots";
		if (sync.snapshots.max_snapshots.has_value())
			result += "(max:" + std::to_string(*sync.snapshots.max_snapshots) + ")";
	}
	if (!sync.enabled) {
		if (!result.empty()) result += ", ";
		result += "disabled";
	}
	return result;
}

template <typename Reason>
std::string status_display(const std::vector<Reason> &reasons) {
	if (reasons.empty()) return "active";
	std::string result = "inactive (";
	for (std::size_t i = 0; i < reasons.size(); ++i) {
		if (i > 0) result += ", ";
		result += to_string(reasons[i]);
	}
	return result + ")";
}

template <typename Reason>
Json reasons_to_json(const std::vector<Reason> &reasons) {
	Json result = Json::array();
	for (const Reason reason : reasons)
		result.push_back(to_string(reason));
	return result;
}

}

Json check_report_to_json(
	const CheckReport &report,
	const Configuration &configuration,
	const ResolvedEndpoints &endpoints
) {
	Json volumes = Json::array();
	for (const VolumeStatus &status : report.volumes) {
		const Volume &volume = configuration.volumes.at(status.slug);
		Json entry = {
			{"slug", status.slug},
			{"type", std::holds_alternative<RemoteVolume>(volume) ? "remote" : "local"},
			{"uri", format_volume_display(volume, endpoints)},
			{"active", status.available()},
			{"reasons", reasons_to_json(status.reasons)},
		};
		if (const auto found = endpoints.find(status.slug); found != endpoints.end()) {
			if (const ResolvedEndpoint *resolved = std::get_if<ResolvedEndpoint>(&found->second))
				entry["ssh-endpoint"] = resolved->endpoint.slug;
		}
		volumes.push_back(entry);
	}

	Json syncs = Json::array();
	for (const SyncStatus &status : report.syncs) {
		const SyncConfig &sync = *configuration.find_sync(status.slug);
		syncs.push_back({
			{"slug", status.slug},
			{"source", sync_endpoint_display(sync.source)},
			{"destination", sync_endpoint_display(sync.destination)},
			{"snapshot-mode", to_string(sync.snapshots.mode)},
			{"active", status.active()},
			{"reasons", reasons_to_json(status.reasons)},
		});
	}

	return Json{{"volumes", volumes}, {"syncs", syncs}};
}

Json run_report_to_json(const RunReport &report) {
	Json outcomes = Json::array();
	for (const RunOutcome &outcome : report.outcomes) {
		Json entry = {
			{"sync", outcome.sync},
			{"status", to_string(outcome.status)},
			{"dry-run", outcome.dry_run},
		};
		if (!outcome.skip_reasons.empty())
			entry["skip-reasons"] = reasons_to_json(outcome.skip_reasons);
		if (outcome.error.has_value())
			entry["error"] = *outcome.error;
		if (outcome.transfer.has_value()) {
			entry["rsync-exit-code"] = outcome.transfer->exit_code;
			entry["output"] = outcome.transfer->output;
			entry["elapsed-seconds"] = outcome.transfer->elapsed_seconds;
		}
		if (outcome.snapshot.has_value())
			entry["snapshot"] = *outcome.snapshot;
		entry["removed-orphans"] = outcome.removed_orphans;
		entry["pruned"] = outcome.pruned;
		entry["warnings"] = outcome.warnings;
		if (outcome.dry_run)
			entry["planned"] = outcome.planned;
		outcomes.push_back(entry);
	}
	return Json{{"dry-run", report.dry_run}, {"results", outcomes}, {"exit-code", report.exit_code()}};
}

void print_check_report(
	std::ostream &stream,
	const CheckReport &report,
	const Configuration &configuration,
	const ResolvedEndpoints &endpoints,
	const OutputFormat format
) {
	if (format == OutputFormat::json) {
		stream << std::setw(2) << check_report_to_json(report, configuration, endpoints) << std::endl;
		return;
	}

	stream << "Volumes:" << std::endl;
	for (const VolumeStatus &status : report.volumes) {
		const Volume &volume = configuration.volumes.at(status.slug);
		stream << "    " << status.slug << " ("
			<< (std::holds_alternative<RemoteVolume>(volume) ? "remote" : "local") << "): "
			<< format_volume_display(volume, endpoints) << " - "
			<< status_display(status.reasons) << std::endl;
	}

	stream << "Syncs:" << std::endl;
	for (const SyncStatus &status : report.syncs) {
		const SyncConfig &sync = *configuration.find_sync(status.slug);
		stream << "    " << status.slug << ": "
			<< sync_endpoint_display(sync.source) << " -> " << sync_endpoint_display(sync.destination);
		const std::string options = sync_options_display(sync);
		if (!options.empty()) stream << " [" << options << "]";
		stream << " - " << status_display(status.reasons) << std::endl;
	}
}

void print_run_report(std::ostream &stream, const RunReport &report, const OutputFormat format) {
	if (format == OutputFormat::json) {
		stream << std::setw(2) << run_report_to_json(report) << std::endl;
		return;
	}

	stream << "Sync results" << (report.dry_run ? " (dry run)" : "") << ":" << std::endl;
	for (const RunOutcome &outcome : report.outcomes) {
		stream << "    " << outcome.sync << ": ";
		switch (outcome.status) {
			case RunStatus::succeeded: stream << "OK"; break;
			case RunStatus::failed: stream << "FAILED"; break;
			case RunStatus::skipped: stream << "SKIPPED " << status_display(outcome.skip_reasons); break;
		}
		stream << std::endl;

		if (outcome.error.has_value())
			stream << "        Error: " << describe(*outcome.error) << std::endl;
		if (outcome.snapshot.has_value())
			stream << "        Snapshot: " << *outcome.snapshot << std::endl;
		if (!outcome.removed_orphans.empty())
			stream << "        Removed orphans: " << outcome.removed_orphans.size() << " snapshot(s)" << std::endl;
		if (!outcome.pruned.empty())
			stream << "        Pruned: " << outcome.pruned.size() << " snapshot(s)" << std::endl;
		for (const SyncError &warning : outcome.warnings)
			stream << "        Warning: " << describe(warning) << std::endl;
		if (outcome.status == RunStatus::failed && outcome.transfer.has_value() && !outcome.transfer->output.empty())
			stream << "        " << outcome.transfer->output.substr(0, outcome.transfer->output.find('\n')) << std::endl;
		for (const std::string &command : outcome.planned)
			stream << "        Would run: " << command << std::endl;
	}
}

void print_prune_report(std::ostream &stream, const RunReport &report, const OutputFormat format) {
	if (format == OutputFormat::json) {
		stream << std::setw(2) << run_report_to_json(report) << std::endl;
		return;
	}

	stream << "Prune results" << (report.dry_run ? " (dry run)" : "") << ":" << std::endl;
	for (const RunOutcome &outcome : report.outcomes) {
		stream << "    " << outcome.sync << ": ";
		if (!outcome.skip_reasons.empty())
			stream << "SKIPPED " << status_display(outcome.skip_reasons);
		else
			stream << (outcome.status == RunStatus::failed ? "FAILED" : "OK")
				<< ", deleted " << outcome.pruned.size();
		stream << std::endl;
		for (const SyncError &warning : outcome.warnings)
			stream << "        Warning: " << describe(warning) << std::endl;
		for (const std::string &command : outcome.planned)
			stream << "        Would run: " << command << std::endl;
	}
}
