#include "errors.hpp"

const char *to_string(const ConfigurationErrorKind kind) {
	switch (kind) {
		case ConfigurationErrorKind::file_not_found: return "file-not-found";
		case ConfigurationErrorKind::parse_error: return "parse-error";
		case ConfigurationErrorKind::version_incompatible: return "version-incompatible";
		case ConfigurationErrorKind::missing_field: return "missing-field";
		case ConfigurationErrorKind::invalid_value: return "invalid-value";
		case ConfigurationErrorKind::unknown_reference: return "unknown-reference";
		case ConfigurationErrorKind::conflicting_options: return "conflicting-options";
		case ConfigurationErrorKind::cyclic_extends: return "cyclic-extends";
		case ConfigurationErrorKind::cyclic_proxy_jump: return "cyclic-proxy-jump";
		case ConfigurationErrorKind::cyclic_sync_dependency: return "cyclic-sync-dependency";
	}
	return "unknown";
}

const char *to_string(const SyncErrorKind kind) {
	switch (kind) {
		case SyncErrorKind::unavailable: return "unavailable";
		case SyncErrorKind::endpoint_resolution: return "endpoint-resolution";
		case SyncErrorKind::transfer: return "transfer";
		case SyncErrorKind::snapshot: return "snapshot";
		case SyncErrorKind::prune: return "prune";
	}
	return "unknown";
}

std::string describe(const ConfigurationError &error) {
	std::string result = error.message;
	if (!error.cycle.empty()) {
		result += " (";
		for (std::size_t i = 0; i < error.cycle.size(); ++i) {
			if (i > 0) result += " -> ";
			result += error.cycle[i];
		}
		result += ")";
	}
	return result;
}

std::string describe(const SyncError &error) {
	std::string result = to_string(error.kind);
	result += " error";
	if (!error.subject.empty())
		result += " [" + error.subject + "]";
	if (!error.detail.empty())
		result += ": " + error.detail;
	return result;
}
