#ifndef NBKP_ERRORS_HPP
#define NBKP_ERRORS_HPP

#include <string>
#include <vector>

enum class ConfigurationErrorKind {
	file_not_found,
	parse_error,
	version_incompatible,
	missing_field,
	invalid_value,
	unknown_reference,
	conflicting_options,
	cyclic_extends,
	cyclic_proxy_jump,
	cyclic_sync_dependency,
};

/** A fatal configuration problem. Aborts the invocation before any sync runs.
 * `subject` names the offending endpoint, volume or sync slug (or the file),
 * `cycle` lists the members of a detected reference cycle in walk order. */
struct ConfigurationError {
	ConfigurationErrorKind kind;
	std::string subject;
	std::string message;
	std::vector<std::string> cycle;
};

enum class SyncErrorKind {
	unavailable,
	endpoint_resolution,
	transfer,
	snapshot,
	prune,
};

/** A per-sync error. Only `prune` errors may accompany a successful sync. */
struct SyncError {
	SyncErrorKind kind;
	std::string sync;
	std::string subject;
	std::string detail;
};

const char *to_string(ConfigurationErrorKind kind);
const char *to_string(SyncErrorKind kind);

std::string describe(const ConfigurationError &error);
std::string describe(const SyncError &error);

#endif // NBKP_ERRORS_HPP
