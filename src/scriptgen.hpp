#ifndef NBKP_SCRIPTGEN_HPP
#define NBKP_SCRIPTGEN_HPP

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "configuration/configuration.hpp"
#include "endpoint_resolver.hpp"

struct ScriptOptions {
	// echoed in the header, so the script says where it came from
	std::optional<std::string> config_path;
	// all syncs if empty
	std::vector<std::string> only_syncs;
};

/** Renders a self-contained bash script performing the same syncs as
 * `nbkp run`: endpoint choices, paths, rsync commands and snapshot
 * operations are baked in. The script accepts `-n/--dry-run` and
 * `-v/--verbose` and exits nonzero iff a sync failed. */
std::string generate_script(
	const Configuration &configuration,
	const ResolvedEndpoints &endpoints,
	std::chrono::system_clock::time_point now,
	const ScriptOptions &options
);

/** `nbkp_sync_<slug>` with dashes turned into underscores. */
std::string sync_function_name(const std::string &slug);

#endif // NBKP_SCRIPTGEN_HPP
