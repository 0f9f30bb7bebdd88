#ifndef NBKP_SYNC_SELECTION_HPP
#define NBKP_SYNC_SELECTION_HPP

#include <string>
#include <variant>
#include <vector>

#include "configuration/configuration.hpp"

/** Matches a sync slug against a `--sync` pattern.
 * `*` matches any run of characters, `?` exactly one. */
bool slug_matches(const std::string &pattern, const std::string &slug);

/** A `--sync` pattern that selects no sync at all. */
struct UnmatchedPattern {
	std::string pattern;
};

using SyncSelection = std::variant<std::vector<std::string>, UnmatchedPattern>;

/** Expands `--sync` patterns to slugs in execution order.
 * No patterns select nothing explicitly, which the orchestrator reads as all syncs. */
SyncSelection select_syncs(const Configuration &configuration, const std::vector<std::string> &patterns);

#endif // NBKP_SYNC_SELECTION_HPP
