#include "sync_selection.hpp"

#include <algorithm>

namespace {

bool matches_from(
	std::string::const_iterator pattern_it,
	const std::string::const_iterator pattern_end,
	std::string::const_iterator slug_it,
	const std::string::const_iterator slug_end
) {
	while (pattern_it != pattern_end) {
		if (*pattern_it == '*') {
			++pattern_it;
			if (pattern_it == pattern_end) return true;

			// try every split point, starting with an empty run
			for (; slug_it != slug_end; ++slug_it) {
				if (matches_from(pattern_it, pattern_end, slug_it, slug_end))
					return true;
			}
			return matches_from(pattern_it, pattern_end, slug_it, slug_end);
		}

		if (slug_it == slug_end) return false;
		if (*pattern_it != '?' && *pattern_it != *slug_it) return false;
		++pattern_it;
		++slug_it;
	}
	return slug_it == slug_end;
}

}

bool slug_matches(const std::string &pattern, const std::string &slug) {
	return matches_from(pattern.begin(), pattern.end(), slug.begin(), slug.end());
}

SyncSelection select_syncs(const Configuration &configuration, const std::vector<std::string> &patterns) {
	for (const std::string &pattern : patterns) {
		const bool any = std::any_of(configuration.syncs.begin(), configuration.syncs.end(),
			[&pattern](const SyncConfig &sync) { return slug_matches(pattern, sync.slug); });
		if (!any) return UnmatchedPattern{pattern};
	}

	std::vector<std::string> selected;
	for (const std::string &slug : configuration.execution_order) {
		for (const std::string &pattern : patterns) {
			if (slug_matches(pattern, slug)) {
				selected.push_back(slug);
				break;
			}
		}
	}
	return selected;
}
