#ifndef NBKP_DEPENDENCY_GRAPH_HPP
#define NBKP_DEPENDENCY_GRAPH_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

/** A directed graph over slugs. `edges[a]` lists the nodes `a` points to
 * (the endpoint it jumps through, the sync it depends on, ...).
 * Targets that are not keys of the map are treated as leaves. */
using DependencyGraph = std::map<std::string, std::vector<std::string>>;

/** Finds a cycle reachable from any node, visiting nodes in `roots` order.
 * The result starts and ends with the same node, e.g. `a, b, a`. */
std::optional<std::vector<std::string>> find_cycle(
	const DependencyGraph &graph,
	const std::vector<std::string> &roots
);

/** Orders `nodes` so that every node comes after the nodes it points to.
 * Among independent nodes, the order of `nodes` is kept.
 * Returns no value if the graph has a cycle. */
std::optional<std::vector<std::string>> dependency_order(
	const DependencyGraph &graph,
	const std::vector<std::string> &nodes
);

#endif // NBKP_DEPENDENCY_GRAPH_HPP
