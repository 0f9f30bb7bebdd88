#include "dependency_graph.hpp"

#include <algorithm>
#include <set>

namespace {

enum class Mark {
	unvisited,
	in_progress,
	done,
};

bool walk(
	const DependencyGraph &graph,
	const std::string &node,
	std::map<std::string, Mark> &marks,
	std::vector<std::string> &path,
	std::vector<std::string> &cycle
) {
	marks[node] = Mark::in_progress;
	path.push_back(node);

	const auto edges = graph.find(node);
	if (edges != graph.end()) {
		for (const std::string &next : edges->second) {
			const Mark mark = marks[next];
			if (mark == Mark::in_progress) {
				const auto start = std::find(path.begin(), path.end(), next);
				cycle.assign(start, path.end());
				cycle.push_back(next);
				return true;
			}
			if (mark == Mark::unvisited && walk(graph, next, marks, path, cycle))
				return true;
		}
	}

	path.pop_back();
	marks[node] = Mark::done;
	return false;
}

}

std::optional<std::vector<std::string>> find_cycle(
	const DependencyGraph &graph,
	const std::vector<std::string> &roots
) {
	std::map<std::string, Mark> marks;
	for (const std::string &root : roots) {
		if (marks[root] != Mark::unvisited) continue;

		std::vector<std::string> path;
		std::vector<std::string> cycle;
		if (walk(graph, root, marks, path, cycle))
			return cycle;
	}
	return std::nullopt;
}

std::optional<std::vector<std::string>> dependency_order(
	const DependencyGraph &graph,
	const std::vector<std::string> &nodes
) {
	const std::set<std::string> known(nodes.begin(), nodes.end());
	std::set<std::string> placed;
	std::vector<std::string> order;

	// repeatedly take the first node (in `nodes` order) whose dependencies are placed
	while (order.size() < nodes.size()) {
		bool progressed = false;
		for (const std::string &node : nodes) {
			if (placed.contains(node)) continue;

			bool ready = true;
			const auto edges = graph.find(node);
			if (edges != graph.end()) {
				for (const std::string &dependency : edges->second) {
					if (known.contains(dependency) && !placed.contains(dependency)) {
						ready = false;
						break;
					}
				}
			}
			if (!ready) continue;

			placed.insert(node);
			order.push_back(node);
			progressed = true;
			break;
		}
		if (!progressed) return std::nullopt;
	}
	return order;
}
