#include "endpoint_resolver.hpp"

#include <utility>

const char *to_string(const NetworkPreference preference) {
	switch (preference) {
		case NetworkPreference::any: return "any";
		case NetworkPreference::private_network: return "private";
		case NetworkPreference::public_network: return "public";
	}
	return "any";
}

std::string describe(const NoReachableEndpoint &failure) {
	std::string result = "No reachable endpoint for volume '" + failure.volume + "' (tried:";
	for (const std::string &candidate : failure.candidates)
		result += " " + candidate;
	return result + ")";
}

EndpointResolution EndpointResolver::resolve(const RemoteVolume &volume) const {
	const std::vector<std::string> slugs = volume.candidates();

	std::vector<const SshEndpoint *> reachable;
	for (const std::string &slug : slugs) {
		const SshEndpoint &endpoint = configuration.ssh_endpoints.at(slug);
		if (hosts.resolve(endpoint.host).has_value())
			reachable.push_back(&endpoint);
	}
	if (reachable.empty())
		return NoReachableEndpoint{volume.slug, slugs};

	const std::vector<const SshEndpoint *> chosen = narrow_by_network(narrow_by_location(reachable));
	const SshEndpoint &endpoint = *chosen.front();
	return ResolvedEndpoint{endpoint, proxy_chain(configuration, endpoint)};
}

ResolvedEndpoints EndpointResolver::resolve_all() const {
	ResolvedEndpoints result;
	for (const auto &[slug, volume] : configuration.volumes) {
		if (const RemoteVolume *remote = std::get_if<RemoteVolume>(&volume))
			result.emplace(slug, resolve(*remote));
	}
	return result;
}

std::vector<const SshEndpoint *> EndpointResolver::narrow_by_location(
	const std::vector<const SshEndpoint *> &candidates
) const {
	if (!filter.location.has_value()) return candidates;

	std::vector<const SshEndpoint *> matching;
	for (const SshEndpoint *endpoint : candidates) {
		if (endpoint->location == filter.location)
			matching.push_back(endpoint);
	}
	return matching.empty() ? candidates : matching;
}

std::vector<const SshEndpoint *> EndpointResolver::narrow_by_network(
	const std::vector<const SshEndpoint *> &candidates
) const {
	if (filter.network == NetworkPreference::any) return candidates;

	const bool want_private = filter.network == NetworkPreference::private_network;
	std::vector<const SshEndpoint *> matching;
	for (const SshEndpoint *endpoint : candidates) {
		const std::optional<bool> is_private = is_private_host(hosts, endpoint->host);
		if (is_private.has_value() && *is_private == want_private)
			matching.push_back(endpoint);
	}
	return matching.empty() ? candidates : matching;
}
