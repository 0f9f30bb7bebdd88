#ifndef NBKP_ENDPOINT_RESOLVER_HPP
#define NBKP_ENDPOINT_RESOLVER_HPP

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "configuration/configuration.hpp"
#include "network.hpp"

enum class NetworkPreference {
	any,
	private_network,
	public_network,
};

const char *to_string(NetworkPreference preference);

/** Run-time selection hints given on the command line. */
struct EndpointFilter {
	std::optional<std::string> location;
	NetworkPreference network = NetworkPreference::any;
};

/** The endpoint chosen for a remote volume, with its bastion chain. */
struct ResolvedEndpoint {
	SshEndpoint endpoint;
	std::vector<SshEndpoint> proxy_chain;

	/** Same host, port and user: both sides are reachable through one shell. */
	bool same_channel_as(const ResolvedEndpoint &other) const {
		return endpoint.host == other.endpoint.host
			&& endpoint.port == other.endpoint.port
			&& endpoint.user == other.endpoint.user;
	}
};

struct NoReachableEndpoint {
	std::string volume;
	std::vector<std::string> candidates;
};

std::string describe(const NoReachableEndpoint &failure);

using EndpointResolution = std::variant<ResolvedEndpoint, NoReachableEndpoint>;

/** Resolutions of every remote volume, keyed by volume slug. */
using ResolvedEndpoints = std::map<std::string, EndpointResolution>;

/** Picks one concrete endpoint per remote volume:
 * candidates that do not resolve are dropped, the location hint and
 * the network preference narrow the set unless that would empty it,
 * and the first remaining candidate in declared order wins. */
class EndpointResolver {
	const Configuration &configuration;
	const HostResolver &hosts;
	EndpointFilter filter;

	public:
	EndpointResolver(const Configuration &configuration, const HostResolver &hosts, EndpointFilter filter)
		: configuration(configuration), hosts(hosts), filter(std::move(filter)) {}

	EndpointResolution resolve(const RemoteVolume &volume) const;

	/** Resolves every remote volume of the configuration once. */
	ResolvedEndpoints resolve_all() const;

	private:
	std::vector<const SshEndpoint *> narrow_by_location(const std::vector<const SshEndpoint *> &candidates) const;
	std::vector<const SshEndpoint *> narrow_by_network(const std::vector<const SshEndpoint *> &candidates) const;
};

#endif // NBKP_ENDPOINT_RESOLVER_HPP
