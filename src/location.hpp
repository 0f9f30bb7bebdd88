#ifndef NBKP_LOCATION_HPP
#define NBKP_LOCATION_HPP

#include <string>
#include <variant>

#include "configuration/configuration.hpp"
#include "endpoint_resolver.hpp"

struct LocalLocation {
	std::string path;
};

struct RemoteLocation {
	ResolvedEndpoint endpoint;
	std::string path;
};

/** A concrete place where commands run and files live: a local path,
 * or a path on the resolved endpoint of a remote volume. */
using Location = std::variant<LocalLocation, RemoteLocation>;

using LocateResult = std::variant<Location, NoReachableEndpoint>;

const std::string &location_path(const Location &location);

bool is_remote(const Location &location);

/** The location of a volume root. */
LocateResult locate_volume(
	const Configuration &configuration,
	const ResolvedEndpoints &endpoints,
	const std::string &volume
);

/** The location of a sync side (volume path plus sub-directory). */
LocateResult locate(
	const Configuration &configuration,
	const ResolvedEndpoints &endpoints,
	const SyncEndpoint &endpoint
);

/** The same host, with `relative` appended to the path. */
Location with_subpath(const Location &location, const std::string &relative);

#endif // NBKP_LOCATION_HPP
