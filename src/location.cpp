#include "location.hpp"

const std::string &location_path(const Location &location) {
	return std::visit([](const auto &l) -> const std::string & { return l.path; }, location);
}

bool is_remote(const Location &location) {
	return std::holds_alternative<RemoteLocation>(location);
}

namespace {

LocateResult locate_path(
	const Volume &volume,
	const ResolvedEndpoints &endpoints,
	const std::string &path
) {
	if (std::holds_alternative<LocalVolume>(volume))
		return Location{LocalLocation{path}};

	const EndpointResolution &resolution = endpoints.at(volume_slug(volume));
	if (const NoReachableEndpoint *failure = std::get_if<NoReachableEndpoint>(&resolution))
		return *failure;
	return Location{RemoteLocation{std::get<ResolvedEndpoint>(resolution), path}};
}

}

LocateResult locate_volume(
	const Configuration &configuration,
	const ResolvedEndpoints &endpoints,
	const std::string &volume
) {
	const Volume &record = configuration.volumes.at(volume);
	return locate_path(record, endpoints, volume_path(record));
}

LocateResult locate(
	const Configuration &configuration,
	const ResolvedEndpoints &endpoints,
	const SyncEndpoint &endpoint
) {
	return locate_path(configuration.volume_of(endpoint), endpoints, endpoint_path(configuration, endpoint));
}

Location with_subpath(const Location &location, const std::string &relative) {
	return std::visit([&relative](auto copy) -> Location {
		copy.path += "/" + relative;
		return copy;
	}, location);
}
