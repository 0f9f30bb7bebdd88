#include "configuration.hpp"

#include <cstdlib>
#include <fstream>
#include <set>

#include "configuration-json.hpp"
#include "../dependency_graph.hpp"

namespace fs = std::filesystem;

namespace {

constexpr std::size_t MAX_SLUG_LENGTH = 50;

ConfigurationError make_error(
	const ConfigurationErrorKind kind,
	const std::string &subject,
	const std::string &message
) {
	return ConfigurationError{kind, subject, message, {}};
}

std::optional<ConfigurationError> check_slug(const std::string &what, const std::string &slug) {
	if (is_valid_slug(slug)) return std::nullopt;
	return make_error(
		ConfigurationErrorKind::invalid_value,
		slug,
		"Invalid " + what + " slug '" + slug + "': expected lowercase words separated by single dashes"
	);
}

std::optional<ConfigurationError> validate_endpoints(const Configuration &configuration) {
	for (const auto &[slug, endpoint] : configuration.ssh_endpoints) {
		if (auto error = check_slug("ssh-endpoint", slug)) return error;

		if (endpoint.host.empty())
			return make_error(ConfigurationErrorKind::missing_field, slug,
				"Endpoint '" + slug + "' has no host");
		if (endpoint.port < 1 || endpoint.port > 65535)
			return make_error(ConfigurationErrorKind::invalid_value, slug,
				"Endpoint '" + slug + "' has port out of range: " + std::to_string(endpoint.port));

		const ConnectionOptions &options = endpoint.connection_options;
		if (options.connect_timeout < 1)
			return make_error(ConfigurationErrorKind::invalid_value, slug,
				"Endpoint '" + slug + "' has connect-timeout below 1 second");
		if (options.server_alive_interval.has_value() && *options.server_alive_interval < 1)
			return make_error(ConfigurationErrorKind::invalid_value, slug,
				"Endpoint '" + slug + "' has server-alive-interval below 1 second");

		for (const std::string &hop : endpoint.proxy_jumps) {
			if (!configuration.ssh_endpoints.contains(hop))
				return make_error(ConfigurationErrorKind::unknown_reference, slug,
					"Endpoint '" + slug + "' references unknown proxy-jump endpoint '" + hop + "'");
		}
	}

	DependencyGraph jumps;
	std::vector<std::string> roots;
	for (const auto &[slug, endpoint] : configuration.ssh_endpoints) {
		jumps[slug] = endpoint.proxy_jumps;
		roots.push_back(slug);
	}
	if (const auto cycle = find_cycle(jumps, roots)) {
		ConfigurationError error = make_error(
			ConfigurationErrorKind::cyclic_proxy_jump,
			cycle->front(),
			"Circular proxy-jump chain detected"
		);
		error.cycle = *cycle;
		return error;
	}
	return std::nullopt;
}

std::optional<ConfigurationError> validate_volumes(const Configuration &configuration) {
	for (const auto &[slug, volume] : configuration.volumes) {
		if (auto error = check_slug("volume", slug)) return error;
		if (volume_path(volume).empty())
			return make_error(ConfigurationErrorKind::missing_field, slug,
				"Volume '" + slug + "' has no path");

		const RemoteVolume *remote = std::get_if<RemoteVolume>(&volume);
		if (remote == nullptr) continue;

		std::vector<std::string> references = remote->ssh_endpoints;
		references.insert(references.begin(), remote->ssh_endpoint);
		for (const std::string &reference : references) {
			if (!configuration.ssh_endpoints.contains(reference))
				return make_error(ConfigurationErrorKind::unknown_reference, slug,
					"Volume '" + slug + "' references unknown ssh-endpoint '" + reference + "'");
		}
	}
	return std::nullopt;
}

std::optional<ConfigurationError> validate_syncs(const Configuration &configuration) {
	std::set<std::string> seen;
	for (const SyncConfig &sync : configuration.syncs) {
		if (auto error = check_slug("sync", sync.slug)) return error;
		if (!seen.insert(sync.slug).second)
			return make_error(ConfigurationErrorKind::invalid_value, sync.slug,
				"Sync '" + sync.slug + "' is declared twice");

		if (!configuration.volumes.contains(sync.source.volume))
			return make_error(ConfigurationErrorKind::unknown_reference, sync.slug,
				"Sync '" + sync.slug + "' references unknown source volume '" + sync.source.volume + "'");
		if (!configuration.volumes.contains(sync.destination.volume))
			return make_error(ConfigurationErrorKind::unknown_reference, sync.slug,
				"Sync '" + sync.slug + "' references unknown destination volume '"
					+ sync.destination.volume + "'");

		if (sync.snapshots.max_snapshots.has_value() && *sync.snapshots.max_snapshots < 1)
			return make_error(ConfigurationErrorKind::invalid_value, sync.slug,
				"Sync '" + sync.slug + "' has max-snapshots below 1");
	}
	return std::nullopt;
}

/** Computes the sync execution order: a sync reading another sync's
 * destination runs after it. */
std::optional<ConfigurationError> order_syncs(Configuration &configuration) {
	DependencyGraph dependencies;
	std::vector<std::string> declared;
	for (const SyncConfig &sync : configuration.syncs) {
		declared.push_back(sync.slug);
		std::vector<std::string> &writers = dependencies[sync.slug];
		for (const SyncConfig &other : configuration.syncs) {
			if (other.slug != sync.slug && other.destination == sync.source)
				writers.push_back(other.slug);
		}
	}

	if (const auto cycle = find_cycle(dependencies, declared)) {
		ConfigurationError error = make_error(
			ConfigurationErrorKind::cyclic_sync_dependency,
			cycle->front(),
			"Cyclic sync dependency detected"
		);
		error.cycle = *cycle;
		return error;
	}

	const auto order = dependency_order(dependencies, declared);
	if (!order.has_value())
		return make_error(ConfigurationErrorKind::cyclic_sync_dependency, "",
			"Cyclic sync dependency detected");
	configuration.execution_order = *order;
	return std::nullopt;
}

}

const std::string &volume_slug(const Volume &volume) {
	return std::visit([](const auto &v) -> const std::string & { return v.slug; }, volume);
}

const std::string &volume_path(const Volume &volume) {
	return std::visit([](const auto &v) -> const std::string & { return v.path; }, volume);
}

const char *to_string(const SnapshotMode mode) {
	switch (mode) {
		case SnapshotMode::none: return "none";
		case SnapshotMode::btrfs: return "btrfs";
		case SnapshotMode::hard_link: return "hard-link";
	}
	return "none";
}

const SyncConfig *Configuration::find_sync(const std::string &slug) const {
	for (const SyncConfig &sync : syncs) {
		if (sync.slug == slug) return &sync;
	}
	return nullptr;
}

bool is_valid_slug(const std::string &slug) {
	if (slug.empty() || slug.size() > MAX_SLUG_LENGTH) return false;
	if (slug.front() == '-' || slug.back() == '-') return false;

	char previous = '\0';
	for (const char c : slug) {
		const bool word_character = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
		if (!word_character && c != '-') return false;
		if (c == '-' && previous == '-') return false;
		previous = c;
	}
	return true;
}

std::optional<ConfigurationError> finalize_configuration(Configuration &configuration) {
	if (auto error = validate_endpoints(configuration)) return error;
	if (auto error = validate_volumes(configuration)) return error;
	if (auto error = validate_syncs(configuration)) return error;
	return order_syncs(configuration);
}

std::string endpoint_path(const Configuration &configuration, const SyncEndpoint &endpoint) {
	const std::string &base = volume_path(configuration.volume_of(endpoint));
	if (!endpoint.subdir.has_value() || endpoint.subdir->empty()) return base;
	return base + "/" + *endpoint.subdir;
}

std::vector<SshEndpoint> proxy_chain(const Configuration &configuration, const SshEndpoint &endpoint) {
	std::vector<SshEndpoint> chain;
	for (const std::string &hop : endpoint.proxy_jumps)
		chain.push_back(configuration.ssh_endpoints.at(hop));
	return chain;
}

SnapshotMode snapshot_mode_at(const Configuration &configuration, const SyncEndpoint &endpoint) {
	for (const SyncConfig &sync : configuration.syncs) {
		if (sync.destination == endpoint && sync.snapshots.mode != SnapshotMode::none)
			return sync.snapshots.mode;
	}
	return SnapshotMode::none;
}

ConfigurationPathResult find_configuration_file(
	const std::optional<std::string> &explicit_path,
	const ConfigurationReader &reader
) {
	std::error_code error;
	if (explicit_path.has_value()) {
		const fs::path path = *explicit_path;
		if (!fs::is_regular_file(path, error))
			return make_error(ConfigurationErrorKind::file_not_found, path.string(),
				"Config file not found: " + path.string());
		return path;
	}

	fs::path user_directory;
	if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0')
		user_directory = xdg;
	else if (const char *home = std::getenv("HOME"); home != nullptr)
		user_directory = fs::path(home) / ".config";

	std::vector<fs::path> searched;
	if (!user_directory.empty())
		searched.push_back(user_directory / CONFIG_DIRECTORY_NAME / reader.config_file_name());
	searched.push_back(fs::path(SYSTEM_CONFIG_DIRECTORY) / reader.config_file_name());

	std::string searched_list;
	for (const fs::path &candidate : searched) {
		if (fs::is_regular_file(candidate, error)) return candidate;
		if (!searched_list.empty()) searched_list += ", ";
		searched_list += candidate.string();
	}
	return make_error(ConfigurationErrorKind::file_not_found, "",
		"No config file found. Searched: " + searched_list);
}

/** Performs the high-level configuration loading: file discovery, reading and
 * parsing with the supported reader, and validation.
 * @param explicit_path the path given on the command line, if any
 * @return the finalized configuration, or the first configuration error */
ConfigurationReadResult load_configuration(const std::optional<std::string> &explicit_path) {
	const JsonConfigurationReader reader;
	// add other readers when the program is extended

	const ConfigurationPathResult found = find_configuration_file(explicit_path, reader);
	if (const ConfigurationError *error = std::get_if<ConfigurationError>(&found))
		return *error;

	const fs::path &path = std::get<fs::path>(found);
	std::ifstream stream(path);
	if (!stream.good())
		return make_error(ConfigurationErrorKind::file_not_found, path.string(),
			"Cannot open config file: " + path.string());

	ConfigurationReadResult result = reader.read(stream);
	if (ConfigurationError *error = std::get_if<ConfigurationError>(&result)) {
		if (error->kind == ConfigurationErrorKind::parse_error)
			error->message = "Invalid config in " + path.string() + ": " + error->message;
	}
	return result;
}
