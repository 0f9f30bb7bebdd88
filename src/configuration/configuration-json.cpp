#include "configuration-json.hpp"

#include <algorithm>
#include <map>
#include <sstream>
#include <utility>

using Json = nlohmann::ordered_json;

namespace {

const char *CONFIGURATION_VERSION_KEY = "config-version";
const char *EXTENDS_KEY = "extends";
const char *CONNECTION_OPTIONS_KEY = "connection-options";
const char *PROXY_JUMP_KEY = "proxy-jump";
const char *PROXY_JUMPS_KEY = "proxy-jumps";

/** Carries a structured error out of the nested `from_json` calls. */
class ConfigurationException {
	ConfigurationError error;

	public:
	ConfigurationException(const ConfigurationErrorKind kind, const std::string &subject, const std::string &message)
		: error{kind, subject, message, {}} {}
	explicit ConfigurationException(ConfigurationError error) : error(std::move(error)) {}

	const ConfigurationError &get_error() const { return error; }
};

const Json &require(const Json &j, const char *key, const std::string &subject) {
	if (!j.is_object() || !j.contains(key))
		throw ConfigurationException(ConfigurationErrorKind::missing_field, subject,
			"'" + subject + "' is missing required field '" + key + "'");
	return j.at(key);
}

std::string require_string(const Json &j, const char *key, const std::string &subject) {
	return require(j, key, subject).get<std::string>();
}

std::optional<std::string> optional_string(const Json &j, const char *key) {
	if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
	return j.at(key).get<std::string>();
}

template <typename T>
void get_if_present(const Json &j, const char *key, T &value) {
	if (j.contains(key) && !j.at(key).is_null())
		j.at(key).get_to(value);
}

template <typename T>
void get_if_present(const Json &j, const char *key, std::optional<T> &value) {
	if (j.contains(key) && !j.at(key).is_null())
		value = j.at(key).get<T>();
}

Version parse_version(const Json &j) {
	if (j.is_string()) {
		std::size_t major = 0, minor = 0, patch = 0;
		char dot1 = '.', dot2 = '.';
		std::istringstream stream(j.get<std::string>());
		stream >> major >> dot1 >> minor >> dot2 >> patch;
		if (stream.fail() || dot1 != '.' || dot2 != '.')
			throw ConfigurationException(ConfigurationErrorKind::invalid_value, CONFIGURATION_VERSION_KEY,
				"Malformed config-version '" + j.get<std::string>() + "'");
		return Version{major, minor, patch};
	}
	return Version{
		j.at("major").get<std::size_t>(),
		j.at("minor").get<std::size_t>(),
		j.at("patch").get<std::size_t>(),
	};
}

}

void from_json(const Json &j, ConnectionOptions &p) {
	get_if_present(j, "connect-timeout", p.connect_timeout);
	get_if_present(j, "compress", p.compress);
	get_if_present(j, "server-alive-interval", p.server_alive_interval);
	get_if_present(j, "strict-host-key-checking", p.strict_host_key_checking);
	get_if_present(j, "known-hosts-file", p.known_hosts_file);
	get_if_present(j, "forward-agent", p.forward_agent);
}

void from_json(const Json &j, RsyncOptions &p) {
	get_if_present(j, "default-options-override", p.default_options_override);
	get_if_present(j, "extra-options", p.extra_options);
	get_if_present(j, "checksum", p.checksum);
	get_if_present(j, "compress", p.compress);
}

namespace {

/** Applies `extends` recursively: keys the child leaves unset take the
 * parent's value. `connection-options` is merged one level deep. */
Json materialize_endpoint(
	const std::string &slug,
	const Json &endpoints,
	std::map<std::string, Json> &materialized,
	std::vector<std::string> &chain
) {
	if (const auto done = materialized.find(slug); done != materialized.end())
		return done->second;

	if (std::find(chain.begin(), chain.end(), slug) != chain.end()) {
		ConfigurationError error{
			ConfigurationErrorKind::cyclic_extends,
			slug,
			"Circular extends chain detected",
			{std::find(chain.begin(), chain.end(), slug), chain.end()}
		};
		error.cycle.push_back(slug);
		throw ConfigurationException(std::move(error));
	}

	const Json &own = endpoints.at(slug);
	if (!own.is_object())
		throw ConfigurationException(ConfigurationErrorKind::invalid_value, slug,
			"Endpoint '" + slug + "' must be an object");
	if (own.contains(PROXY_JUMP_KEY) && own.contains(PROXY_JUMPS_KEY))
		throw ConfigurationException(ConfigurationErrorKind::conflicting_options, slug,
			"Endpoint '" + slug + "' sets both proxy-jump and proxy-jumps");

	if (!own.contains(EXTENDS_KEY)) {
		materialized[slug] = own;
		return own;
	}

	const std::string parent_slug = own.at(EXTENDS_KEY).get<std::string>();
	if (!endpoints.contains(parent_slug))
		throw ConfigurationException(ConfigurationErrorKind::unknown_reference, slug,
			"Endpoint '" + slug + "' extends unknown endpoint '" + parent_slug + "'");

	chain.push_back(slug);
	Json merged = materialize_endpoint(parent_slug, endpoints, materialized, chain);
	chain.pop_back();

	if (own.contains(PROXY_JUMP_KEY) || own.contains(PROXY_JUMPS_KEY)) {
		merged.erase(PROXY_JUMP_KEY);
		merged.erase(PROXY_JUMPS_KEY);
	}
	for (const auto &[key, value] : own.items()) {
		if (key == EXTENDS_KEY) continue;
		if (key == CONNECTION_OPTIONS_KEY && merged.contains(key) && merged.at(key).is_object()) {
			merged[key].update(value);
			continue;
		}
		merged[key] = value;
	}
	merged.erase(EXTENDS_KEY);

	materialized[slug] = merged;
	return merged;
}

SshEndpoint parse_endpoint(const std::string &slug, const Json &j) {
	SshEndpoint endpoint;
	endpoint.slug = slug;
	endpoint.host = require_string(j, "host", slug);
	get_if_present(j, "port", endpoint.port);
	endpoint.user = optional_string(j, "user");
	endpoint.key = optional_string(j, "key");
	endpoint.location = optional_string(j, "location");
	get_if_present(j, CONNECTION_OPTIONS_KEY, endpoint.connection_options);

	if (const auto jump = optional_string(j, PROXY_JUMP_KEY))
		endpoint.proxy_jumps.push_back(*jump);
	else
		get_if_present(j, PROXY_JUMPS_KEY, endpoint.proxy_jumps);
	return endpoint;
}

Volume parse_volume(const std::string &slug, const Json &j) {
	const std::string type = require_string(j, "type", slug);
	if (type == "local")
		return LocalVolume{slug, require_string(j, "path", slug)};

	if (type == "remote") {
		RemoteVolume volume;
		volume.slug = slug;
		volume.ssh_endpoint = require_string(j, "ssh-endpoint", slug);
		get_if_present(j, "ssh-endpoints", volume.ssh_endpoints);
		volume.path = require_string(j, "path", slug);
		return volume;
	}

	throw ConfigurationException(ConfigurationErrorKind::invalid_value, slug,
		"Volume '" + slug + "' has unknown type '" + type + "'");
}

SyncEndpoint parse_sync_endpoint(const Json &j, const std::string &subject) {
	return SyncEndpoint{require_string(j, "volume", subject), optional_string(j, "subdir")};
}

/** Reads `{"enabled": bool, "max-snapshots": int}` of one strategy.
 * Returns no value if the strategy is absent or disabled. */
std::optional<std::optional<int>> parse_strategy(const Json &destination, const char *key) {
	if (!destination.contains(key)) return std::nullopt;

	const Json &strategy = destination.at(key);
	bool enabled = false;
	get_if_present(strategy, "enabled", enabled);
	if (!enabled) return std::nullopt;

	std::optional<int> max_snapshots;
	get_if_present(strategy, "max-snapshots", max_snapshots);
	return std::make_optional(max_snapshots);
}

std::string parse_filter(const Json &j, const std::string &subject) {
	if (j.is_string()) return j.get<std::string>();
	if (j.is_object() && j.size() == 1) {
		if (j.contains("include")) return "+ " + j.at("include").get<std::string>();
		if (j.contains("exclude")) return "- " + j.at("exclude").get<std::string>();
	}
	throw ConfigurationException(ConfigurationErrorKind::invalid_value, subject,
		"Sync '" + subject + "' has a filter that is neither a string nor an include/exclude rule");
}

SyncConfig parse_sync(const std::string &slug, const Json &j) {
	SyncConfig sync;
	sync.slug = slug;
	sync.source = parse_sync_endpoint(require(j, "source", slug), slug);

	const Json &destination = require(j, "destination", slug);
	sync.destination = parse_sync_endpoint(destination, slug);

	const auto btrfs = parse_strategy(destination, "btrfs-snapshots");
	const auto hard_link = parse_strategy(destination, "hard-link-snapshots");
	if (btrfs.has_value() && hard_link.has_value())
		throw ConfigurationException(ConfigurationErrorKind::conflicting_options, slug,
			"Sync '" + slug + "' enables both btrfs-snapshots and hard-link-snapshots");
	if (btrfs.has_value())
		sync.snapshots = SnapshotConfig{SnapshotMode::btrfs, *btrfs};
	else if (hard_link.has_value())
		sync.snapshots = SnapshotConfig{SnapshotMode::hard_link, *hard_link};

	get_if_present(j, "enabled", sync.enabled);
	get_if_present(j, "rsync-options", sync.rsync_options);
	if (j.contains("filters")) {
		for (const Json &filter : j.at("filters"))
			sync.filters.push_back(parse_filter(filter, slug));
	}
	sync.filter_file = optional_string(j, "filter-file");
	return sync;
}

Configuration parse_configuration(const Json &json) {
	if (!json.is_object())
		throw ConfigurationException(ConfigurationErrorKind::parse_error, "",
			"The configuration root must be an object");

	Configuration configuration;
	if (json.contains(CONFIGURATION_VERSION_KEY)) {
		configuration.config_version = parse_version(json.at(CONFIGURATION_VERSION_KEY));
		if (!configuration.config_version.is_compatible_with(PROGRAM_VERSION)) {
			std::ostringstream message;
			message << "Configuration version " << configuration.config_version
				<< " is incompatible with program version " << PROGRAM_VERSION;
			throw ConfigurationException(ConfigurationErrorKind::version_incompatible,
				CONFIGURATION_VERSION_KEY, message.str());
		}
	}

	if (json.contains("ssh-endpoints")) {
		const Json &endpoints = json.at("ssh-endpoints");
		std::map<std::string, Json> materialized;
		for (const auto &[slug, value] : endpoints.items()) {
			std::vector<std::string> chain;
			const Json effective = materialize_endpoint(slug, endpoints, materialized, chain);
			configuration.ssh_endpoints[slug] = parse_endpoint(slug, effective);
		}
	}

	if (json.contains("volumes")) {
		for (const auto &[slug, value] : json.at("volumes").items())
			configuration.volumes.emplace(slug, parse_volume(slug, value));
	}

	if (json.contains("syncs")) {
		for (const auto &[slug, value] : json.at("syncs").items())
			configuration.syncs.push_back(parse_sync(slug, value));
	}

	return configuration;
}

}

ConfigurationReadResult parse_json_configuration(const std::string &text) {
	std::istringstream stream(text);
	return JsonConfigurationReader().read(stream);
}

ConfigurationReadResult JsonConfigurationReader::read(std::istream &input) const {
	Configuration configuration;
	try {
		const Json json = Json::parse(input);
		configuration = parse_configuration(json);
	} catch (const ConfigurationException &exception) {
		return exception.get_error();
	} catch (const Json::exception &exception) {
		return ConfigurationError{ConfigurationErrorKind::parse_error, "", exception.what(), {}};
	}

	if (auto error = finalize_configuration(configuration))
		return *error;
	return configuration;
}
