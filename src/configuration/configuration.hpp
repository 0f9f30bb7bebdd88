#ifndef NBKP_CONFIGURATION_HPP
#define NBKP_CONFIGURATION_HPP

#include <filesystem>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "../constants.hpp"
#include "../errors.hpp"

/** Secure-channel connection options, mapped to `ssh -o` options. */
struct ConnectionOptions {
	int connect_timeout = DEFAULT_CONNECT_TIMEOUT;
	bool compress = false;
	std::optional<int> server_alive_interval;
	bool strict_host_key_checking = true;
	std::optional<std::string> known_hosts_file;
	bool forward_agent = false;

	bool operator==(const ConnectionOptions &) const = default;
};

/** A fully materialized SSH endpoint: `extends` inheritance is already
 * applied, so every field holds its effective value. */
struct SshEndpoint {
	std::string slug;
	std::string host;
	int port = DEFAULT_SSH_PORT;
	std::optional<std::string> user;
	std::optional<std::string> key;
	std::optional<std::string> location;
	ConnectionOptions connection_options;
	// ordered bastion chain; `proxy-jump` is stored as a single-element chain
	std::vector<std::string> proxy_jumps;
};

struct LocalVolume {
	std::string slug;
	std::string path;
};

struct RemoteVolume {
	std::string slug;
	std::string ssh_endpoint;
	std::vector<std::string> ssh_endpoints;
	std::string path;

	/** The ordered candidate endpoints, or the primary one alone. */
	std::vector<std::string> candidates() const {
		if (ssh_endpoints.empty()) return {ssh_endpoint};
		return ssh_endpoints;
	}
};

using Volume = std::variant<LocalVolume, RemoteVolume>;

const std::string &volume_slug(const Volume &volume);
const std::string &volume_path(const Volume &volume);

/** A sync side: a volume plus an optional sub-directory inside it. */
struct SyncEndpoint {
	std::string volume;
	std::optional<std::string> subdir;

	bool operator==(const SyncEndpoint &) const = default;
};

enum class SnapshotMode {
	none,
	btrfs,
	hard_link,
};

const char *to_string(SnapshotMode mode);

struct SnapshotConfig {
	SnapshotMode mode = SnapshotMode::none;
	// unlimited if unset
	std::optional<int> max_snapshots;
};

struct RsyncOptions {
	std::optional<std::vector<std::string>> default_options_override;
	std::vector<std::string> extra_options;
	bool checksum = false;
	bool compress = false;
};

struct SyncConfig {
	std::string slug;
	SyncEndpoint source;
	SyncEndpoint destination;
	bool enabled = true;
	SnapshotConfig snapshots;
	RsyncOptions rsync_options;
	// normalized rsync filter rules, in declaration order
	std::vector<std::string> filters;
	std::optional<std::string> filter_file;
};

/** The validated, immutable configuration of one invocation. */
struct Configuration {
	Version config_version = PROGRAM_VERSION;
	std::map<std::string, SshEndpoint> ssh_endpoints;
	std::map<std::string, Volume> volumes;
	// declaration order
	std::vector<SyncConfig> syncs;
	// dependency order, filled by `finalize_configuration`
	std::vector<std::string> execution_order;

	const SyncConfig *find_sync(const std::string &slug) const;
	const Volume &volume_of(const SyncEndpoint &endpoint) const { return volumes.at(endpoint.volume); }
};

bool is_valid_slug(const std::string &slug);

/** Checks slugs, ports, cross-references, proxy-jump cycles and sync
 * dependency cycles, then computes the execution order.
 * Every `Configuration` must pass through here before it is used. */
std::optional<ConfigurationError> finalize_configuration(Configuration &configuration);

/** The effective path of a sync side: the volume path plus the sub-directory. */
std::string endpoint_path(const Configuration &configuration, const SyncEndpoint &endpoint);

/** The bastion chain of `endpoint`, as endpoint records, first hop first. */
std::vector<SshEndpoint> proxy_chain(const Configuration &configuration, const SshEndpoint &endpoint);

/** The snapshot mode of the sync writing into `endpoint`, if any.
 * A sync reading from such an endpoint transfers from its `latest/`. */
SnapshotMode snapshot_mode_at(const Configuration &configuration, const SyncEndpoint &endpoint);

using ConfigurationReadResult = std::variant<Configuration, ConfigurationError>;

/** An abstract reader and parser of the configuration file.
 * If you want to support a new file format, create a descendant class and implement
 * its virtual functions. Results are already finalized. */
class ConfigurationReader {
	public:
	virtual ConfigurationReadResult read(std::istream &input) const = 0;

	/** Gets the file name looked up in the configuration directories.
	 * Example: config.json for JSON format. */
	virtual const char *config_file_name() const = 0;

	virtual ~ConfigurationReader() = default;
};

using ConfigurationPathResult = std::variant<std::filesystem::path, ConfigurationError>;

/** Finds the configuration file: the explicit path if given, otherwise
 * `$XDG_CONFIG_HOME/nbkp/<file>` (default `~/.config`), then `/etc/nbkp/<file>`. */
ConfigurationPathResult find_configuration_file(
	const std::optional<std::string> &explicit_path,
	const ConfigurationReader &reader
);

/** Finds, reads, parses and validates the configuration. */
ConfigurationReadResult load_configuration(const std::optional<std::string> &explicit_path);

#endif // NBKP_CONFIGURATION_HPP
