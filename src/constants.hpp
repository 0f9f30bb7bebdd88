#ifndef NBKP_CONSTANTS_HPP
#define NBKP_CONSTANTS_HPP

#include <compare>
#include <cstddef>
#include <ostream>

constexpr int EXIT_CODE_SUCCESS = 0;
constexpr int EXIT_CODE_INCORRECT_USAGE = 1;
constexpr int EXIT_CODE_SYNC_FAILED = 2;
constexpr int EXIT_CODE_FILESYSTEM_ERROR = 3;
constexpr int EXIT_CODE_CONFIGURATION_ERROR = 4;
constexpr int EXIT_CODE_CONFIG_VERSION_INCOMPATIBLE = 5;

// presence-only sentinel files
constexpr char VOLUME_MARKER[] = ".nbkp-vol";
constexpr char SOURCE_MARKER[] = ".nbkp-src";
constexpr char DESTINATION_MARKER[] = ".nbkp-dst";

constexpr char CONFIG_FILE_NAME[] = "config.json";
constexpr char CONFIG_DIRECTORY_NAME[] = "nbkp";
constexpr char SYSTEM_CONFIG_DIRECTORY[] = "/etc/nbkp";

constexpr int DEFAULT_SSH_PORT = 22;
constexpr int DEFAULT_CONNECT_TIMEOUT = 10;

/** Release of nbkp, and the release a configuration file was written for. */
struct Version {
	std::size_t major = 0;
	std::size_t minor = 0;
	std::size_t patch = 0;

	std::strong_ordering operator<=>(const Version &) const = default;

	/** A configuration loads in a program of the same major release that is at
	 * least as new. Before 1.0.0 only the exact release loads. */
	constexpr bool is_compatible_with(const Version &program) const {
		if (major != program.major) return false;
		if (major == 0) return *this == program;
		return *this <= program;
	}
};

inline std::ostream &operator<<(std::ostream &stream, const Version &version) {
	return stream << version.major << '.' << version.minor << '.' << version.patch;
}

constexpr Version PROGRAM_VERSION{1, 0, 0};

#endif // NBKP_CONSTANTS_HPP
