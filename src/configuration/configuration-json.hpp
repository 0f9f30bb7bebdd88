#ifndef NBKP_CONFIGURATION_JSON_HPP
#define NBKP_CONFIGURATION_JSON_HPP

#include <istream>
#include <string>

#include <nlohmann/json.hpp>

#include "configuration.hpp"

/** Reads the JSON configuration format. Keys are kebab-case; endpoints,
 * volumes and syncs are objects keyed by slug, parsed with `ordered_json`
 * so the declaration order of syncs is kept. */
class JsonConfigurationReader final : public ConfigurationReader {
	public:
	ConfigurationReadResult read(std::istream &input) const override;

	const char *config_file_name() const override {
		return CONFIG_FILE_NAME;
	}

	virtual ~JsonConfigurationReader() = default;
};

/** Parses a configuration from JSON text. */
ConfigurationReadResult parse_json_configuration(const std::string &text);

#endif // NBKP_CONFIGURATION_JSON_HPP
