#ifndef NBKP_OUTPUT_HPP
#define NBKP_OUTPUT_HPP

#include <optional>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

#include "availability.hpp"
#include "configuration/configuration.hpp"
#include "endpoint_resolver.hpp"
#include "orchestrator.hpp"

enum class OutputFormat {
	human,
	json,
};

std::optional<OutputFormat> parse_output_format(const std::string &text);

nlohmann::ordered_json check_report_to_json(
	const CheckReport &report,
	const Configuration &configuration,
	const ResolvedEndpoints &endpoints
);
nlohmann::ordered_json run_report_to_json(const RunReport &report);

void print_check_report(
	std::ostream &stream,
	const CheckReport &report,
	const Configuration &configuration,
	const ResolvedEndpoints &endpoints,
	OutputFormat format
);

void print_run_report(std::ostream &stream, const RunReport &report, OutputFormat format);

void print_prune_report(std::ostream &stream, const RunReport &report, OutputFormat format);

/** A volume as `path` or `[user@]host[:port]:path`. */
std::string format_volume_display(const Volume &volume, const ResolvedEndpoints &endpoints);

#endif // NBKP_OUTPUT_HPP
