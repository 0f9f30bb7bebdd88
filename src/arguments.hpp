#ifndef NBKP_ARGUMENTS_HPP
#define NBKP_ARGUMENTS_HPP

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "endpoint_resolver.hpp"
#include "output.hpp"
#include "rsync_command.hpp"

/** The program sub-command. */
enum class ProgramMode {
	help,
	version,
	check,
	run,
	prune,
	script,
	test,
};

class ProgramArguments {
	std::string executable;
	ProgramMode mode = ProgramMode::help;
	bool verbose = false;
	bool dry_run = false;
	bool prune = true;

	std::optional<std::string> config_path;
	OutputFormat output_format = OutputFormat::human;
	ProgressMode progress = ProgressMode::none;
	EndpointFilter endpoint_filter;
	std::vector<std::string> sync_patterns;

	// `sh` only; standard output if not set
	std::optional<std::string> script_path;

	public:
	// PUBLIC GETTERS:

	const std::string &get_executable() const { return executable; }
	ProgramMode get_mode() const { return mode; }
	bool is_verbose() const { return verbose; }
	bool is_dry_run() const { return dry_run; }
	bool should_prune() const { return prune; }

	const std::optional<std::string> &get_config_path() const { return config_path; }
	OutputFormat get_output_format() const { return output_format; }
	ProgressMode get_progress() const { return progress; }
	const EndpointFilter &get_endpoint_filter() const { return endpoint_filter; }
	const std::vector<std::string> &get_sync_patterns() const { return sync_patterns; }
	const std::optional<std::string> &get_script_path() const { return script_path; }

	void print(std::ostream &stream) const;

	/** Tries to parse the command line, executable name included.
	 * Prints the problem to `std::cerr` and returns no value on incorrect usage. */
	static std::optional<ProgramArguments> try_parse(
		const std::vector<std::string> &arguments
	);

	private:
	bool try_parse_impl(const std::vector<std::string> &arguments);

	// private constructor disallows creating default instances
	// outside this class
	ProgramArguments() = default;
};

#endif // NBKP_ARGUMENTS_HPP
