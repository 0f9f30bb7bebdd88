#include "commands.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include "availability.hpp"
#include "constants.hpp"
#include "endpoint_resolver.hpp"
#include "output.hpp"
#include "scriptgen.hpp"
#include "sync_selection.hpp"

namespace {

int configuration_exit_code(const ConfigurationError &error) {
	if (error.kind == ConfigurationErrorKind::version_incompatible)
		return EXIT_CODE_CONFIG_VERSION_INCOMPATIBLE;
	return EXIT_CODE_CONFIGURATION_ERROR;
}

void report_unreachable_volumes(const ResolvedEndpoints &endpoints) {
	for (const auto &[volume, resolution] : endpoints) {
		if (const auto *failure = std::get_if<NoReachableEndpoint>(&resolution))
			std::cerr << "Warning: " << describe(*failure) << std::endl;
	}
}

int write_script(const ProgramArguments &arguments, const std::string &script, std::ostream &output) {
	if (!arguments.get_script_path().has_value()) {
		output << script;
		return EXIT_CODE_SUCCESS;
	}

	const std::string &path = *arguments.get_script_path();
	std::ofstream file(path);
	file << script;
	file.close();
	if (!file) {
		std::cerr << "Error: Failed to write the script to '" << path << "'." << std::endl;
		return EXIT_CODE_FILESYSTEM_ERROR;
	}

	std::error_code error;
	std::filesystem::permissions(path,
		std::filesystem::perms::owner_exec | std::filesystem::perms::group_exec | std::filesystem::perms::others_exec,
		std::filesystem::perm_options::add, error);
	if (error)
		std::cerr << "Warning: Failed to make '" << path << "' executable: " << error.message() << std::endl;
	if (arguments.is_verbose())
		std::cout << "Script written to '" << path << "'." << std::endl;
	return EXIT_CODE_SUCCESS;
}

}

int execute_command(const ProgramArguments &arguments, CommandEnvironment &environment) {
	if (arguments.is_verbose())
		arguments.print(std::cout);

	ConfigurationReadResult loaded = load_configuration(arguments.get_config_path());
	if (const auto *error = std::get_if<ConfigurationError>(&loaded)) {
		std::cerr << "Error: " << describe(*error) << std::endl;
		return configuration_exit_code(*error);
	}
	const Configuration &configuration = std::get<Configuration>(loaded);

	const SyncSelection selection = select_syncs(configuration, arguments.get_sync_patterns());
	if (const auto *unmatched = std::get_if<UnmatchedPattern>(&selection)) {
		std::cerr << "Error: no sync matches '" << unmatched->pattern << "'." << std::endl;
		return EXIT_CODE_INCORRECT_USAGE;
	}
	const std::vector<std::string> &only_syncs = std::get<std::vector<std::string>>(selection);

	const EndpointResolver resolver(configuration, environment.hosts, arguments.get_endpoint_filter());
	const ResolvedEndpoints endpoints = resolver.resolve_all();
	if (arguments.is_verbose())
		report_unreachable_volumes(endpoints);

	if (arguments.get_mode() == ProgramMode::script) {
		ScriptOptions options;
		options.config_path = arguments.get_config_path();
		options.only_syncs = only_syncs;
		const std::string script = generate_script(configuration, endpoints, environment.clock(), options);
		return write_script(arguments, script, environment.output);
	}

	AvailabilityChecker checker(configuration, endpoints, environment.runner);

	if (arguments.get_mode() == ProgramMode::check) {
		const CheckReport report = check_all(checker, configuration, only_syncs);
		print_check_report(environment.output, report, configuration, endpoints, arguments.get_output_format());
		return report.all_active() ? EXIT_CODE_SUCCESS : EXIT_CODE_SYNC_FAILED;
	}

	RunOptions options;
	options.dry_run = arguments.is_dry_run();
	options.prune = arguments.should_prune();
	options.verbose = arguments.is_verbose();
	options.progress = arguments.get_progress();
	options.only_syncs = only_syncs;
	options.clock = environment.clock;
	SyncOrchestrator orchestrator(configuration, endpoints, environment.runner, checker, options);

	if (arguments.get_mode() == ProgramMode::prune) {
		const RunReport report = orchestrator.prune();
		print_prune_report(environment.output, report, arguments.get_output_format());
		return report.exit_code();
	}

	const RunReport report = orchestrator.run();
	print_run_report(environment.output, report, arguments.get_output_format());
	return report.exit_code();
}

int execute_command(const ProgramArguments &arguments) {
	SystemProcessRunner runner;
	const SystemHostResolver hosts;
	CommandEnvironment environment{runner, hosts, std::cout};
	return execute_command(arguments, environment);
}
