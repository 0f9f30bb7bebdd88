#include "arguments.hpp"

#include <iostream>

namespace {

const char *USAGE = "Usage: nbkp [--help] [--version] <check|run|prune|sh> [OPTIONS]";

std::optional<ProgramMode> parse_mode(const std::string &command) {
	if (command == "check") return ProgramMode::check;
	if (command == "run") return ProgramMode::run;
	if (command == "prune") return ProgramMode::prune;
	if (command == "sh") return ProgramMode::script;
	return std::nullopt;
}

const char *mode_to_string(const ProgramMode mode) {
	switch (mode) {
		case ProgramMode::help: return "help";
		case ProgramMode::version: return "version";
		case ProgramMode::check: return "check";
		case ProgramMode::run: return "run";
		case ProgramMode::prune: return "prune";
		case ProgramMode::script: return "sh";
		case ProgramMode::test: return "test";
	}
	return "unknown";
}

const char *flag_to_string(const bool enabled) {
	return enabled ? "enabled" : "disabled";
}

}

std::optional<ProgramArguments> ProgramArguments::try_parse(const std::vector<std::string> &arguments) {
	ProgramArguments result;
	if (!result.try_parse_impl(arguments))
		return std::nullopt;
	return result;
}

bool ProgramArguments::try_parse_impl(const std::vector<std::string> &arguments) {
	if (arguments.size() < 2) {
		std::cerr << "Error: Too few arguments." << std::endl;
		std::cerr << USAGE << std::endl;
		return false;
	}

	auto arg_iter = arguments.begin();
	executable = *(arg_iter++);

	const std::string &command = *arg_iter;
	if (command == "-h" || command == "--help") {
		mode = ProgramMode::help;
		return true;
	}
	if (command == "--version") {
		mode = ProgramMode::version;
		return true;
	}
	if (command == "--test") {
		mode = ProgramMode::test;
		return true;
	}
	const std::optional<ProgramMode> parsed_mode = parse_mode(command);
	if (!parsed_mode.has_value()) {
		std::cerr << "Error: unknown command '" << command << "'." << std::endl;
		std::cerr << USAGE << std::endl;
		return false;
	}
	mode = *parsed_mode;
	++arg_iter;

	// fetches the value of an option such as `--config FILE`
	auto value_of = [&](const std::string &option) -> std::optional<std::string> {
		if (++arg_iter == arguments.end()) {
			std::cerr << "Error: " << option << " requires a value." << std::endl;
			return std::nullopt;
		}
		return *arg_iter;
	};

	bool private_network = false;
	bool public_network = false;
	for (; arg_iter != arguments.end(); ++arg_iter) {
		const std::string argument = *arg_iter;

		if (argument == "-h" || argument == "--help") {
			mode = ProgramMode::help;
			return true;
		} else if (argument == "-v" || argument == "--verbose") {
			verbose = true;
		} else if (argument == "-n" || argument == "--dry-run") {
			dry_run = true;
		} else if (argument == "--no-prune") {
			prune = false;
		} else if (argument == "--private") {
			private_network = true;
		} else if (argument == "--public") {
			public_network = true;
		} else if (argument == "-c" || argument == "--config") {
			const auto value = value_of(argument);
			if (!value.has_value()) return false;
			config_path = *value;
		} else if (argument == "--output") {
			const auto value = value_of(argument);
			if (!value.has_value()) return false;
			const auto format = parse_output_format(*value);
			if (!format.has_value()) {
				std::cerr << "Error: unknown output format '" << *value << "' (expected human or json)." << std::endl;
				return false;
			}
			output_format = *format;
		} else if (argument == "--progress") {
			const auto value = value_of(argument);
			if (!value.has_value()) return false;
			const auto parsed = parse_progress_mode(*value);
			if (!parsed.has_value()) {
				std::cerr << "Error: unknown progress mode '" << *value
					<< "' (expected none, overall, per-file or full)." << std::endl;
				return false;
			}
			progress = *parsed;
		} else if (argument == "-s" || argument == "--sync") {
			const auto value = value_of(argument);
			if (!value.has_value()) return false;
			sync_patterns.push_back(*value);
		} else if (argument == "-l" || argument == "--location") {
			const auto value = value_of(argument);
			if (!value.has_value()) return false;
			endpoint_filter.location = *value;
		} else if (argument == "-o" || argument == "--output-file") {
			const auto value = value_of(argument);
			if (!value.has_value()) return false;
			script_path = *value;
		} else {
			std::cerr << "Error: unknown option '" << argument << "'." << std::endl;
			std::cerr << USAGE << std::endl;
			return false;
		}
	}

	// perform flag compatibility check
	if (private_network && public_network) {
		std::cerr << "Error: --private and --public are mutually exclusive." << std::endl;
		return false;
	}
	if (private_network) endpoint_filter.network = NetworkPreference::private_network;
	if (public_network) endpoint_filter.network = NetworkPreference::public_network;

	if (script_path.has_value() && mode != ProgramMode::script)
		std::cerr << "Warning: --output-file is only used by the sh command." << std::endl;
	if (dry_run && (mode == ProgramMode::check || mode == ProgramMode::script))
		std::cerr << "Warning: --dry-run is ignored by the " << mode_to_string(mode) << " command." << std::endl;
	if (!prune && mode != ProgramMode::run)
		std::cerr << "Warning: --no-prune is only used by the run command." << std::endl;
	return true;
}

void ProgramArguments::print(std::ostream &stream) const {
	stream << "Command: " << mode_to_string(mode) << std::endl;
	stream << "Flags: " << std::endl;
	stream << "    verbose: " << flag_to_string(verbose) << std::endl;
	stream << "    dry run: " << flag_to_string(dry_run) << std::endl;
	stream << "    prune: " << flag_to_string(prune) << std::endl;
	stream << "    progress: " << to_string(progress) << std::endl;
	stream << "Config: " << config_path.value_or("(searched)") << std::endl;
	stream << "Location: " << endpoint_filter.location.value_or("(any)") << std::endl;
	stream << "Network: " << to_string(endpoint_filter.network) << std::endl;
	stream << "Syncs:";
	if (sync_patterns.empty()) stream << " (all)";
	for (const std::string &pattern : sync_patterns)
		stream << ' ' << pattern;
	stream << std::endl;
}
