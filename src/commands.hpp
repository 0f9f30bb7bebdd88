#ifndef NBKP_COMMANDS_HPP
#define NBKP_COMMANDS_HPP

#include <chrono>
#include <ostream>

#include "arguments.hpp"
#include "network.hpp"
#include "orchestrator.hpp"
#include "process.hpp"

/** The outside world a command talks to. Tests substitute fakes. */
struct CommandEnvironment {
	ProcessRunner &runner;
	const HostResolver &hosts;
	std::ostream &output;
	Clock clock = [] { return std::chrono::system_clock::now(); };
};

/** Loads the configuration, resolves endpoints and runs the `check`, `run`,
 * `prune` or `sh` command.
 * @return A program-wide exit code. */
int execute_command(const ProgramArguments &arguments, CommandEnvironment &environment);

/** `execute_command` against the real system, printing to `std::cout`. */
int execute_command(const ProgramArguments &arguments);

#endif // NBKP_COMMANDS_HPP
