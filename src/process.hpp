#ifndef NBKP_PROCESS_HPP
#define NBKP_PROCESS_HPP

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

#include "shell.hpp"

constexpr int EXIT_CODE_COMMAND_NOT_FOUND = 127;

// what a streaming run keeps of each output stream
constexpr std::size_t OUTPUT_TAIL_LIMIT = 64 * 1024;

using OutputSink = std::function<void(std::string_view)>;

struct ProcessResult {
	int exit_code = -1;
	std::string output;
	std::string error_output;

	bool succeeded() const { return exit_code == 0; }
};

/** Runs external commands. The core never spawns processes directly,
 * so tests can substitute a recording or simulating runner. */
class ProcessRunner {
	public:
	virtual ProcessResult run(const Command &command) = 0;

	/** Like `run`, but hands standard output to `on_output` as it arrives
	 * and keeps only the last OUTPUT_TAIL_LIMIT bytes of each stream.
	 * The default delivers the output in one piece once the command exits. */
	virtual ProcessResult run_streaming(const Command &command, const OutputSink &on_output);

	virtual ~ProcessRunner() = default;
};

/** Spawns the command with fork/execvp, capturing both output streams. */
class SystemProcessRunner final : public ProcessRunner {
	public:
	ProcessResult run(const Command &command) override;
	ProcessResult run_streaming(const Command &command, const OutputSink &on_output) override;

	private:
	ProcessResult spawn(const Command &command, const OutputSink *on_output);
};

/** Drops the front of `text` beyond OUTPUT_TAIL_LIMIT bytes. */
void keep_tail(std::string &text);

#endif // NBKP_PROCESS_HPP
