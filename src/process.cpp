#include "process.hpp"

#include <cerrno>
#include <cstring>
#include <string_view>
#include <vector>

#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

void close_pipe(int (&descriptors)[2]) {
	if (descriptors[0] >= 0) close(descriptors[0]);
	if (descriptors[1] >= 0) close(descriptors[1]);
	descriptors[0] = descriptors[1] = -1;
}

/** Drains both pipes until the child closes them. Polling avoids a deadlock
 * when the child fills one pipe while we block on the other.
 * With a sink, standard output is forwarded as it arrives and both streams
 * are cut down to their tails. */
void read_streams(const int output_fd, const int error_fd, ProcessResult &result, const OutputSink *on_output) {
	pollfd descriptors[2] = {
		{output_fd, POLLIN, 0},
		{error_fd, POLLIN, 0},
	};
	std::string *targets[2] = {&result.output, &result.error_output};
	int open_streams = 2;

	char buffer[4096];
	while (open_streams > 0) {
		if (poll(descriptors, 2, -1) < 0) {
			if (errno == EINTR) continue;
			break;
		}

		for (int i = 0; i < 2; ++i) {
			if (descriptors[i].fd < 0 || descriptors[i].revents == 0) continue;

			const ssize_t count = read(descriptors[i].fd, buffer, sizeof(buffer));
			if (count > 0) {
				targets[i]->append(buffer, static_cast<std::size_t>(count));
				if (on_output != nullptr) {
					if (i == 0) (*on_output)(std::string_view(buffer, static_cast<std::size_t>(count)));
					keep_tail(*targets[i]);
				}
				continue;
			}
			if (count < 0 && errno == EINTR) continue;

			descriptors[i].fd = -1;
			--open_streams;
		}
	}
}

}

void keep_tail(std::string &text) {
	if (text.size() > OUTPUT_TAIL_LIMIT)
		text.erase(0, text.size() - OUTPUT_TAIL_LIMIT);
}

ProcessResult ProcessRunner::run_streaming(const Command &command, const OutputSink &on_output) {
	ProcessResult result = run(command);
	if (!result.output.empty())
		on_output(result.output);
	keep_tail(result.output);
	keep_tail(result.error_output);
	return result;
}

ProcessResult SystemProcessRunner::run(const Command &command) {
	return spawn(command, nullptr);
}

ProcessResult SystemProcessRunner::run_streaming(const Command &command, const OutputSink &on_output) {
	return spawn(command, &on_output);
}

ProcessResult SystemProcessRunner::spawn(const Command &command, const OutputSink *on_output) {
	ProcessResult result;
	if (command.empty()) {
		result.error_output = "empty command";
		return result;
	}

	int output_pipe[2] = {-1, -1};
	int error_pipe[2] = {-1, -1};
	if (pipe(output_pipe) != 0 || pipe(error_pipe) != 0) {
		result.error_output = std::string("pipe: ") + std::strerror(errno);
		close_pipe(output_pipe);
		close_pipe(error_pipe);
		return result;
	}

	// prepare the argument vector before forking
	std::vector<char *> arguments;
	arguments.reserve(command.size() + 1);
	for (const std::string &argument : command)
		arguments.push_back(const_cast<char *>(argument.c_str()));
	arguments.push_back(nullptr);

	const pid_t pid = fork();
	if (pid < 0) {
		result.error_output = std::string("fork: ") + std::strerror(errno);
		close_pipe(output_pipe);
		close_pipe(error_pipe);
		return result;
	}

	if (pid == 0) {
		dup2(output_pipe[1], STDOUT_FILENO);
		dup2(error_pipe[1], STDERR_FILENO);
		close_pipe(output_pipe);
		close_pipe(error_pipe);

		execvp(arguments[0], arguments.data());
		_exit(EXIT_CODE_COMMAND_NOT_FOUND);
	}

	close(output_pipe[1]);
	close(error_pipe[1]);
	read_streams(output_pipe[0], error_pipe[0], result, on_output);
	close(output_pipe[0]);
	close(error_pipe[0]);

	int status = 0;
	while (waitpid(pid, &status, 0) < 0) {
		if (errno != EINTR) {
			result.error_output += std::string("waitpid: ") + std::strerror(errno);
			return result;
		}
	}

	if (WIFEXITED(status))
		result.exit_code = WEXITSTATUS(status);
	else if (WIFSIGNALED(status))
		result.exit_code = 128 + WTERMSIG(status);

	if (result.exit_code == EXIT_CODE_COMMAND_NOT_FOUND && result.error_output.empty())
		result.error_output = "command not found: " + command.front();
	return result;
}
