#include "test_support.hpp"

#undef NDEBUG
#include <algorithm>
#include <cassert>
#include <fstream>
#include <iostream>
#include <sstream>
#include <variant>

#include "../configuration/configuration-json.hpp"
#include "../errors.hpp"

void create_file(const fs::path &path, const std::string &content) {
	fs::create_directories(path.parent_path());
	std::ofstream file(path);
	file << content;
}

std::string read_file(const fs::path &path) {
	std::ifstream file(path);
	std::stringstream content;
	content << file.rdbuf();
	return content.str();
}

bool file_content_equals(const fs::path &file, const std::string &content) {
	return fs::is_regular_file(file) && read_file(file) == content;
}

void remove_recursively(const fs::path &path) {
	std::error_code ec;
	fs::remove_all(path, ec);
}

fs::path scratch_directory(const std::string &name) {
	const fs::path path = fs::temp_directory_path() / "nbkp-tests" / name;
	remove_recursively(path);
	fs::create_directories(path);
	return path;
}

void mark_volume(const fs::path &root, const bool source, const bool destination) {
	create_file(root / VOLUME_MARKER);
	if (source) create_file(root / SOURCE_MARKER);
	if (destination) create_file(root / DESTINATION_MARKER);
}

Configuration configuration_from(const json &document) {
	ConfigurationReadResult result = parse_json_configuration(document.dump());
	if (const auto *error = std::get_if<ConfigurationError>(&result))
		std::cerr << "Unexpected configuration error: " << describe(*error) << std::endl;
	assert(std::holds_alternative<Configuration>(result));
	return std::get<Configuration>(std::move(result));
}

std::chrono::system_clock::time_point test_time(const int seconds) {
	using namespace std::chrono;
	return sys_days{year{2026} / March / 1} + hours{8} + std::chrono::seconds{seconds};
}

std::vector<std::string> list_directory(const fs::path &path) {
	std::vector<std::string> names;
	if (!fs::is_directory(path)) return names;
	for (const fs::directory_entry &entry : fs::directory_iterator(path))
		names.push_back(entry.path().filename().string());
	std::sort(names.begin(), names.end());
	return names;
}

namespace {

int test_counter = 0;

fs::path without_trailing_slash(const std::string &path) {
	std::string result = path;
	while (result.size() > 1 && result.back() == '/') result.pop_back();
	return result;
}

bool is_marker(const fs::path &path) {
	return path.filename().string().starts_with(".nbkp-");
}

}

void run_test(const std::string &description, Test &test) {
	std::cout << "Test " << ++test_counter << ": " << description << std::endl;
	test.prepare();
	test.perform();
	test.assert_validity();
	test.cleanup();
}

std::optional<AddressList> FakeHostResolver::resolve(const std::string &host) const {
	const auto found = hosts.find(host);
	if (found == hosts.end()) return std::nullopt;
	return found->second;
}

ProcessResult ScriptedProcessRunner::run(const Command &command) {
	commands.push_back(command);
	const std::string &program = command.front();
	if (const auto failing = failing_programs.find(program); failing != failing_programs.end())
		return ProcessResult{failing->second, "", program + ": operation failed\n"};

	if (program == "rsync") return simulate_rsync(command);
	if (program == "btrfs") return simulate_btrfs(command);
	if (program == "ssh") {
		const std::string &destination = command[command.size() - 2];
		if (unreachable_hosts.contains(destination))
			return ProcessResult{255, "", "ssh: connect to host " + destination + ": No route to host\n"};
		return ProcessResult{remote_exit_code, "", ""};
	}
	return system.run(command);
}

std::size_t ScriptedProcessRunner::count(const std::string &program) const {
	return of(program).size();
}

std::vector<Command> ScriptedProcessRunner::of(const std::string &program) const {
	std::vector<Command> result;
	for (const Command &command : commands) {
		if (!command.empty() && command.front() == program)
			result.push_back(command);
	}
	return result;
}

ProcessResult ScriptedProcessRunner::simulate_rsync(const Command &command) {
	if (rsync_exit_code != 0)
		return ProcessResult{rsync_exit_code, "", "rsync error: some files could not be transferred (code 23)\n"};

	const fs::path source = without_trailing_slash(command[command.size() - 2]);
	const fs::path destination = without_trailing_slash(command[command.size() - 1]);
	std::optional<fs::path> link_base;
	bool delete_extra = false;
	for (const std::string &argument : command) {
		if (argument.starts_with("--link-dest="))
			link_base = (destination / argument.substr(std::string("--link-dest=").size())).lexically_normal();
		if (argument == "--delete") delete_extra = true;
	}

	fs::create_directories(destination);
	std::set<fs::path> copied;
	for (auto it = fs::recursive_directory_iterator(source); it != fs::recursive_directory_iterator(); ++it) {
		const fs::path relative = it->path().lexically_relative(source);
		if (is_marker(relative)) {
			if (it->is_directory()) it.disable_recursion_pending();
			continue;
		}
		copied.insert(relative);

		const fs::path target = destination / relative;
		if (it->is_directory()) {
			fs::create_directories(target);
			continue;
		}

		fs::remove(target);
		if (link_base.has_value()) {
			const fs::path base = *link_base / relative;
			if (fs::is_regular_file(base) && read_file(base) == read_file(it->path())) {
				fs::create_hard_link(base, target);
				continue;
			}
		}
		fs::copy_file(it->path(), target);
	}

	if (delete_extra) {
		std::vector<fs::path> extra;
		for (auto it = fs::recursive_directory_iterator(destination); it != fs::recursive_directory_iterator(); ++it) {
			const fs::path relative = it->path().lexically_relative(destination);
			if (is_marker(relative) || !copied.contains(relative)) {
				if (!is_marker(relative)) extra.push_back(it->path());
				if (it->is_directory()) it.disable_recursion_pending();
			}
		}
		for (const fs::path &path : extra)
			fs::remove_all(path);
	}
	return ProcessResult{0, "", ""};
}

ProcessResult ScriptedProcessRunner::simulate_btrfs(const Command &command) {
	// btrfs subvolume snapshot -r SOURCE TARGET
	if (command.size() == 6 && command[1] == "subvolume" && command[2] == "snapshot") {
		fs::copy(command[4], command[5], fs::copy_options::recursive);
		return ProcessResult{0, "", ""};
	}
	// btrfs subvolume delete PATH
	if (command.size() == 4 && command[1] == "subvolume" && command[2] == "delete") {
		fs::remove_all(command[3]);
		return ProcessResult{0, "", ""};
	}
	// btrfs property set PATH ro false
	return ProcessResult{0, "", ""};
}
