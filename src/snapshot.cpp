#include "snapshot.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <format>
#include <iostream>
#include <sstream>

#include "snapshot_btrfs.hpp"
#include "snapshot_hard_link.hpp"
#include "ssh.hpp"

namespace {

// positions of the fixed characters in YYYY-MM-DDTHH:MM:SSZ
constexpr std::size_t TIMESTAMP_LENGTH = 20;
// keeps the sequence within `unsigned`
constexpr std::size_t MAX_SEQUENCE_DIGITS = 9;
// readlink: not a symlink, or no such file
constexpr int EXIT_CODE_NOT_A_LINK = 1;

bool is_timestamp(const std::string &text) {
	if (text.size() != TIMESTAMP_LENGTH) return false;
	const std::string pattern = "dddd-dd-ddTdd:dd:ddZ";
	for (std::size_t i = 0; i < TIMESTAMP_LENGTH; ++i) {
		if (pattern[i] == 'd') {
			if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
		} else if (pattern[i] != text[i]) {
			return false;
		}
	}
	return true;
}

}

std::string SnapshotName::str() const {
	if (sequence == 0) return timestamp;
	return timestamp + "." + std::to_string(sequence);
}

std::optional<SnapshotName> SnapshotName::parse(const std::string &text) {
	const std::string timestamp = text.substr(0, TIMESTAMP_LENGTH);
	if (!is_timestamp(timestamp)) return std::nullopt;
	if (text.size() == TIMESTAMP_LENGTH) return SnapshotName{timestamp, 0};

	const std::string suffix = text.substr(TIMESTAMP_LENGTH);
	if (suffix.size() < 2 || suffix.size() > MAX_SEQUENCE_DIGITS + 1 || suffix.front() != '.') return std::nullopt;
	unsigned sequence = 0;
	for (const char c : suffix.substr(1)) {
		if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
		sequence = sequence * 10 + static_cast<unsigned>(c - '0');
	}
	if (sequence == 0) return std::nullopt;
	return SnapshotName{timestamp, sequence};
}

std::string format_snapshot_timestamp(const std::chrono::system_clock::time_point time) {
	using namespace std::chrono;
	return std::format("{:%FT%TZ}", floor<seconds>(time));
}

SnapshotName next_snapshot_name(
	const std::vector<SnapshotName> &existing,
	const std::chrono::system_clock::time_point now
) {
	SnapshotName name{format_snapshot_timestamp(now), 0};
	bool taken = false;
	for (const SnapshotName &other : existing) {
		if (other.timestamp != name.timestamp) continue;
		if (!taken || other.sequence >= name.sequence)
			name.sequence = other.sequence + 1;
		taken = true;
	}
	return name;
}

std::string snapshots_path(const std::string &destination) {
	return destination + "/" + SNAPSHOTS_DIRECTORY;
}

std::string snapshot_path(const std::string &destination, const std::string &name) {
	return snapshots_path(destination) + "/" + name;
}

std::string latest_path(const std::string &destination) {
	return destination + "/" + LATEST_NAME;
}

Command list_snapshots_command(const std::string &destination) {
	return {"ls", "-1", snapshots_path(destination)};
}

Command read_latest_command(const std::string &destination) {
	return {"readlink", latest_path(destination)};
}

Command make_directory_command(const std::string &path) {
	return {"mkdir", "-p", path};
}

Command remove_tree_command(const std::string &path) {
	return {"rm", "-rf", path};
}

Command btrfs_snapshot_command(const std::string &destination, const std::string &name) {
	return {"btrfs", "subvolume", "snapshot", "-r", latest_path(destination), snapshot_path(destination, name)};
}

Command btrfs_writable_command(const std::string &path) {
	return {"btrfs", "property", "set", path, "ro", "false"};
}

Command btrfs_delete_command(const std::string &path) {
	return {"btrfs", "subvolume", "delete", path};
}

std::vector<Command> repoint_latest_commands(const std::string &destination, const std::string &name) {
	const std::string temporary = destination + "/" + LATEST_TEMPORARY_NAME;
	return {
		{"ln", "-sfn", std::string(SNAPSHOTS_DIRECTORY) + "/" + name, temporary},
		{"mv", "-Tf", temporary, latest_path(destination)},
	};
}

std::vector<SnapshotName> parse_snapshot_listing(const std::string &output) {
	std::vector<SnapshotName> result;
	std::istringstream stream(output);
	std::string line;
	while (std::getline(stream, line)) {
		if (const auto name = SnapshotName::parse(line))
			result.push_back(*name);
	}
	std::sort(result.begin(), result.end());
	return result;
}

std::optional<SnapshotName> parse_latest_target(const std::string &output) {
	std::string target = output;
	while (!target.empty() && (target.back() == '\n' || target.back() == '/'))
		target.pop_back();
	const std::size_t slash = target.rfind('/');
	if (slash != std::string::npos)
		target = target.substr(slash + 1);
	return SnapshotName::parse(target);
}

std::vector<SnapshotName> orphaned_snapshots(
	const std::vector<SnapshotName> &snapshots,
	const std::optional<SnapshotName> &latest
) {
	std::vector<SnapshotName> orphans;
	for (const SnapshotName &snapshot : snapshots) {
		if (latest.has_value() && snapshot > *latest)
			orphans.push_back(snapshot);
	}
	return orphans;
}

std::vector<SnapshotName> snapshots_to_prune(
	const std::vector<SnapshotName> &snapshots,
	const int max_snapshots,
	const std::vector<SnapshotName> &protected_names
) {
	std::vector<SnapshotName> sorted = snapshots;
	std::sort(sorted.begin(), sorted.end());

	const std::ptrdiff_t excess = static_cast<std::ptrdiff_t>(sorted.size()) - max_snapshots;
	std::vector<SnapshotName> result;
	for (const SnapshotName &snapshot : sorted) {
		if (static_cast<std::ptrdiff_t>(result.size()) >= excess) break;
		if (std::find(protected_names.begin(), protected_names.end(), snapshot) != protected_names.end())
			continue;
		result.push_back(snapshot);
	}
	return result;
}

ProcessResult SnapshotContext::execute(const Command &command) {
	if (dry_run) {
		plan(command_at(destination, command));
		return ProcessResult{0, "", ""};
	}
	return query(command);
}

ProcessResult SnapshotContext::query(const Command &command) {
	const Command argv = command_at(destination, command);
	if (verbose)
		std::cout << "Running: " << shell_join(argv) << std::endl;
	return runner.run(argv);
}

void SnapshotContext::plan(const Command &argv) {
	const std::string line = shell_join(argv);
	if (verbose)
		std::cout << "Would run: " << line << std::endl;
	planned.push_back(line);
}

std::string failure_detail(const ProcessResult &result) {
	const std::string &text = result.error_output.empty() ? result.output : result.error_output;
	std::string line = text.substr(0, text.find('\n'));
	if (line.empty())
		line = "exit code " + std::to_string(result.exit_code);
	return line;
}

SnapshotListResult list_snapshots(const SyncConfig &sync, SnapshotContext &context) {
	const ProcessResult result = context.query(list_snapshots_command(context.destination_path()));
	if (result.succeeded())
		return parse_snapshot_listing(result.output);

	if (is_remote(context.get_destination()) && result.exit_code == EXIT_CODE_SSH_CONNECTION_FAILED)
		return SyncError{SyncErrorKind::snapshot, sync.slug, snapshots_path(context.destination_path()),
			"cannot list snapshots: " + failure_detail(result)};
	return std::vector<SnapshotName>{};
}

LatestResult read_latest(const SyncConfig &sync, SnapshotContext &context) {
	const std::string path = latest_path(context.destination_path());
	if (!is_remote(context.get_destination())) {
		std::error_code error;
		const std::filesystem::file_status status = std::filesystem::symlink_status(path, error);
		if (!std::filesystem::is_symlink(status)) {
			if (error && error != std::errc::no_such_file_or_directory)
				return SyncError{SyncErrorKind::snapshot, sync.slug, path, "cannot inspect latest: " + error.message()};
			return std::optional<SnapshotName>{};
		}
	}

	const ProcessResult result = context.query(read_latest_command(context.destination_path()));
	if (!result.succeeded()) {
		if (is_remote(context.get_destination()) && result.exit_code == EXIT_CODE_NOT_A_LINK)
			return std::optional<SnapshotName>{};
		return SyncError{SyncErrorKind::snapshot, sync.slug, path, "cannot read latest: " + failure_detail(result)};
	}

	const std::optional<SnapshotName> target = parse_latest_target(result.output);
	if (!target.has_value())
		return SyncError{SyncErrorKind::snapshot, sync.slug, path, "latest does not reference a snapshot"};
	return target;
}

PrepareResult PlainStrategy::prepare(const SyncConfig &, SnapshotContext &) {
	return TransferTarget{};
}

PublishResult PlainStrategy::publish(
	const SyncConfig &,
	SnapshotContext &,
	const TransferTarget &,
	const ProcessResult &
) {
	return std::optional<SnapshotName>{};
}

PruneReport PlainStrategy::prune(const SyncConfig &, SnapshotContext &, const std::optional<SnapshotName> &) {
	return PruneReport{};
}

std::unique_ptr<SnapshotStrategy> make_snapshot_strategy(const SnapshotMode mode) {
	switch (mode) {
		case SnapshotMode::btrfs: return std::make_unique<BtrfsStrategy>();
		case SnapshotMode::hard_link: return std::make_unique<HardLinkStrategy>();
		case SnapshotMode::none: break;
	}
	return std::make_unique<PlainStrategy>();
}
