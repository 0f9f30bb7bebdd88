#ifndef NBKP_SSH_HPP
#define NBKP_SSH_HPP

#include <string>

#include "endpoint_resolver.hpp"
#include "location.hpp"
#include "process.hpp"
#include "shell.hpp"

/** `ssh` exits with 255 when the connection itself fails. */
constexpr int EXIT_CODE_SSH_CONNECTION_FAILED = 255;

/** `[user@]host`, the ssh destination of an endpoint. */
std::string format_ssh_destination(const SshEndpoint &endpoint);

/** `[user@]host[:port]` for `-J`; the port is omitted when it is 22. */
std::string format_proxy_jump(const SshEndpoint &endpoint);

/** `[user@]host:path`, the rsync notation of a remote path. */
std::string format_remote_path(const SshEndpoint &endpoint, const std::string &path);

/** `ssh` and its options, without the destination:
 * `ssh -o ConnectTimeout=N -o BatchMode=yes [...] [-p port] [-i key] [-J hops]` */
Command build_ssh_base_args(const ResolvedEndpoint &endpoint);

/** A complete ssh invocation running `remote_command_line` on the endpoint. */
Command build_ssh_command(const ResolvedEndpoint &endpoint, const std::string &remote_command_line);

/** The value of rsync's `-e` option for the endpoint. */
std::string build_ssh_transport_option(const ResolvedEndpoint &endpoint);

/** Turns an argument vector into one shell command line. */
using CommandJoiner = std::string (*)(const Command &command);

/** Wraps `command` to run at `location`: unchanged when local,
 * joined by `joiner` into the remote command line of ssh when remote.
 * The script renderer passes `script_join` to keep its variables live. */
Command command_at(const Location &location, const Command &command, CommandJoiner joiner = shell_join);

ProcessResult run_at(ProcessRunner &runner, const Location &location, const Command &command);

#endif // NBKP_SSH_HPP
