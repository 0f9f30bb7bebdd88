#include "ssh.hpp"

std::string format_ssh_destination(const SshEndpoint &endpoint) {
	if (endpoint.user.has_value())
		return *endpoint.user + "@" + endpoint.host;
	return endpoint.host;
}

std::string format_proxy_jump(const SshEndpoint &endpoint) {
	std::string result = format_ssh_destination(endpoint);
	if (endpoint.port != DEFAULT_SSH_PORT)
		result += ":" + std::to_string(endpoint.port);
	return result;
}

std::string format_remote_path(const SshEndpoint &endpoint, const std::string &path) {
	return format_ssh_destination(endpoint) + ":" + path;
}

Command build_ssh_base_args(const ResolvedEndpoint &resolved) {
	const SshEndpoint &endpoint = resolved.endpoint;
	const ConnectionOptions &options = endpoint.connection_options;

	Command args = {
		"ssh",
		"-o", "ConnectTimeout=" + std::to_string(options.connect_timeout),
		"-o", "BatchMode=yes",
	};
	if (options.compress)
		args.insert(args.end(), {"-o", "Compression=yes"});
	if (options.server_alive_interval.has_value())
		args.insert(args.end(), {"-o", "ServerAliveInterval=" + std::to_string(*options.server_alive_interval)});
	if (!options.strict_host_key_checking)
		args.insert(args.end(), {"-o", "StrictHostKeyChecking=no"});
	if (options.known_hosts_file.has_value())
		args.insert(args.end(), {"-o", "UserKnownHostsFile=" + *options.known_hosts_file});
	if (options.forward_agent)
		args.insert(args.end(), {"-o", "ForwardAgent=yes"});

	if (endpoint.port != DEFAULT_SSH_PORT)
		args.insert(args.end(), {"-p", std::to_string(endpoint.port)});
	if (endpoint.key.has_value())
		args.insert(args.end(), {"-i", *endpoint.key});

	if (!resolved.proxy_chain.empty()) {
		std::string hops;
		for (const SshEndpoint &hop : resolved.proxy_chain) {
			if (!hops.empty()) hops += ",";
			hops += format_proxy_jump(hop);
		}
		args.insert(args.end(), {"-J", hops});
	}
	return args;
}

Command build_ssh_command(const ResolvedEndpoint &endpoint, const std::string &remote_command_line) {
	Command command = build_ssh_base_args(endpoint);
	command.push_back(format_ssh_destination(endpoint.endpoint));
	command.push_back(remote_command_line);
	return command;
}

std::string build_ssh_transport_option(const ResolvedEndpoint &endpoint) {
	return shell_join(build_ssh_base_args(endpoint));
}

Command command_at(const Location &location, const Command &command, const CommandJoiner joiner) {
	if (const RemoteLocation *remote = std::get_if<RemoteLocation>(&location))
		return build_ssh_command(remote->endpoint, joiner(command));
	return command;
}

ProcessResult run_at(ProcessRunner &runner, const Location &location, const Command &command) {
	return runner.run(command_at(location, command));
}
