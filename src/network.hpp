#ifndef NBKP_NETWORK_HPP
#define NBKP_NETWORK_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

using AddressList = std::vector<std::string>;

/** Resolves host names to textual IP addresses. */
class HostResolver {
	public:
	/** Returns the resolved addresses, or no value if the name does not resolve. */
	virtual std::optional<AddressList> resolve(const std::string &host) const = 0;

	virtual ~HostResolver() = default;
};

/** getaddrinfo-based resolver. Answers are cached for the lifetime
 * of the instance, i.e. one command invocation. */
class SystemHostResolver final : public HostResolver {
	mutable std::map<std::string, std::optional<AddressList>> cache;

	public:
	std::optional<AddressList> resolve(const std::string &host) const override;
};

/** True for loopback, link-local, RFC 1918, CGNAT and IPv6 unique-local
 * addresses. Unparseable input is treated as public. */
bool is_private_address(const std::string &address);

/** True if every resolved address of `host` is private, false if any is public,
 * no value if the host does not resolve. */
std::optional<bool> is_private_host(const HostResolver &resolver, const std::string &host);

#endif // NBKP_NETWORK_HPP
