#include "network.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netdb.h>
#include <sys/socket.h>

namespace {

struct Ipv4Range {
	std::uint32_t network;
	int prefix_length;
};

constexpr std::uint32_t ipv4(const int a, const int b, const int c, const int d) {
	return (static_cast<std::uint32_t>(a) << 24) | (static_cast<std::uint32_t>(b) << 16)
		| (static_cast<std::uint32_t>(c) << 8) | static_cast<std::uint32_t>(d);
}

constexpr Ipv4Range PRIVATE_IPV4_RANGES[] = {
	{ipv4(0, 0, 0, 0), 8},
	{ipv4(10, 0, 0, 0), 8},
	{ipv4(100, 64, 0, 0), 10},
	{ipv4(127, 0, 0, 0), 8},
	{ipv4(169, 254, 0, 0), 16},
	{ipv4(172, 16, 0, 0), 12},
	{ipv4(192, 0, 0, 0), 24},
	{ipv4(192, 168, 0, 0), 16},
	{ipv4(198, 18, 0, 0), 15},
};

bool is_private_ipv4(const std::uint32_t address) {
	for (const Ipv4Range &range : PRIVATE_IPV4_RANGES) {
		const std::uint32_t mask = range.prefix_length == 0
			? 0 : ~std::uint32_t{0} << (32 - range.prefix_length);
		if ((address & mask) == range.network) return true;
	}
	return false;
}

bool is_private_ipv6(const unsigned char (&bytes)[16]) {
	static const unsigned char loopback[16] = {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1};
	static const unsigned char unspecified[16] = {};
	if (std::memcmp(bytes, loopback, 16) == 0) return true;
	if (std::memcmp(bytes, unspecified, 16) == 0) return true;

	if ((bytes[0] & 0xfe) == 0xfc) return true; // fc00::/7 unique local
	if (bytes[0] == 0xfe && (bytes[1] & 0xc0) == 0x80) return true; // fe80::/10 link local

	// ::ffff:a.b.c.d mapped IPv4
	static const unsigned char mapped_prefix[12] = {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0xff, 0xff};
	if (std::memcmp(bytes, mapped_prefix, 12) == 0)
		return is_private_ipv4(ipv4(bytes[12], bytes[13], bytes[14], bytes[15]));

	return false;
}

}

std::optional<AddressList> SystemHostResolver::resolve(const std::string &host) const {
	const auto cached = cache.find(host);
	if (cached != cache.end()) return cached->second;

	addrinfo hints{};
	hints.ai_family = AF_UNSPEC;
	hints.ai_socktype = SOCK_STREAM;

	addrinfo *servinfo = nullptr;
	const int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &servinfo);
	if (rc != 0 || servinfo == nullptr) {
		if (servinfo != nullptr) ::freeaddrinfo(servinfo);
		cache[host] = std::nullopt;
		return std::nullopt;
	}

	AddressList addresses;
	for (const addrinfo *info = servinfo; info != nullptr; info = info->ai_next) {
		char text[INET6_ADDRSTRLEN] = {};
		const void *source = nullptr;
		if (info->ai_family == AF_INET)
			source = &reinterpret_cast<const sockaddr_in *>(info->ai_addr)->sin_addr;
		else if (info->ai_family == AF_INET6)
			source = &reinterpret_cast<const sockaddr_in6 *>(info->ai_addr)->sin6_addr;
		else
			continue;

		if (::inet_ntop(info->ai_family, source, text, sizeof(text)) == nullptr) continue;
		if (std::find(addresses.begin(), addresses.end(), text) == addresses.end())
			addresses.emplace_back(text);
	}
	::freeaddrinfo(servinfo);

	std::optional<AddressList> result;
	if (!addresses.empty()) result = std::move(addresses);
	cache[host] = result;
	return result;
}

bool is_private_address(const std::string &address) {
	in_addr v4{};
	if (::inet_pton(AF_INET, address.c_str(), &v4) == 1)
		return is_private_ipv4(ntohl(v4.s_addr));

	in6_addr v6{};
	if (::inet_pton(AF_INET6, address.c_str(), &v6) == 1) {
		unsigned char bytes[16];
		std::memcpy(bytes, &v6, sizeof(bytes));
		return is_private_ipv6(bytes);
	}

	return false;
}

std::optional<bool> is_private_host(const HostResolver &resolver, const std::string &host) {
	const std::optional<AddressList> addresses = resolver.resolve(host);
	if (!addresses.has_value()) return std::nullopt;

	return std::all_of(addresses->begin(), addresses->end(), is_private_address);
}
