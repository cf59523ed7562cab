#pragma once

#include <string>

namespace skynode::util {

// Random RFC 4122 v4 identifier, lower-case hex.
[[nodiscard]] std::string make_uuid();

[[nodiscard]] std::string host_name();

// PRETTY_NAME from /etc/os-release, else "<sysname> <release>" from uname(2).
[[nodiscard]] std::string os_info();

// First non-loopback IPv4 address, "127.0.0.1" when none is configured.
[[nodiscard]] std::string primary_ipv4();

} // namespace skynode::util
