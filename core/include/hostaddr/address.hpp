#pragma once

#include "hostaddr/types.hpp"
#include <string>
#include <vector>

namespace hostaddr {

// "A.B.C.D" for IPv4, "[canonical lowercase text]" for IPv6
std::string format_address(const RawAddress& address);

// Build an address from an untyped component list.
// Four components give IPv4 (each 0-255), eight give IPv6 (each 0-65535).
// Throws std::invalid_argument for any other shape or an out of range component.
RawAddress make_raw_address(const std::vector<unsigned int>& components);

// 127.0.0.0/8 or exactly ::1
bool is_loopback_address(const RawAddress& address);

// Canonical zero-compressed text of an IPv6 address as produced by the
// platform (inet_ntop). No brackets.
std::string canonical_ipv6_text(const IPv6Address& address);

} // namespace hostaddr
