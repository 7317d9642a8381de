#include "hostaddr/address.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace hostaddr {

std::string canonical_ipv6_text(const IPv6Address& address) {
    struct in6_addr raw;
    for (size_t i = 0; i < address.groups.size(); ++i) {
        raw.s6_addr[2 * i] = static_cast<uint8_t>(address.groups[i] >> 8);
        raw.s6_addr[2 * i + 1] = static_cast<uint8_t>(address.groups[i] & 0xff);
    }

    char text[INET6_ADDRSTRLEN];
    if (inet_ntop(AF_INET6, &raw, text, sizeof(text)) == nullptr) {
        throw std::runtime_error("Failed to convert IPv6 address to text: " +
                                 std::string(strerror(errno)));
    }
    return std::string(text);
}

std::string format_address(const RawAddress& address) {
    if (const auto* v4 = std::get_if<IPv4Address>(&address)) {
        return std::to_string(v4->parts[0]) + "." +
               std::to_string(v4->parts[1]) + "." +
               std::to_string(v4->parts[2]) + "." +
               std::to_string(v4->parts[3]);
    }

    std::string text = canonical_ipv6_text(std::get<IPv6Address>(address));
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return "[" + text + "]";
}

RawAddress make_raw_address(const std::vector<unsigned int>& components) {
    if (components.size() == 4) {
        IPv4Address v4;
        for (size_t i = 0; i < 4; ++i) {
            if (components[i] > 0xff) {
                throw std::invalid_argument("IPv4 component out of range: " +
                                            std::to_string(components[i]));
            }
            v4.parts[i] = static_cast<uint8_t>(components[i]);
        }
        return v4;
    }

    if (components.size() == 8) {
        IPv6Address v6;
        for (size_t i = 0; i < 8; ++i) {
            if (components[i] > 0xffff) {
                throw std::invalid_argument("IPv6 component out of range: " +
                                            std::to_string(components[i]));
            }
            v6.groups[i] = static_cast<uint16_t>(components[i]);
        }
        return v6;
    }

    throw std::invalid_argument("Address must have 4 or 8 components, got " +
                                std::to_string(components.size()));
}

bool is_loopback_address(const RawAddress& address) {
    if (const auto* v4 = std::get_if<IPv4Address>(&address)) {
        return v4->parts[0] == 127;
    }
    static const IPv6Address kIPv6Loopback{{0, 0, 0, 0, 0, 0, 0, 1}};
    return std::get<IPv6Address>(address) == kIPv6Loopback;
}

} // namespace hostaddr
