#pragma once

#include <array>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace hostaddr {

// Address handed out when no interface has a usable address
constexpr const char* kDefaultAddress = "127.0.0.1";

// IPv4 address as four octets, most significant first
struct IPv4Address {
    std::array<uint8_t, 4> parts{};

    bool operator==(const IPv4Address& other) const { return parts == other.parts; }
    bool operator!=(const IPv4Address& other) const { return parts != other.parts; }
};

// IPv6 address as eight 16-bit groups, most significant first
struct IPv6Address {
    std::array<uint16_t, 8> groups{};

    bool operator==(const IPv6Address& other) const { return groups == other.groups; }
    bool operator!=(const IPv6Address& other) const { return groups != other.groups; }
};

using RawAddress = std::variant<IPv4Address, IPv6Address>;

// Interface status markers
enum class InterfaceFlag {
    UP,
    BROADCAST,
    LOOPBACK,
    POINTOPOINT,
    RUNNING,
    MULTICAST
};

const char* to_string(InterfaceFlag flag);

class InterfaceFlags {
public:
    InterfaceFlags() = default;
    InterfaceFlags(std::initializer_list<InterfaceFlag> flags);

    // Map the IFF_* bits reported by the OS
    static InterfaceFlags from_native(unsigned int native_flags);

    bool contains(InterfaceFlag flag) const { return (bits_ & bit(flag)) != 0; }
    void insert(InterfaceFlag flag) { bits_ |= bit(flag); }
    bool empty() const { return bits_ == 0; }

    std::vector<InterfaceFlag> to_vector() const;

    // e.g. "up,loopback,running"
    std::string to_string() const;

    bool operator==(const InterfaceFlags& other) const { return bits_ == other.bits_; }
    bool operator!=(const InterfaceFlags& other) const { return bits_ != other.bits_; }

private:
    static constexpr uint32_t bit(InterfaceFlag flag) {
        return 1u << static_cast<uint32_t>(flag);
    }

    uint32_t bits_ = 0;
};

// Snapshot of one named interface at query time
struct InterfaceRecord {
    std::string name;
    std::optional<RawAddress> address;  // nullopt when the OS reports no address
    InterfaceFlags flags;
};

} // namespace hostaddr
