#include "hostaddr/types.hpp"
#include <net/if.h>

namespace hostaddr {

namespace {

constexpr InterfaceFlag kAllFlags[] = {
    InterfaceFlag::UP,
    InterfaceFlag::BROADCAST,
    InterfaceFlag::LOOPBACK,
    InterfaceFlag::POINTOPOINT,
    InterfaceFlag::RUNNING,
    InterfaceFlag::MULTICAST
};

} // namespace

const char* to_string(InterfaceFlag flag) {
    switch (flag) {
        case InterfaceFlag::UP: return "up";
        case InterfaceFlag::BROADCAST: return "broadcast";
        case InterfaceFlag::LOOPBACK: return "loopback";
        case InterfaceFlag::POINTOPOINT: return "pointtopoint";
        case InterfaceFlag::RUNNING: return "running";
        case InterfaceFlag::MULTICAST: return "multicast";
    }
    return "unknown";
}

InterfaceFlags::InterfaceFlags(std::initializer_list<InterfaceFlag> flags) {
    for (auto flag : flags) {
        insert(flag);
    }
}

InterfaceFlags InterfaceFlags::from_native(unsigned int native_flags) {
    InterfaceFlags flags;
    if (native_flags & IFF_UP) flags.insert(InterfaceFlag::UP);
    if (native_flags & IFF_BROADCAST) flags.insert(InterfaceFlag::BROADCAST);
    if (native_flags & IFF_LOOPBACK) flags.insert(InterfaceFlag::LOOPBACK);
    if (native_flags & IFF_POINTOPOINT) flags.insert(InterfaceFlag::POINTOPOINT);
    if (native_flags & IFF_RUNNING) flags.insert(InterfaceFlag::RUNNING);
    if (native_flags & IFF_MULTICAST) flags.insert(InterfaceFlag::MULTICAST);
    return flags;
}

std::vector<InterfaceFlag> InterfaceFlags::to_vector() const {
    std::vector<InterfaceFlag> flags;
    for (auto flag : kAllFlags) {
        if (contains(flag)) {
            flags.push_back(flag);
        }
    }
    return flags;
}

std::string InterfaceFlags::to_string() const {
    std::string result;
    for (auto flag : to_vector()) {
        if (!result.empty()) {
            result += ",";
        }
        result += hostaddr::to_string(flag);
    }
    return result;
}

} // namespace hostaddr
