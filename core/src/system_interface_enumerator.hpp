#pragma once

#include <hostaddr/interface_enumerator.hpp>

namespace hostaddr {

// Reads interfaces through if_nameindex() and the SIOCGIF* ioctls.
// One address (the primary IPv4 address) is read per interface.
class SystemInterfaceEnumerator : public InterfaceEnumerator {
public:
    SystemInterfaceEnumerator() = default;
    ~SystemInterfaceEnumerator() override = default;

    std::vector<std::string> list_interface_names() const override;
    InterfaceRecord query_interface(const std::string& name) const override;
};

} // namespace hostaddr
