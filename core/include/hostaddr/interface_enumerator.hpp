#pragma once

#include "hostaddr/types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace hostaddr {

class InterfaceEnumerator {
public:
    virtual ~InterfaceEnumerator() = default;

    // Create the enumerator backed by the host's network stack
    static std::unique_ptr<InterfaceEnumerator> create();

    // Names of all interfaces on the host. Throws InterfaceQueryError.
    virtual std::vector<std::string> list_interface_names() const = 0;

    // Address and flags of one interface. Throws InterfaceQueryError,
    // e.g. when the interface went away after it was listed.
    virtual InterfaceRecord query_interface(const std::string& name) const = 0;

    // Records of every listed interface, in listing order.
    // The first failing interface aborts the whole query.
    std::vector<InterfaceRecord> query_all() const;
};

} // namespace hostaddr
