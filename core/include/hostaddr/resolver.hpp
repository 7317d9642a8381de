#pragma once

#include "hostaddr/interface_enumerator.hpp"
#include "hostaddr/types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hostaddr {

// Interface must be up and carry an address that is not loopback-only.
// An up interface flagged as loopback with a routable address is accepted.
bool is_usable(const InterfaceFlags& flags, const std::optional<RawAddress>& address);

// Formatted address of the interface, or nullopt if it is to be ignored
std::optional<std::string> usable_address(const InterfaceRecord& record);

// Formatted addresses of all usable records, in input order
std::vector<std::string> usable_addresses(const std::vector<InterfaceRecord>& records);

class AddressResolver {
public:
    // Resolver over the host's interfaces
    AddressResolver();
    explicit AddressResolver(std::shared_ptr<const InterfaceEnumerator> enumerator);

    // Usable addresses in enumeration order, possibly empty
    std::vector<std::string> collect_addresses() const;

    // First usable address by enumeration order, kDefaultAddress if none
    std::string one_address() const;

    // Sorted, deduplicated usable addresses, {kDefaultAddress} if none
    std::vector<std::string> all_addresses() const;

    // Expand a wildcard bind address ("0.0.0.0:5060", "[::]:5060", ":5060")
    // into one "address:port" per entry of all_addresses(). Any other bind
    // address is returned as the only element.
    std::vector<std::string> resolve_bind_address(const std::string& bind_address) const;

private:
    std::shared_ptr<const InterfaceEnumerator> enumerator_;
};

// Convenience wrappers over a fresh system resolver
std::string one_address();
std::vector<std::string> all_addresses();

} // namespace hostaddr
