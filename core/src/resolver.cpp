#include "hostaddr/resolver.hpp"
#include "hostaddr/address.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace hostaddr {

bool is_usable(const InterfaceFlags& flags, const std::optional<RawAddress>& address) {
    // Interface has no address, might happen on BSD
    if (!address) {
        return false;
    }
    if (!flags.contains(InterfaceFlag::UP)) {
        return false;
    }
    // Loopback flag alone does not disqualify, only a loopback address does
    return !is_loopback_address(*address);
}

std::optional<std::string> usable_address(const InterfaceRecord& record) {
    if (!is_usable(record.flags, record.address)) {
        VLOG(1) << "Ignoring interface " << record.name;
        return std::nullopt;
    }
    return format_address(*record.address);
}

std::vector<std::string> usable_addresses(const std::vector<InterfaceRecord>& records) {
    std::vector<std::string> addresses;
    for (const auto& record : records) {
        if (auto address = usable_address(record)) {
            VLOG(1) << "Found local IP: " << *address << " on interface " << record.name;
            addresses.push_back(std::move(*address));
        }
    }
    return addresses;
}

AddressResolver::AddressResolver()
    : enumerator_(InterfaceEnumerator::create()) {}

AddressResolver::AddressResolver(std::shared_ptr<const InterfaceEnumerator> enumerator)
    : enumerator_(std::move(enumerator)) {
    if (!enumerator_) {
        throw std::invalid_argument("AddressResolver requires an interface enumerator");
    }
}

std::vector<std::string> AddressResolver::collect_addresses() const {
    return usable_addresses(enumerator_->query_all());
}

std::string AddressResolver::one_address() const {
    auto addresses = collect_addresses();
    if (addresses.empty()) {
        LOG(WARNING) << "No usable interface found, falling back to " << kDefaultAddress;
        return kDefaultAddress;
    }
    return addresses.front();
}

std::vector<std::string> AddressResolver::all_addresses() const {
    auto addresses = collect_addresses();
    if (addresses.empty()) {
        LOG(WARNING) << "No usable interface found, falling back to " << kDefaultAddress;
        return {kDefaultAddress};
    }

    // Remove duplicates
    std::sort(addresses.begin(), addresses.end());
    addresses.erase(std::unique(addresses.begin(), addresses.end()), addresses.end());
    return addresses;
}

std::vector<std::string> AddressResolver::resolve_bind_address(const std::string& bind_address) const {
    auto parse_endpoint = [](const std::string& endpoint) -> std::pair<std::string, uint16_t> {
        size_t colon_pos = endpoint.find_last_of(':');
        if (colon_pos == std::string::npos) {
            throw std::invalid_argument("Bind address has no port: " + endpoint);
        }

        std::string host = endpoint.substr(0, colon_pos);
        std::string port_str = endpoint.substr(colon_pos + 1);

        if (port_str.empty() || port_str.size() > 5 ||
            !std::all_of(port_str.begin(), port_str.end(),
                         [](unsigned char c) { return c >= '0' && c <= '9'; })) {
            throw std::invalid_argument("Invalid port in endpoint: " + endpoint);
        }
        unsigned long port = std::stoul(port_str);
        if (port > 65535) {
            throw std::invalid_argument("Invalid port in endpoint: " + endpoint);
        }

        return {host, static_cast<uint16_t>(port)};
    };

    auto is_any_address = [](const std::string& address) -> bool {
        return address == "0.0.0.0" || address == "::" || address == "[::]" || address.empty();
    };

    auto [host, port] = parse_endpoint(bind_address);

    if (!is_any_address(host)) {
        // Not a bind-all address, use as-is
        return {bind_address};
    }

    std::vector<std::string> resolved_addresses;
    for (const auto& ip : all_addresses()) {
        resolved_addresses.push_back(ip + ":" + std::to_string(port));
    }
    return resolved_addresses;
}

std::string one_address() {
    return AddressResolver().one_address();
}

std::vector<std::string> all_addresses() {
    return AddressResolver().all_addresses();
}

} // namespace hostaddr
