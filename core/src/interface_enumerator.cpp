#include "hostaddr/interface_enumerator.hpp"

namespace hostaddr {

std::vector<InterfaceRecord> InterfaceEnumerator::query_all() const {
    std::vector<InterfaceRecord> records;
    for (const auto& name : list_interface_names()) {
        records.push_back(query_interface(name));
    }
    return records;
}

} // namespace hostaddr
