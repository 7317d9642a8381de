#include "hostaddr/errors.hpp"

namespace hostaddr {

InterfaceQueryError::InterfaceQueryError(const std::string& what, int error_code,
                                         const std::string& interface_name)
    : std::runtime_error(what), error_code_(error_code), interface_name_(interface_name) {}

} // namespace hostaddr
