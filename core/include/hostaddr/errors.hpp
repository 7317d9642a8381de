#pragma once

#include <stdexcept>
#include <string>

namespace hostaddr {

// The platform could not list interfaces or read one interface's record.
// Never recovered inside the library.
class InterfaceQueryError : public std::runtime_error {
public:
    InterfaceQueryError(const std::string& what, int error_code,
                        const std::string& interface_name = "");

    int error_code() const { return error_code_; }

    // Empty when the failure happened while listing interfaces
    const std::string& interface_name() const { return interface_name_; }

private:
    int error_code_;
    std::string interface_name_;
};

} // namespace hostaddr
