#pragma once

// Main header file for the hostaddr library

#include "hostaddr/types.hpp"
#include "hostaddr/errors.hpp"
#include "hostaddr/address.hpp"
#include "hostaddr/interface_enumerator.hpp"
#include "hostaddr/resolver.hpp"
#include "hostaddr/config.hpp"

namespace hostaddr {

// Version information
constexpr const char* VERSION = "0.1.0";
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

} // namespace hostaddr
