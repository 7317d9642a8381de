#include "system_interface_enumerator.hpp"
#include <hostaddr/errors.hpp>
#include <glog/logging.h>
#include <arpa/inet.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <memory>

namespace hostaddr {

namespace {

// Closes the query socket on every exit path
class SocketGuard {
public:
    SocketGuard() : fd_(socket(AF_INET, SOCK_DGRAM, 0)) {}
    ~SocketGuard() {
        if (fd_ >= 0) {
            close(fd_);
        }
    }

    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    int fd() const { return fd_; }

private:
    int fd_;
};

struct NameIndexDeleter {
    void operator()(struct if_nameindex* names) const { if_freenameindex(names); }
};

[[noreturn]] void throw_query_error(const std::string& what, int error_code,
                                    const std::string& interface_name = "") {
    std::string message = what + ": " + strerror(error_code);
    LOG(ERROR) << message;
    throw InterfaceQueryError(message, error_code, interface_name);
}

struct ifreq make_request(const std::string& name) {
    if (name.empty() || name.size() >= IFNAMSIZ) {
        throw_query_error("Invalid interface name '" + name + "'", EINVAL, name);
    }
    struct ifreq request;
    std::memset(&request, 0, sizeof(request));
    std::memcpy(request.ifr_name, name.c_str(), name.size());
    return request;
}

} // namespace

std::vector<std::string> SystemInterfaceEnumerator::list_interface_names() const {
    std::unique_ptr<struct if_nameindex, NameIndexDeleter> names(if_nameindex());
    if (!names) {
        throw_query_error("Failed to list network interfaces", errno);
    }

    std::vector<std::string> result;
    for (struct if_nameindex* entry = names.get(); entry->if_index != 0; ++entry) {
        result.emplace_back(entry->if_name);
    }
    return result;
}

InterfaceRecord SystemInterfaceEnumerator::query_interface(const std::string& name) const {
    SocketGuard sock;
    if (sock.fd() < 0) {
        throw_query_error("Failed to create socket", errno, name);
    }

    InterfaceRecord record;
    record.name = name;

    struct ifreq request = make_request(name);
    if (ioctl(sock.fd(), SIOCGIFFLAGS, &request) < 0) {
        throw_query_error("Failed to get flags of interface " + name, errno, name);
    }
    record.flags = InterfaceFlags::from_native(static_cast<unsigned short>(request.ifr_flags));

    request = make_request(name);
    if (ioctl(sock.fd(), SIOCGIFADDR, &request) < 0) {
        // No IPv4 address configured, happens on IPv6-only and unnumbered links
        if (errno != EADDRNOTAVAIL) {
            throw_query_error("Failed to get address of interface " + name, errno, name);
        }
    } else if (request.ifr_addr.sa_family == AF_INET) {
        const auto* sin = reinterpret_cast<const struct sockaddr_in*>(&request.ifr_addr);
        uint32_t host_order = ntohl(sin->sin_addr.s_addr);
        IPv4Address v4;
        v4.parts = {static_cast<uint8_t>(host_order >> 24),
                    static_cast<uint8_t>(host_order >> 16),
                    static_cast<uint8_t>(host_order >> 8),
                    static_cast<uint8_t>(host_order)};
        record.address = v4;
    }

    VLOG(1) << "Interface " << name << " flags=[" << record.flags.to_string() << "]"
            << (record.address ? "" : " (no address)");
    return record;
}

std::unique_ptr<InterfaceEnumerator> InterfaceEnumerator::create() {
    return std::make_unique<SystemInterfaceEnumerator>();
}

} // namespace hostaddr
