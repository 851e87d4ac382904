#include "network_identity.hpp"
#include <spdlog/spdlog.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace ds {

namespace {

// Owns a socket descriptor for the duration of the route lookup
class ScopedSocket {
public:
    explicit ScopedSocket(int fd) : fd_(fd) {}
    ~ScopedSocket() {
        if (fd_ >= 0) {
            close(fd_);
        }
    }

    ScopedSocket(const ScopedSocket&) = delete;
    ScopedSocket& operator=(const ScopedSocket&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

private:
    int fd_;
};

} // namespace

std::string resolve_lan_address(const std::string& target_host, uint16_t target_port) {
    sockaddr_storage target{};
    socklen_t target_len = 0;

    auto* v4 = reinterpret_cast<sockaddr_in*>(&target);
    auto* v6 = reinterpret_cast<sockaddr_in6*>(&target);
    if (inet_pton(AF_INET, target_host.c_str(), &v4->sin_addr) == 1) {
        v4->sin_family = AF_INET;
        v4->sin_port = htons(target_port);
        target_len = sizeof(sockaddr_in);
    } else if (inet_pton(AF_INET6, target_host.c_str(), &v6->sin6_addr) == 1) {
        v6->sin6_family = AF_INET6;
        v6->sin6_port = htons(target_port);
        target_len = sizeof(sockaddr_in6);
    } else {
        spdlog::debug("LAN address: '{}' is not an IP literal, using {}", target_host, kLoopbackAddress);
        return kLoopbackAddress;
    }

    ScopedSocket sock(socket(target.ss_family, SOCK_DGRAM, 0));
    if (!sock.valid()) {
        spdlog::debug("LAN address: socket() failed: {}", std::strerror(errno));
        return kLoopbackAddress;
    }

    // connect() on a datagram socket only fixes the route; nothing is sent
    if (connect(sock.get(), reinterpret_cast<sockaddr*>(&target), target_len) < 0) {
        spdlog::debug("LAN address: no route to {}: {}", target_host, std::strerror(errno));
        return kLoopbackAddress;
    }

    sockaddr_storage local{};
    socklen_t local_len = sizeof(local);
    if (getsockname(sock.get(), reinterpret_cast<sockaddr*>(&local), &local_len) < 0) {
        spdlog::debug("LAN address: getsockname() failed: {}", std::strerror(errno));
        return kLoopbackAddress;
    }

    char buf[INET6_ADDRSTRLEN] = {};
    const void* src = local.ss_family == AF_INET6
        ? static_cast<const void*>(&reinterpret_cast<sockaddr_in6*>(&local)->sin6_addr)
        : static_cast<const void*>(&reinterpret_cast<sockaddr_in*>(&local)->sin_addr);
    if (!inet_ntop(local.ss_family, src, buf, sizeof(buf))) {
        return kLoopbackAddress;
    }

    std::string address(buf);
    if (address == "0.0.0.0" || address == "::") {
        return kLoopbackAddress;
    }

    spdlog::debug("LAN address: selected {} (via {})", address, target_host);
    return address;
}

bool is_ip_address(const std::string& text) {
    in6_addr buf{};
    return inet_pton(AF_INET, text.c_str(), &buf) == 1 ||
           inet_pton(AF_INET6, text.c_str(), &buf) == 1;
}

} // namespace ds
