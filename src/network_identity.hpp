#pragma once

#include <cstdint>
#include <string>

namespace ds {

inline constexpr const char* kLoopbackAddress = "127.0.0.1";

// Address of the interface the OS would use to reach target_host.
// Uses a connected UDP socket so no packet is ever sent. Never throws;
// returns 127.0.0.1 when no route or interface is available.
std::string resolve_lan_address(const std::string& target_host = "8.8.8.8",
                                uint16_t target_port = 80);

// True for a literal IPv4 or IPv6 address
bool is_ip_address(const std::string& text);

} // namespace ds
