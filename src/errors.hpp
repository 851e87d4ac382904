#pragma once

#include <stdexcept>
#include <string>

namespace ds {

// Certificate generation was required but could not be performed
class ProvisioningError : public std::runtime_error {
public:
    explicit ProvisioningError(const std::string& what) : std::runtime_error(what) {}
};

// Certificate or key present but unusable (unreadable, invalid, mismatched)
class TlsConfigError : public std::runtime_error {
public:
    explicit TlsConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Listener-level failure (bind, listen, accept loop)
class ServerError : public std::runtime_error {
public:
    explicit ServerError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace ds
