// File: src/core/error.h
#pragma once

#include <stdexcept>
#include <string>

namespace pm {

// Base of every error powermodes raises itself.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string &what) : std::runtime_error(what) {}
};

// A configuration value does not have the shape a plugin (or the loader)
// expects. Raised before anything touches the system.
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string &what) : Error(what) {}
};

// Applying a validated configuration failed. The side effect may have
// partially happened.
class ApplyError : public Error {
public:
    explicit ApplyError(const std::string &what) : Error(what) {}
};

// Invalid or duplicate plugin registration.
class RegistryError : public Error {
public:
    explicit RegistryError(const std::string &what) : Error(what) {}
};

} // namespace pm
