#pragma once

#include <stdexcept>
#include <string>

namespace snapmatch {

// Image could not be decoded into a usable pixel grid. Always per-file.
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

// Cache medium unreadable, unwritable or corrupt. Never escapes FingerprintCache.
class CacheError : public std::runtime_error {
public:
    explicit CacheError(const std::string& what) : std::runtime_error(what) {}
};

// Invalid run parameters, rejected before any fingerprinting starts.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace snapmatch
