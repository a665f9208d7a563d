#pragma once

#include <stdexcept>
#include <string>

namespace edgebook {

// Bad inputs or settings: the run cannot start or continue.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

// Durable output could not be written.
class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace edgebook
