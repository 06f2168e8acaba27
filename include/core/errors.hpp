#pragma once

#include <stdexcept>
#include <string>

namespace rehost {

// Malformed or ambiguous injection strategy. Fatal before the run starts.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string &message) : std::runtime_error(message) {}
};

// Path collision under the fail policy, missing source artifact, broken module closure.
class InjectionError : public std::runtime_error {
public:
    explicit InjectionError(const std::string &message) : std::runtime_error(message) {}
};

class ContainerFormatError : public std::runtime_error {
public:
    explicit ContainerFormatError(const std::string &message) : std::runtime_error(message) {}
};

class CapacityExceededError : public std::runtime_error {
public:
    explicit CapacityExceededError(const std::string &message) : std::runtime_error(message) {}
};

class SigningError : public std::runtime_error {
public:
    explicit SigningError(const std::string &message) : std::runtime_error(message) {}
};

// Non-zero exit or timeout of the external build. Never retried.
class BuildFailure : public std::runtime_error {
public:
    explicit BuildFailure(const std::string &message) : std::runtime_error(message) {}
};

} // namespace rehost
