#pragma once

#include <stdexcept>
#include <string>

namespace ports {

// Port could not be bound: in use, privileged, invalid, or the root is unusable
class BindError : public std::runtime_error {
public:
    explicit BindError(const std::string& what) : std::runtime_error(what) {}
};

// Request path escapes the sandbox root
class PathViolation : public std::runtime_error {
public:
    explicit PathViolation(const std::string& what) : std::runtime_error(what) {}
};

} // namespace ports
