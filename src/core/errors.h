#pragma once

#include <stdexcept>
#include <string>

// The requested isolation backend cannot be used right now (no runtime,
// daemon unreachable). The command has not been started.
class BackendUnavailable : public std::runtime_error {
public:
    explicit BackendUnavailable(const std::string &what) : std::runtime_error(what) {}
};

// The backend itself could not be invoked. Distinct from the executed
// command exiting non-zero, which is a normal result.
class BackendExecutionError : public std::runtime_error {
public:
    explicit BackendExecutionError(const std::string &what) : std::runtime_error(what) {}
};
