#pragma once

#include "core/execution_result.h"

#include <chrono>
#include <cstddef>
#include <string>

// Unsandboxed execution in the caller's working directory and environment,
// still bounded by the deadline.
class DirectBackend {
public:
    explicit DirectBackend(std::size_t max_output_bytes) : max_output_bytes_(max_output_bytes) {}

    ExecutionResult run(const std::string &command, std::chrono::milliseconds deadline) const;

private:
    std::size_t max_output_bytes_;
};
