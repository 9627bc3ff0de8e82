#pragma once

#include "core/execution_result.h"
#include "exec/process_runner.h"

#include <chrono>
#include <cstddef>
#include <string>

// Runs a command through /bin/sh in a throwaway directory with HOME and
// TMPDIR redirected into it. No namespace or container boundary.
class ProcessBackend {
public:
    explicit ProcessBackend(std::size_t max_output_bytes) : max_output_bytes_(max_output_bytes) {}

    ExecutionResult run(const std::string &command, std::chrono::milliseconds deadline) const;

private:
    std::size_t max_output_bytes_;
};

// Maps a finished child onto the uniform result shape.
ExecutionResult result_from_outcome(ProcessOutcome outcome, Strategy backend);
