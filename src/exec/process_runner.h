#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct ProcessSpec {
    // argv[0] is resolved against PATH when it has no slash.
    std::vector<std::string> argv;
    // Empty keeps the caller's working directory.
    std::string working_dir;
    std::vector<std::pair<std::string, std::string>> env_overrides;
    bool merge_stderr{false};
    std::size_t max_output_bytes{1024 * 1024};
};

struct ProcessOutcome {
    int exit_code{-1};
    int term_signal{0};
    bool timed_out{false};
    bool truncated{false};
    std::string stdout_data;
    std::string stderr_data;
};

// Runs one program in its own process group and waits for it, racing a
// deadline. When the deadline fires the whole group is killed. Nothing from
// the group survives the call. Throws BackendExecutionError if the program
// cannot be launched.
ProcessOutcome run_process(const ProcessSpec &spec, std::chrono::milliseconds deadline);

std::optional<std::string> find_executable(const std::string &name);
