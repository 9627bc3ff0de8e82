#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

struct ExecutionOptions {
    bool force_sandbox{false};
    bool execute_requested{false};
    bool dry_run{false};
    // Unset means SandboxConfig::default_deadline.
    std::optional<std::chrono::milliseconds> deadline;
};

struct ContainerLimits {
    std::string image{"ubuntu:20.04"};
    std::string memory_limit{"128m"};
    double cpu_fraction{0.5};
    int pids_limit{64};
    std::string tmpfs_options{"rw,size=100m"};
};

struct SandboxConfig {
    std::chrono::milliseconds default_deadline{30000};
    std::string runtime_binary{"docker"};
    std::string container_prefix{"shellguard-sandbox"};
    ContainerLimits limits;
    std::chrono::milliseconds runtime_call_timeout{15000};
    std::size_t max_output_bytes{1024 * 1024};
    bool verbose{false};
};
