#pragma once

#include "core/options.h"
#include "exec/process_runner.h"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

struct ContainerState {
    bool started{false};
    int exit_code{-1};
};

// Thin client over a docker-compatible CLI. Immutable after construction,
// so one instance can be shared by concurrent executions.
class ContainerRuntime {
public:
    ContainerRuntime(std::string binary, std::chrono::milliseconds call_timeout);

    const std::string &binary() const { return binary_; }

    // Creates (but does not start) the container. Throws BackendUnavailable
    // when the daemon cannot be reached, BackendExecutionError otherwise.
    void create_container(const std::string &name, const std::string &command,
                          const ContainerLimits &limits) const;

    // Starts a created container attached, output combined into stdout.
    ProcessOutcome start_container(const std::string &name, std::chrono::milliseconds deadline,
                                   std::size_t max_output_bytes) const;

    // Whether the container ever ran its command, and the command's exit
    // status. Throws BackendExecutionError if the runtime cannot answer.
    ContainerState inspect_container(const std::string &name) const;

    // Force-removes; an already absent container counts as removed.
    bool remove_container(const std::string &name, std::string &message) const;

    // Names starting with "<prefix>-", from any process. Throws
    // BackendExecutionError if the runtime cannot list.
    std::vector<std::string> list_containers(const std::string &prefix) const;

private:
    ProcessOutcome call(const std::vector<std::string> &args) const;

    std::string binary_;
    std::chrono::milliseconds call_timeout_;
};

std::vector<std::string> container_create_args(const std::string &name,
                                               const std::string &command,
                                               const ContainerLimits &limits);

bool is_daemon_unreachable(const std::string &output);

// Looks the binary up and asks it for its version once. Absent when the
// binary is missing or the daemon does not answer.
std::optional<ContainerRuntime> probe_container_runtime(const SandboxConfig &config);
