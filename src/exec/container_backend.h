#pragma once

#include "core/execution_result.h"
#include "core/options.h"
#include "exec/container_runtime.h"
#include "exec/sandbox_registry.h"

#include <chrono>
#include <optional>
#include <string>

// One ephemeral, network-less, read-only, resource-capped container per
// command. The container is removed before run() returns on every path.
class ContainerBackend {
public:
    ContainerBackend(std::optional<ContainerRuntime> runtime, SandboxRegistry &registry,
                     const SandboxConfig &config);

    bool available() const { return runtime_.has_value(); }
    const std::optional<ContainerRuntime> &runtime() const { return runtime_; }

    // Throws BackendUnavailable without running anything when there is no
    // runtime or its daemon is unreachable; BackendExecutionError when the
    // container cannot be set up.
    ExecutionResult run(const std::string &command, std::chrono::milliseconds deadline) const;

private:
    std::optional<ContainerRuntime> runtime_;
    SandboxRegistry &registry_;
    SandboxConfig config_;
};
