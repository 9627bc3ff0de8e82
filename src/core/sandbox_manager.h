#pragma once

#include "core/execution_result.h"
#include "core/options.h"
#include "core/risk.h"
#include "exec/container_backend.h"
#include "exec/container_runtime.h"
#include "exec/direct_backend.h"
#include "exec/process_backend.h"
#include "exec/sandbox_registry.h"

#include <cstddef>
#include <optional>
#include <string>

struct CleanupReport {
    std::size_t found{0};
    std::size_t removed{0};
    std::size_t failed{0};
    std::size_t skipped_active{0};
};

// Force-removes every "<prefix>-*" container that is neither registered as
// active here nor named after another live process. Never throws; failures
// are counted.
CleanupReport cleanup_containers(const ContainerRuntime &runtime,
                                 const SandboxRegistry &registry,
                                 const std::string &prefix, bool verbose);

class SandboxManager {
public:
    // Probes the configured container runtime once.
    explicit SandboxManager(SandboxConfig config);
    SandboxManager(SandboxConfig config, std::optional<ContainerRuntime> runtime);

    SandboxManager(const SandboxManager &) = delete;
    SandboxManager &operator=(const SandboxManager &) = delete;

    RiskAssessment classify(const std::string &command) const;
    ExecutionResult execute(const std::string &command, const ExecutionOptions &opts);
    CleanupReport cleanup();

    bool container_available() const { return container_.available(); }
    const SandboxConfig &config() const { return config_; }
    SandboxRegistry &registry() { return active_sandboxes(); }

private:
    ExecutionResult run_strategy(Strategy strategy, const std::string &command,
                                 std::chrono::milliseconds deadline);

    SandboxConfig config_;
    DirectBackend direct_;
    ProcessBackend process_;
    ContainerBackend container_;
};
