#include "core/sandbox_manager.h"

#include "core/errors.h"
#include "core/logging.h"

#include <utility>

CleanupReport cleanup_containers(const ContainerRuntime &runtime,
                                 const SandboxRegistry &registry,
                                 const std::string &prefix, bool verbose) {
    CleanupReport report;
    std::vector<std::string> names;
    try {
        names = runtime.list_containers(prefix);
    } catch (const std::exception &e) {
        log_warning(std::string("cleanup could not list containers: ") + e.what());
        ++report.failed;
        return report;
    }

    report.found = names.size();
    for (const auto &name : names) {
        if (registry.contains(name)) {
            log_trace("cleanup skips active container " + name, verbose);
            ++report.skipped_active;
            continue;
        }
        if (owned_by_other_live_process(name, prefix)) {
            log_trace("cleanup skips container of a running process " + name, verbose);
            ++report.skipped_active;
            continue;
        }
        std::string message;
        bool removed = false;
        try {
            removed = runtime.remove_container(name, message);
        } catch (const std::exception &e) {
            message = e.what();
        }
        if (removed) {
            log_trace("cleanup removed container " + name, verbose);
            ++report.removed;
        } else {
            log_warning("cleanup failed to remove " + name + ": " + message);
            ++report.failed;
        }
    }
    return report;
}

SandboxManager::SandboxManager(SandboxConfig config)
    : SandboxManager(config, probe_container_runtime(config)) {}

SandboxManager::SandboxManager(SandboxConfig config, std::optional<ContainerRuntime> runtime)
    : config_(std::move(config)),
      direct_(config_.max_output_bytes),
      process_(config_.max_output_bytes),
      container_(std::move(runtime), active_sandboxes(), config_) {}

RiskAssessment SandboxManager::classify(const std::string &command) const {
    return classify_command(command);
}

ExecutionResult SandboxManager::run_strategy(Strategy strategy, const std::string &command,
                                             std::chrono::milliseconds deadline) {
    switch (strategy) {
    case Strategy::Direct:
        return direct_.run(command, deadline);
    case Strategy::ProcessIsolated:
        return process_.run(command, deadline);
    case Strategy::ContainerIsolated:
        try {
            return container_.run(command, deadline);
        } catch (const BackendUnavailable &e) {
            // Nothing ran inside a container, so running it here is not a rerun.
            log_warning(std::string("container backend unavailable, using process isolation: ") +
                        e.what());
            auto result = process_.run(command, deadline);
            result.fallback_used = true;
            return result;
        }
    case Strategy::Abort:
        break;
    }
    throw BackendExecutionError("no backend for strategy " + strategy_name(strategy));
}

ExecutionResult SandboxManager::execute(const std::string &command,
                                        const ExecutionOptions &opts) {
    const auto risk = classify_command(command);
    const auto decision = select_strategy(risk, opts, container_.available());
    const auto deadline = opts.deadline.value_or(config_.default_deadline);

    log_trace("risk severity=" + std::to_string(risk.severity) + " strategy=" +
                  strategy_name(decision.strategy),
              config_.verbose);

    if (decision.strategy == Strategy::Abort) {
        ExecutionResult result;
        result.backend_used = Strategy::Abort;
        result.outcome = Outcome::Aborted;
        result.exit_code = -1;
        result.abort_reason = decision.abort_reason;
        result.error = abort_reason_text(decision.abort_reason);
        result.risk = risk;
        return result;
    }

    ExecutionResult result;
    try {
        result = run_strategy(decision.strategy, command, deadline);
    } catch (const BackendExecutionError &e) {
        log_exception("Backend execution error", e);
        result = ExecutionResult{};
        result.backend_used = decision.strategy;
        result.outcome = Outcome::BackendFailed;
        result.exit_code = -1;
        result.error = e.what();
    }
    result.risk = risk;
    return result;
}

CleanupReport SandboxManager::cleanup() {
    const auto &runtime = container_.runtime();
    if (!runtime) {
        return {};
    }
    try {
        return cleanup_containers(*runtime, active_sandboxes(), config_.container_prefix,
                                  config_.verbose);
    } catch (const std::exception &e) {
        log_exception("Cleanup error", e);
        CleanupReport report;
        report.failed = 1;
        return report;
    }
}
