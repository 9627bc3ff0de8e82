#include "core/strategy.h"

namespace {

constexpr int kExplicitSandboxSeverity = 4;
constexpr int kAutoSandboxSeverity = 3;

} // namespace

StrategyDecision select_strategy(const RiskAssessment &risk, const ExecutionOptions &opts,
                                 bool container_available) {
    if (opts.dry_run) {
        return {Strategy::Abort, AbortReason::DryRun};
    }
    // Severity 4/5 never runs unsandboxed, even when execution was asked for.
    if (opts.execute_requested && !opts.force_sandbox &&
        risk.severity >= kExplicitSandboxSeverity) {
        return {Strategy::Abort, AbortReason::RequiresExplicitSandbox};
    }
    if (opts.force_sandbox || risk.severity >= kAutoSandboxSeverity) {
        return {container_available ? Strategy::ContainerIsolated : Strategy::ProcessIsolated,
                AbortReason::None};
    }
    return {Strategy::Direct, AbortReason::None};
}

std::string strategy_name(Strategy strategy) {
    switch (strategy) {
    case Strategy::Direct:
        return "direct";
    case Strategy::ProcessIsolated:
        return "process";
    case Strategy::ContainerIsolated:
        return "container";
    case Strategy::Abort:
        return "abort";
    }
    return "unknown";
}

std::string abort_reason_text(AbortReason reason) {
    switch (reason) {
    case AbortReason::None:
        return "";
    case AbortReason::DryRun:
        return "dry run: command not executed";
    case AbortReason::RequiresExplicitSandbox:
        return "requires explicit sandbox: high-risk command refused for direct execution";
    }
    return "";
}
