#pragma once

#include "core/options.h"
#include "core/risk.h"

#include <string>

enum class Strategy {
    Direct,
    ProcessIsolated,
    ContainerIsolated,
    Abort
};

enum class AbortReason {
    None,
    DryRun,
    RequiresExplicitSandbox
};

struct StrategyDecision {
    Strategy strategy{Strategy::Direct};
    AbortReason abort_reason{AbortReason::None};
};

StrategyDecision select_strategy(const RiskAssessment &risk, const ExecutionOptions &opts,
                                 bool container_available);

std::string strategy_name(Strategy strategy);
std::string abort_reason_text(AbortReason reason);
