#include <catch2/catch_test_macros.hpp>

#include "core/strategy.h"

namespace {

RiskAssessment risk_of(int severity) {
    RiskAssessment risk;
    risk.severity = severity;
    risk.is_risky = severity >= kRiskySeverity;
    return risk;
}

} // namespace

TEST_CASE("dry run always aborts", "[strategy]") {
    ExecutionOptions opts;
    opts.dry_run = true;
    for (int severity = kMinSeverity; severity <= kMaxSeverity; ++severity) {
        for (bool container : {true, false}) {
            opts.force_sandbox = severity % 2 == 0;
            opts.execute_requested = container;
            auto decision = select_strategy(risk_of(severity), opts, container);
            REQUIRE(decision.strategy == Strategy::Abort);
            REQUIRE(decision.abort_reason == AbortReason::DryRun);
        }
    }
}

TEST_CASE("explicit execute of severity 4 without sandbox aborts", "[strategy]") {
    ExecutionOptions opts;
    opts.execute_requested = true;
    for (int severity : {4, 5}) {
        auto decision = select_strategy(risk_of(severity), opts, true);
        REQUIRE(decision.strategy == Strategy::Abort);
        REQUIRE(decision.abort_reason == AbortReason::RequiresExplicitSandbox);
    }
}

TEST_CASE("explicit sandbox opt-in runs high risk isolated", "[strategy]") {
    ExecutionOptions opts;
    opts.execute_requested = true;
    opts.force_sandbox = true;
    REQUIRE(select_strategy(risk_of(5), opts, true).strategy == Strategy::ContainerIsolated);
    REQUIRE(select_strategy(risk_of(5), opts, false).strategy == Strategy::ProcessIsolated);
}

TEST_CASE("severity 3 is sandboxed without asking", "[strategy]") {
    ExecutionOptions opts;
    auto with_runtime = select_strategy(risk_of(3), opts, true);
    REQUIRE(with_runtime.strategy == Strategy::ContainerIsolated);
    REQUIRE(with_runtime.abort_reason == AbortReason::None);

    auto without_runtime = select_strategy(risk_of(3), opts, false);
    REQUIRE(without_runtime.strategy == Strategy::ProcessIsolated);

    opts.execute_requested = true;
    REQUIRE(select_strategy(risk_of(3), opts, false).strategy == Strategy::ProcessIsolated);
}

TEST_CASE("low risk runs direct unless sandbox forced", "[strategy]") {
    ExecutionOptions opts;
    REQUIRE(select_strategy(risk_of(1), opts, true).strategy == Strategy::Direct);
    REQUIRE(select_strategy(risk_of(2), opts, true).strategy == Strategy::Direct);

    opts.force_sandbox = true;
    REQUIRE(select_strategy(risk_of(1), opts, true).strategy == Strategy::ContainerIsolated);
    REQUIRE(select_strategy(risk_of(1), opts, false).strategy == Strategy::ProcessIsolated);
}

TEST_CASE("strategy names are stable", "[strategy]") {
    REQUIRE(strategy_name(Strategy::Direct) == "direct");
    REQUIRE(strategy_name(Strategy::ProcessIsolated) == "process");
    REQUIRE(strategy_name(Strategy::ContainerIsolated) == "container");
    REQUIRE(strategy_name(Strategy::Abort) == "abort");
    REQUIRE(abort_reason_text(AbortReason::None).empty());
    REQUIRE_FALSE(abort_reason_text(AbortReason::RequiresExplicitSandbox).empty());
}
