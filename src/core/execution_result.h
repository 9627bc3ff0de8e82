#pragma once

#include "core/risk.h"
#include "core/strategy.h"

#include <string>

enum class Outcome {
    Completed,
    TimedOut,
    Aborted,
    BackendFailed
};

struct ExecutionResult {
    // Real exit status of the command when Completed, -1 otherwise.
    int exit_code{-1};
    std::string stdout_data;
    std::string stderr_data;
    Strategy backend_used{Strategy::Abort};
    bool timed_out{false};
    Outcome outcome{Outcome::Completed};
    // Subsystem error text; never the command's own stderr.
    std::string error;
    RiskAssessment risk;
    AbortReason abort_reason{AbortReason::None};
    bool fallback_used{false};
    bool output_truncated{false};
};

inline const char *timeout_error_text() {
    return "execution exceeded time budget";
}

inline std::string outcome_name(Outcome outcome) {
    switch (outcome) {
    case Outcome::Completed:
        return "completed";
    case Outcome::TimedOut:
        return "timed out";
    case Outcome::Aborted:
        return "aborted";
    case Outcome::BackendFailed:
        return "backend failed";
    }
    return "unknown";
}
