#pragma once

#include <string>
#include <vector>

struct RiskPattern {
    std::string pattern;
    int severity;
    std::string reason;
};

struct RiskAssessment {
    bool is_risky{false};
    int severity{1};
    std::string reason;
    std::string pattern;
};

constexpr int kMinSeverity = 1;
constexpr int kMaxSeverity = 5;
constexpr int kRiskySeverity = 2;

// Ordered, lower-case pattern table. Order only matters for picking the
// reason among patterns of equal severity.
const std::vector<RiskPattern> &risk_patterns();

RiskAssessment classify_command(const std::string &command);
