#include "core/risk.h"

#include <algorithm>
#include <cctype>

namespace {

std::string to_lower(const std::string &input) {
    auto lower = input;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

} // namespace

const std::vector<RiskPattern> &risk_patterns() {
    static const std::vector<RiskPattern> patterns = {
        // Catastrophic: recursive delete, disk format, raw device writes.
        {"rm -rf", 5, "Recursive deletion - can destroy entire filesystem"},
        {"rm -fr", 5, "Recursive deletion - can destroy entire filesystem"},
        {"rm -r", 5, "Recursive deletion"},
        {"mkfs", 5, "Disk formatting - will destroy all data on device"},
        {"dd if=", 5, "Raw disk operations - can overwrite critical data"},
        {"of=/dev/", 5, "Raw write to a device node"},
        {"> /dev/sd", 5, "Redirect into a block device"},
        {"wipefs", 5, "Filesystem signature wipe"},
        {"shred", 5, "Irrecoverable file overwrite"},
        {":(){", 5, "Fork bomb"},

        // Forceful kills, elevated deletion, unsafe permission grants.
        {"fdisk", 4, "Disk partitioning - can affect system boot"},
        {"parted", 4, "Disk partitioning - can affect system boot"},
        {"kill -9", 4, "Force kill processes - can crash system"},
        {"pkill", 4, "Kill multiple processes"},
        {"killall", 4, "Kill multiple processes"},
        {"sudo rm", 4, "Elevated deletion privileges"},
        {"chmod 777", 4, "Dangerous permission changes"},
        {"chmod -r 777", 4, "Dangerous permission changes"},
        {"chmod a+rwx", 4, "Dangerous permission changes"},

        // Privilege, ownership, permission and mount changes.
        {"sudo", 3, "Elevated privileges"},
        {"su -", 3, "Switch to another user"},
        {"chown", 3, "Ownership changes"},
        {"chgrp", 3, "Group ownership changes"},
        {"chmod", 3, "Permission changes"},
        {"mount", 3, "Filesystem mount changes"},
        {"systemctl", 3, "Service state changes"},

        // Plain deletion, moves, archive extraction, history rewrites.
        {"rm", 2, "File deletion"},
        {"mv", 2, "File movement - potential data loss"},
        {"tar -x", 2, "Archive extraction can overwrite files"},
        {"tar x", 2, "Archive extraction can overwrite files"},
        {"unzip", 2, "Archive extraction can overwrite files"},
        {"git push --force", 2, "Force push rewrites remote history"},
        {"git push -f", 2, "Force push rewrites remote history"},
        {"git reset --hard", 2, "Discards uncommitted changes"},
        {"git clean", 2, "Deletes untracked files"},
    };
    return patterns;
}

RiskAssessment classify_command(const std::string &command) {
    const auto lowered = to_lower(command);

    const RiskPattern *worst = nullptr;
    for (const auto &entry : risk_patterns()) {
        if (lowered.find(entry.pattern) == std::string::npos) {
            continue;
        }
        // Strictly greater keeps the first pattern defined at a severity.
        if (!worst || entry.severity > worst->severity) {
            worst = &entry;
        }
    }

    RiskAssessment assessment;
    if (!worst) {
        assessment.severity = kMinSeverity;
        assessment.is_risky = false;
        assessment.reason = "no known risk pattern matched";
        return assessment;
    }
    assessment.severity = worst->severity;
    assessment.is_risky = worst->severity >= kRiskySeverity;
    assessment.reason = worst->reason;
    assessment.pattern = worst->pattern;
    return assessment;
}
