#include "core/app.h"

#include "core/cli.h"
#include "core/logging.h"
#include "core/sandbox_manager.h"
#include "core/strategy.h"

#include <iostream>

namespace {

constexpr int kTimeoutExitCode = 124;

void print_assessment(const RiskAssessment &risk) {
    std::cout << "risk: " << risk.severity << "/5"
              << (risk.is_risky ? " (risky)" : "") << " - " << risk.reason << "\n";
}

void print_output(const ExecutionResult &result) {
    if (!result.stdout_data.empty()) {
        std::cout << result.stdout_data;
        if (result.stdout_data.back() != '\n') {
            std::cout << "\n";
        }
    }
    if (!result.stderr_data.empty()) {
        std::cerr << result.stderr_data;
        if (result.stderr_data.back() != '\n') {
            std::cerr << "\n";
        }
    }
    if (result.output_truncated) {
        std::cerr << "(output truncated)\n";
    }
}

int report_cleanup(SandboxManager &manager) {
    if (!manager.container_available()) {
        std::cout << "cleanup: no container runtime available\n";
        return 0;
    }
    const auto report = manager.cleanup();
    std::cout << "cleanup: found " << report.found << ", removed " << report.removed
              << ", failed " << report.failed << ", skipped active " << report.skipped_active
              << "\n";
    return report.failed == 0 ? 0 : 1;
}

} // namespace

int run_app(int argc, char **argv) {
    SandboxConfig config;
    CliRequest request;
    int exit_code = parse_cli(argc, argv, config, request);
    if (exit_code != 0 || request.finished) {
        return exit_code;
    }

    if (request.classify_only) {
        print_assessment(classify_command(request.command));
        return 0;
    }

    try {
        SandboxManager manager(config);
        if (request.cleanup_only) {
            return report_cleanup(manager);
        }

        const auto risk = manager.classify(request.command);
        print_assessment(risk);

        if (request.exec.dry_run) {
            auto preview = request.exec;
            preview.dry_run = false;
            const auto decision =
                select_strategy(risk, preview, manager.container_available());
            std::cout << "would use: " << strategy_name(decision.strategy);
            if (decision.abort_reason != AbortReason::None) {
                std::cout << " (" << abort_reason_text(decision.abort_reason) << ")";
            }
            std::cout << "\n";
            return 0;
        }

        const auto result = manager.execute(request.command, request.exec);
        std::cout << "backend: " << strategy_name(result.backend_used)
                  << (result.fallback_used ? " (fallback)" : "") << "\n";
        print_output(result);

        switch (result.outcome) {
        case Outcome::Completed:
            std::cout << "exit: " << result.exit_code << "\n";
            return result.exit_code;
        case Outcome::TimedOut:
            std::cerr << result.error << "\n";
            return kTimeoutExitCode;
        case Outcome::Aborted:
        case Outcome::BackendFailed:
            std::cerr << outcome_name(result.outcome) << ": " << result.error << "\n";
            return 1;
        }
    } catch (const std::exception &e) {
        log_exception("shellguard error", e);
    }
    return 1;
}
