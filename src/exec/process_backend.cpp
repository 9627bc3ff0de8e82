#include "exec/process_backend.h"

#include "exec/scoped_temp_dir.h"

#include <utility>

namespace {

const char *kShell = "/bin/sh";

} // namespace

ExecutionResult result_from_outcome(ProcessOutcome outcome, Strategy backend) {
    ExecutionResult result;
    result.backend_used = backend;
    result.stdout_data = std::move(outcome.stdout_data);
    result.stderr_data = std::move(outcome.stderr_data);
    result.output_truncated = outcome.truncated;
    if (outcome.timed_out) {
        result.timed_out = true;
        result.exit_code = -1;
        result.outcome = Outcome::TimedOut;
        result.error = timeout_error_text();
        return result;
    }
    result.exit_code = outcome.exit_code;
    result.outcome = Outcome::Completed;
    return result;
}

ExecutionResult ProcessBackend::run(const std::string &command,
                                    std::chrono::milliseconds deadline) const {
    // Removed on every exit path, including exceptions from run_process.
    ScopedTempDir scratch("shellguard-");
    const auto home = scratch.make_subdir("home");
    const auto tmp = scratch.make_subdir("tmp");

    ProcessSpec spec;
    spec.argv = {kShell, "-c", command};
    spec.working_dir = scratch.path().string();
    spec.env_overrides = {{"HOME", home.string()}, {"TMPDIR", tmp.string()}};
    spec.max_output_bytes = max_output_bytes_;

    return result_from_outcome(run_process(spec, deadline), Strategy::ProcessIsolated);
}
