#include "exec/direct_backend.h"

#include "exec/process_backend.h"
#include "exec/process_runner.h"

ExecutionResult DirectBackend::run(const std::string &command,
                                   std::chrono::milliseconds deadline) const {
    ProcessSpec spec;
    spec.argv = {"/bin/sh", "-c", command};
    spec.max_output_bytes = max_output_bytes_;
    return result_from_outcome(run_process(spec, deadline), Strategy::Direct);
}
