#include "exec/container_backend.h"

#include "core/errors.h"
#include "core/logging.h"
#include "exec/process_backend.h"

#include <utility>

namespace {

std::string first_line(const std::string &text) {
    const auto end = text.find('\n');
    auto line = text.substr(0, end);
    return line.empty() ? "no output from runtime" : line;
}

// Registers the name for the lifetime of one run and force-removes the
// container on the way out, whatever happened in between.
class ContainerLease {
public:
    ContainerLease(const ContainerRuntime &runtime, SandboxRegistry &registry, std::string name,
                   bool verbose)
        : runtime_(runtime), registry_(registry), name_(std::move(name)), verbose_(verbose) {
        registry_.add(name_);
    }

    ~ContainerLease() {
        try {
            std::string message;
            if (runtime_.remove_container(name_, message)) {
                log_trace("removed container " + name_, verbose_);
            } else {
                // Left for cleanup(); the name stops being active below.
                log_warning("failed to remove container " + name_ + ": " + message);
            }
        } catch (const std::exception &e) {
            log_exception("Container removal error", e);
        }
        registry_.remove(name_);
    }

    ContainerLease(const ContainerLease &) = delete;
    ContainerLease &operator=(const ContainerLease &) = delete;

    const std::string &name() const { return name_; }

private:
    const ContainerRuntime &runtime_;
    SandboxRegistry &registry_;
    std::string name_;
    bool verbose_;
};

} // namespace

ContainerBackend::ContainerBackend(std::optional<ContainerRuntime> runtime,
                                   SandboxRegistry &registry, const SandboxConfig &config)
    : runtime_(std::move(runtime)), registry_(registry), config_(config) {}

ExecutionResult ContainerBackend::run(const std::string &command,
                                      std::chrono::milliseconds deadline) const {
    if (!runtime_) {
        throw BackendUnavailable("no container runtime available");
    }

    ContainerLease lease(*runtime_, registry_, make_container_name(config_.container_prefix),
                         config_.verbose);
    log_trace("container " + lease.name() + " image=" + config_.limits.image, config_.verbose);

    runtime_->create_container(lease.name(), command, config_.limits);
    auto outcome = runtime_->start_container(lease.name(), deadline, config_.max_output_bytes);
    if (!outcome.timed_out) {
        // The CLI's own status mixes runtime failures with the command's.
        const auto state = runtime_->inspect_container(lease.name());
        if (!state.started) {
            throw BackendExecutionError("container " + lease.name() + " did not start: " +
                                        first_line(outcome.stdout_data));
        }
        outcome.exit_code = state.exit_code;
    }
    return result_from_outcome(std::move(outcome), Strategy::ContainerIsolated);
}
