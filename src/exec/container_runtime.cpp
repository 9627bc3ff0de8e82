#include "exec/container_runtime.h"

#include "core/errors.h"
#include "core/logging.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <string_view>
#include <utility>

namespace {

constexpr int kCpuPeriod = 100000;
constexpr std::size_t kCallOutputLimit = 256 * 1024;
constexpr std::string_view kNeverStarted = "0001-01-01";

std::string to_lower(std::string input) {
    std::transform(input.begin(), input.end(), input.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return input;
}

std::string trim(const std::string &input) {
    const auto first = input.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = input.find_last_not_of(" \t\r\n");
    return input.substr(first, last - first + 1);
}

std::string describe_failure(const ProcessOutcome &outcome) {
    auto text = trim(outcome.stderr_data);
    if (text.empty()) {
        text = trim(outcome.stdout_data);
    }
    if (text.empty()) {
        text = "exit status " + std::to_string(outcome.exit_code);
    }
    return text;
}

} // namespace

ContainerRuntime::ContainerRuntime(std::string binary, std::chrono::milliseconds call_timeout)
    : binary_(std::move(binary)), call_timeout_(call_timeout) {}

ProcessOutcome ContainerRuntime::call(const std::vector<std::string> &args) const {
    ProcessSpec spec;
    spec.argv.reserve(args.size() + 1);
    spec.argv.push_back(binary_);
    spec.argv.insert(spec.argv.end(), args.begin(), args.end());
    spec.max_output_bytes = kCallOutputLimit;
    auto outcome = run_process(spec, call_timeout_);
    if (outcome.timed_out) {
        throw BackendExecutionError(binary_ + " " + (args.empty() ? "" : args.front()) +
                                    " did not answer in time");
    }
    return outcome;
}

std::vector<std::string> container_create_args(const std::string &name,
                                               const std::string &command,
                                               const ContainerLimits &limits) {
    std::vector<std::string> args = {
        "create",
        "--name", name,
        "--network", "none",
        "--read-only",
        "--tmpfs", "/tmp:" + limits.tmpfs_options,
        "--cap-drop", "ALL",
        "--security-opt", "no-new-privileges",
    };
    if (!limits.memory_limit.empty()) {
        args.insert(args.end(), {"--memory", limits.memory_limit,
                                 "--memory-swap", limits.memory_limit});
    }
    if (limits.cpu_fraction > 0.0) {
        const auto quota = std::max(1000L, std::lround(limits.cpu_fraction * kCpuPeriod));
        args.insert(args.end(), {"--cpu-period", std::to_string(kCpuPeriod),
                                 "--cpu-quota", std::to_string(quota)});
    }
    if (limits.pids_limit > 0) {
        args.insert(args.end(), {"--pids-limit", std::to_string(limits.pids_limit)});
    }
    args.insert(args.end(), {limits.image, "/bin/sh", "-c", command});
    return args;
}

bool is_daemon_unreachable(const std::string &output) {
    const auto lower = to_lower(output);
    return lower.find("cannot connect to the docker daemon") != std::string::npos ||
           lower.find("is the docker daemon running") != std::string::npos ||
           lower.find("cannot connect to podman") != std::string::npos;
}

void ContainerRuntime::create_container(const std::string &name, const std::string &command,
                                        const ContainerLimits &limits) const {
    auto outcome = call(container_create_args(name, command, limits));
    if (outcome.exit_code == 0) {
        return;
    }
    const auto detail = describe_failure(outcome);
    if (is_daemon_unreachable(outcome.stderr_data + outcome.stdout_data)) {
        throw BackendUnavailable("container runtime unreachable: " + detail);
    }
    throw BackendExecutionError("container create failed: " + detail);
}

ProcessOutcome ContainerRuntime::start_container(const std::string &name,
                                                 std::chrono::milliseconds deadline,
                                                 std::size_t max_output_bytes) const {
    ProcessSpec spec;
    spec.argv = {binary_, "start", "--attach", name};
    spec.merge_stderr = true;
    spec.max_output_bytes = max_output_bytes;
    return run_process(spec, deadline);
}

ContainerState ContainerRuntime::inspect_container(const std::string &name) const {
    auto outcome =
        call({"inspect", "--format", "{{.State.StartedAt}} {{.State.ExitCode}}", name});
    if (outcome.exit_code != 0) {
        throw BackendExecutionError("container inspect failed: " + describe_failure(outcome));
    }
    // Podman prints StartedAt with spaces; the exit code is the last field.
    const auto line = trim(outcome.stdout_data);
    const auto split = line.rfind(' ');
    if (split == std::string::npos) {
        throw BackendExecutionError("unexpected inspect output: " + line);
    }
    ContainerState state;
    try {
        state.exit_code = std::stoi(line.substr(split + 1));
    } catch (const std::exception &) {
        throw BackendExecutionError("unexpected inspect output: " + line);
    }
    // A container that never started keeps the zero time.
    state.started = line.compare(0, kNeverStarted.size(), kNeverStarted) != 0;
    return state;
}

bool ContainerRuntime::remove_container(const std::string &name, std::string &message) const {
    try {
        auto outcome = call({"rm", "--force", name});
        if (outcome.exit_code == 0) {
            message.clear();
            return true;
        }
        const auto detail = describe_failure(outcome);
        if (to_lower(detail).find("no such container") != std::string::npos) {
            message.clear();
            return true;
        }
        message = detail;
        return false;
    } catch (const BackendExecutionError &e) {
        message = e.what();
        return false;
    }
}

std::vector<std::string> ContainerRuntime::list_containers(const std::string &prefix) const {
    auto outcome = call({"ps", "--all", "--filter", "name=" + prefix, "--format", "{{.Names}}"});
    if (outcome.exit_code != 0) {
        throw BackendExecutionError("container list failed: " + describe_failure(outcome));
    }
    // The runtime filter is a substring match; keep exact prefix matches only.
    const auto wanted = prefix + "-";
    std::vector<std::string> names;
    std::istringstream lines(outcome.stdout_data);
    std::string line;
    while (std::getline(lines, line)) {
        auto name = trim(line);
        if (!name.empty() && name[0] == '/') {
            name.erase(0, 1);
        }
        if (name.compare(0, wanted.size(), wanted) == 0) {
            names.push_back(std::move(name));
        }
    }
    return names;
}

std::optional<ContainerRuntime> probe_container_runtime(const SandboxConfig &config) {
    auto binary = find_executable(config.runtime_binary);
    if (!binary) {
        log_trace("container runtime not found: " + config.runtime_binary, config.verbose);
        return std::nullopt;
    }
    ContainerRuntime runtime(*binary, config.runtime_call_timeout);
    try {
        ProcessSpec spec;
        spec.argv = {*binary, "version"};
        spec.max_output_bytes = kCallOutputLimit;
        auto outcome = run_process(spec, config.runtime_call_timeout);
        if (outcome.timed_out || outcome.exit_code != 0) {
            log_trace("container runtime not usable: " + describe_failure(outcome),
                      config.verbose);
            return std::nullopt;
        }
    } catch (const BackendExecutionError &e) {
        log_trace(std::string("container runtime probe failed: ") + e.what(), config.verbose);
        return std::nullopt;
    }
    log_trace("container runtime available: " + *binary, config.verbose);
    return runtime;
}
