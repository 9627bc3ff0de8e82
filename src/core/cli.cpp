#include "core/cli.h"

#include <CLI/CLI.hpp>

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

namespace chrono = std::chrono;

namespace {

constexpr double kMinTimeoutSeconds = 0.001;
constexpr double kMaxTimeoutSeconds = 86400.0;

std::string join_words(const std::vector<std::string> &words) {
    std::string joined;
    for (const auto &word : words) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += word;
    }
    return joined;
}

} // namespace

int parse_cli(int argc, char **argv, SandboxConfig &config, CliRequest &request) {
    CLI::App app{"Risk-classifying sandboxed shell command runner"};

    std::vector<std::string> words;
    double timeout_seconds =
        static_cast<double>(config.default_deadline.count()) / 1000.0;
    bool execute = false;
    bool sandbox = false;
    bool dry_run = false;
    bool classify_only = false;
    bool cleanup_only = false;
    bool verbose = false;

    app.add_option("command", words, "Shell command to classify or run (use -- before it)")
        ->expected(-1);
    app.add_flag("--execute", execute, "Run the command (high-risk commands also need --sandbox)");
    app.add_flag("--sandbox", sandbox, "Force an isolated backend");
    app.add_flag("--dry-run", dry_run, "Classify and pick a backend, run nothing");
    app.add_flag("--classify", classify_only, "Only print the risk assessment");
    app.add_flag("--cleanup", cleanup_only, "Remove leftover sandbox containers and exit");
    app.add_option("-t,--timeout", timeout_seconds, "Execution deadline in seconds")
        ->check(CLI::Range(kMinTimeoutSeconds, kMaxTimeoutSeconds))
        ->capture_default_str();
    app.add_option("--image", config.limits.image, "Container image")
        ->capture_default_str();
    app.add_option("--memory", config.limits.memory_limit, "Container memory ceiling")
        ->capture_default_str();
    app.add_option("--cpus", config.limits.cpu_fraction, "Container CPU quota (fraction of a core)")
        ->check(CLI::Range(0.01, 64.0))
        ->capture_default_str();
    app.add_option("--runtime", config.runtime_binary, "Container CLI (docker, podman)")
        ->capture_default_str();
    app.add_flag("-v,--verbose", verbose, "Enable verbose tracing");

    try {
        app.parse(argc, argv);
    } catch (const CLI::CallForHelp &e) {
        request.finished = true;
        return app.exit(e);
    } catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    if (!cleanup_only && words.empty()) {
        std::cerr << "A command is required unless --cleanup is given\n";
        return 2;
    }
    if (classify_only && cleanup_only) {
        std::cerr << "--classify cannot be used with --cleanup\n";
        return 2;
    }

    config.default_deadline = chrono::milliseconds(std::llround(timeout_seconds * 1000));
    config.verbose = verbose;

    request.command = join_words(words);
    request.exec.execute_requested = execute;
    request.exec.force_sandbox = sandbox;
    // Without --execute nothing runs; the selection is still shown.
    request.exec.dry_run = dry_run || !execute;
    request.classify_only = classify_only;
    request.cleanup_only = cleanup_only;
    return 0;
}
