#pragma once

#include "core/options.h"

#include <string>

struct CliRequest {
    std::string command;
    ExecutionOptions exec;
    bool classify_only{false};
    bool cleanup_only{false};
    // Help or version text was printed; nothing else to do.
    bool finished{false};
};

int parse_cli(int argc, char **argv, SandboxConfig &config, CliRequest &request);
