#include <catch2/catch_test_macros.hpp>

#include "core/errors.h"
#include "exec/direct_backend.h"
#include "exec/process_backend.h"
#include "exec/process_runner.h"
#include "exec/scoped_temp_dir.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

using namespace std::chrono_literals;

namespace {

constexpr std::size_t kOutputLimit = 1024 * 1024;

std::vector<std::string> lines_of(const std::string &text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

// Zombies count as gone: they no longer run anything.
bool process_running(pid_t pid) {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (!stat) {
        return false;
    }
    std::string content;
    std::getline(stat, content);
    const auto close_paren = content.rfind(')');
    if (close_paren == std::string::npos || close_paren + 2 >= content.size()) {
        return false;
    }
    const char state = content[close_paren + 2];
    return state != 'Z' && state != 'X';
}

} // namespace

TEST_CASE("process backend captures stdout and exit code", "[process]") {
    ProcessBackend backend(kOutputLimit);
    auto result = backend.run("echo hello", 10s);
    REQUIRE(result.outcome == Outcome::Completed);
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stdout_data == "hello\n");
    REQUIRE(result.stderr_data.empty());
    REQUIRE(result.backend_used == Strategy::ProcessIsolated);
    REQUIRE_FALSE(result.timed_out);
}

TEST_CASE("process backend keeps stderr separate", "[process]") {
    ProcessBackend backend(kOutputLimit);
    auto result = backend.run("echo out; echo err >&2", 10s);
    REQUIRE(result.stdout_data == "out\n");
    REQUIRE(result.stderr_data == "err\n");
}

TEST_CASE("non-zero exit is a normal result", "[process]") {
    ProcessBackend backend(kOutputLimit);
    auto result = backend.run("echo partial; exit 7", 10s);
    REQUIRE(result.outcome == Outcome::Completed);
    REQUIRE(result.exit_code == 7);
    REQUIRE(result.error.empty());
    REQUIRE(result.stdout_data == "partial\n");
}

TEST_CASE("signalled command reports 128 plus signal", "[process]") {
    ProcessBackend backend(kOutputLimit);
    auto result = backend.run("kill -TERM $$", 10s);
    REQUIRE(result.outcome == Outcome::Completed);
    REQUIRE(result.exit_code == 128 + 15);
}

TEST_CASE("HOME and TMPDIR point into a directory removed afterwards", "[process]") {
    ProcessBackend backend(kOutputLimit);
    auto result = backend.run("echo \"$HOME\"; echo \"$TMPDIR\"; touch \"$HOME/stray\"", 10s);
    REQUIRE(result.exit_code == 0);

    auto lines = lines_of(result.stdout_data);
    REQUIRE(lines.size() == 2);
    const std::filesystem::path home(lines[0]);
    const std::filesystem::path tmp(lines[1]);
    REQUIRE(home.filename() == "home");
    REQUIRE(tmp.filename() == "tmp");
    REQUIRE(home.parent_path() == tmp.parent_path());
    REQUIRE_FALSE(std::filesystem::exists(home.parent_path()));
}

TEST_CASE("working directory is the scratch directory", "[process]") {
    ProcessBackend backend(kOutputLimit);
    auto result = backend.run("ls -A; echo \"$HOME\"", 10s);
    auto lines = lines_of(result.stdout_data);
    REQUIRE(lines.size() == 3);
    REQUIRE(lines[0] == "home");
    REQUIRE(lines[1] == "tmp");
}

TEST_CASE("scratch directory is removed even if the command locks it down", "[process]") {
    ProcessBackend backend(kOutputLimit);
    auto result = backend.run("mkdir -p locked/inner && touch locked/inner/f && "
                              "chmod 0500 locked/inner && chmod 0500 locked && pwd",
                              10s);
    REQUIRE(result.exit_code == 0);
    auto lines = lines_of(result.stdout_data);
    REQUIRE(lines.size() == 1);
    REQUIRE_FALSE(std::filesystem::exists(lines[0]));
}

TEST_CASE("deadline kills the command and reports a timeout", "[process][timeout]") {
    ProcessBackend backend(kOutputLimit);
    const auto started = std::chrono::steady_clock::now();
    auto result = backend.run("echo $$; exec sleep 60", 2s);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(result.timed_out);
    REQUIRE(result.outcome == Outcome::TimedOut);
    REQUIRE(result.exit_code == -1);
    REQUIRE(result.error == "execution exceeded time budget");
    REQUIRE(elapsed < 10s);

    auto lines = lines_of(result.stdout_data);
    REQUIRE(lines.size() == 1);
    const auto pid = static_cast<pid_t>(std::stol(lines[0]));
    REQUIRE_FALSE(process_running(pid));
}

TEST_CASE("deadline also kills background children", "[process][timeout]") {
    ProcessBackend backend(kOutputLimit);
    auto result = backend.run("sleep 60 & echo $!; wait", 1s);
    REQUIRE(result.timed_out);

    auto lines = lines_of(result.stdout_data);
    REQUIRE(lines.size() == 1);
    const auto pid = static_cast<pid_t>(std::stol(lines[0]));
    // The orphan is killed with its group; give init a moment to reap it.
    for (int i = 0; i < 50 && process_running(pid); ++i) {
        std::this_thread::sleep_for(20ms);
    }
    REQUIRE_FALSE(process_running(pid));
}

TEST_CASE("background children do not outlive a completed run", "[process]") {
    ProcessBackend backend(kOutputLimit);
    auto result = backend.run("sleep 60 >/dev/null 2>&1 & echo $!", 10s);
    REQUIRE(result.outcome == Outcome::Completed);
    REQUIRE(result.exit_code == 0);

    auto lines = lines_of(result.stdout_data);
    REQUIRE(lines.size() == 1);
    const auto pid = static_cast<pid_t>(std::stol(lines[0]));
    for (int i = 0; i < 50 && process_running(pid); ++i) {
        std::this_thread::sleep_for(20ms);
    }
    REQUIRE_FALSE(process_running(pid));
}

TEST_CASE("output beyond the limit is truncated", "[process]") {
    ProcessBackend backend(16);
    auto result = backend.run("printf '0123456789%.0s' 1 2 3 4 5", 10s);
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stdout_data == "0123456789012345");
    REQUIRE(result.output_truncated);
}

TEST_CASE("direct backend runs in the caller's environment", "[process][direct]") {
    DirectBackend backend(kOutputLimit);
    auto result = backend.run("echo \"$SHELLGUARD_TEST_MARKER\"; exit 3", 10s);
    REQUIRE(result.backend_used == Strategy::Direct);
    REQUIRE(result.exit_code == 3);
    REQUIRE(result.stdout_data == "\n");
}

TEST_CASE("direct backend honours the deadline", "[process][direct][timeout]") {
    DirectBackend backend(kOutputLimit);
    auto result = backend.run("sleep 30", 500ms);
    REQUIRE(result.timed_out);
    REQUIRE(result.exit_code == -1);
}

TEST_CASE("run_process applies environment overrides", "[process][runner]") {
    ProcessSpec spec;
    spec.argv = {"sh", "-c", "echo \"$SHELLGUARD_A:$PATH\""};
    spec.env_overrides = {{"SHELLGUARD_A", "one"}, {"PATH", "/usr/bin:/bin"}};
    auto outcome = run_process(spec, 10s);
    REQUIRE(outcome.exit_code == 0);
    REQUIRE(outcome.stdout_data == "one:/usr/bin:/bin\n");
}

TEST_CASE("run_process can merge stderr into stdout", "[process][runner]") {
    ProcessSpec spec;
    spec.argv = {"/bin/sh", "-c", "echo a; echo b >&2"};
    spec.merge_stderr = true;
    auto outcome = run_process(spec, 10s);
    REQUIRE(outcome.stderr_data.empty());
    REQUIRE(outcome.stdout_data.find('a') != std::string::npos);
    REQUIRE(outcome.stdout_data.find('b') != std::string::npos);
}

TEST_CASE("run_process gives the child an empty stdin", "[process][runner]") {
    ProcessSpec spec;
    spec.argv = {"/bin/sh", "-c", "cat; echo done"};
    auto outcome = run_process(spec, 5s);
    REQUIRE_FALSE(outcome.timed_out);
    REQUIRE(outcome.stdout_data == "done\n");
}

TEST_CASE("launch failures are backend errors", "[process][runner]") {
    ProcessSpec missing;
    missing.argv = {"/nonexistent/shellguard-binary"};
    REQUIRE_THROWS_AS(run_process(missing, 5s), BackendExecutionError);

    ProcessSpec bad_dir;
    bad_dir.argv = {"/bin/sh", "-c", "true"};
    bad_dir.working_dir = "/nonexistent/shellguard-dir";
    REQUIRE_THROWS_AS(run_process(bad_dir, 5s), BackendExecutionError);

    ProcessSpec empty;
    REQUIRE_THROWS_AS(run_process(empty, 5s), BackendExecutionError);
}

TEST_CASE("find_executable searches PATH", "[process][runner]") {
    REQUIRE(find_executable("sh").has_value());
    REQUIRE(find_executable("/bin/sh") == std::optional<std::string>("/bin/sh"));
    REQUIRE_FALSE(find_executable("shellguard-no-such-tool").has_value());
    REQUIRE_FALSE(find_executable("").has_value());
}

TEST_CASE("scoped temp dirs are unique and removed", "[process][tempdir]") {
    std::filesystem::path first_path;
    {
        ScopedTempDir first("shellguard-test-");
        ScopedTempDir second("shellguard-test-");
        REQUIRE(first.path() != second.path());
        REQUIRE(std::filesystem::is_directory(first.path()));
        auto sub = first.make_subdir("nested");
        std::ofstream(sub / "file") << "data";
        first_path = first.path();
    }
    REQUIRE_FALSE(std::filesystem::exists(first_path));
}

TEST_CASE("exited command is not a timeout when an escaped child holds the pipes",
          "[process][timeout]") {
    if (!find_executable("setsid")) {
        SKIP("setsid not installed");
    }
    ProcessBackend backend(kOutputLimit);
    const auto started = std::chrono::steady_clock::now();
    auto result = backend.run("setsid sleep 5 & echo started", 10s);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE_FALSE(result.timed_out);
    REQUIRE(result.outcome == Outcome::Completed);
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stdout_data == "started\n");
    REQUIRE(elapsed < 4s);
}
