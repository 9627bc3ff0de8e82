#include "exec/process_runner.h"

#include "core/errors.h"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <fcntl.h>
#include <signal.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>

#ifndef __NR_pidfd_open
#define __NR_pidfd_open 434
#endif

namespace asio = boost::asio;

using asio::awaitable;
using asio::co_spawn;
using asio::detached;
using asio::redirect_error;
using asio::steady_timer;
using asio::use_awaitable;
using asio::posix::stream_descriptor;

namespace {

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd &) = delete;
    UniqueFd &operator=(const UniqueFd &) = delete;

    UniqueFd(UniqueFd &&other) noexcept : fd_(other.release()) {}
    UniqueFd &operator=(UniqueFd &&other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    int get() const { return fd_; }

    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_{-1};
};

struct PipePair {
    UniqueFd read_end;
    UniqueFd write_end;
};

PipePair make_pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw BackendExecutionError("pipe failed: " + std::string(std::strerror(errno)));
    }
    PipePair pair;
    pair.read_end.reset(fds[0]);
    pair.write_end.reset(fds[1]);
    return pair;
}

int open_pidfd(pid_t pid) {
    return static_cast<int>(syscall(__NR_pidfd_open, pid, 0));
}

std::vector<std::string> build_environment(
    const std::vector<std::pair<std::string, std::string>> &overrides) {
    std::vector<std::string> env;
    for (char **entry = environ; entry && *entry; ++entry) {
        std::string item(*entry);
        const auto key = item.substr(0, item.find('='));
        const bool overridden =
            std::any_of(overrides.begin(), overrides.end(),
                        [&key](const auto &kv) { return kv.first == key; });
        if (!overridden) {
            env.push_back(std::move(item));
        }
    }
    for (const auto &kv : overrides) {
        env.push_back(kv.first + "=" + kv.second);
    }
    return env;
}

std::vector<char *> to_c_array(std::vector<std::string> &items) {
    std::vector<char *> out;
    out.reserve(items.size() + 1);
    for (auto &item : items) {
        out.push_back(item.data());
    }
    out.push_back(nullptr);
    return out;
}

// Shared between the readers, the exit waiter and the deadline watchdog.
// Handlers run on a single-threaded io_context, so no locking.
struct WaitState {
    steady_timer &timer;
    std::size_t pending{0};
    bool timed_out{false};
    // The leader has been seen to exit; a deadline firing after this point
    // only cuts off stragglers outside the group.
    bool exited{false};

    void finish_one() {
        if (--pending == 0) {
            timer.cancel();
        }
    }
};

// How long pipes may stay open after the leader exits. Only a process that
// left the group (setsid) can still hold them at that point.
constexpr std::chrono::milliseconds kDrainGrace{500};

awaitable<void> drain_stream(stream_descriptor &stream, std::string &sink, std::size_t limit,
                             bool &truncated, WaitState &state) {
    std::array<char, 4096> buf{};
    for (;;) {
        boost::system::error_code ec;
        auto n = co_await stream.async_read_some(asio::buffer(buf),
                                                 redirect_error(use_awaitable, ec));
        if (n > 0) {
            const auto room = sink.size() < limit ? limit - sink.size() : 0;
            const auto take = std::min(room, n);
            sink.append(buf.data(), take);
            if (take < n) {
                truncated = true;
            }
        }
        if (ec) {
            break;
        }
    }
    state.finish_one();
}

awaitable<void> await_exit(stream_descriptor &pidfd, pid_t pgid, WaitState &state) {
    boost::system::error_code ec;
    co_await pidfd.async_wait(stream_descriptor::wait_read, redirect_error(use_awaitable, ec));
    if (!ec) {
        state.exited = true;
        // Leftover group members would otherwise keep the pipes open until
        // the deadline. Buffered output stays readable.
        ::kill(-pgid, SIGKILL);
    }
    state.finish_one();
    if (state.exited && state.pending > 0 &&
        state.timer.expiry() > steady_timer::clock_type::now() + kDrainGrace) {
        state.timer.expires_after(kDrainGrace);
    }
}

awaitable<void> enforce_deadline(WaitState &state, pid_t pgid,
                                 std::vector<stream_descriptor *> watched) {
    for (;;) {
        boost::system::error_code ec;
        co_await state.timer.async_wait(redirect_error(use_awaitable, ec));
        if (state.pending == 0) {
            co_return;
        }
        // Aborted with work pending means the expiry was moved, not cancelled.
        if (ec != asio::error::operation_aborted) {
            break;
        }
    }
    if (!state.exited) {
        state.timed_out = true;
        ::kill(-pgid, SIGKILL);
    }
    // A member that escaped the group may still hold the pipes open.
    for (auto *stream : watched) {
        boost::system::error_code cancel_ec;
        stream->cancel(cancel_ec);
    }
}

void reap(pid_t pid, int &status) {
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            status = 0;
            return;
        }
    }
}

} // namespace

std::optional<std::string> find_executable(const std::string &name) {
    if (name.empty()) {
        return std::nullopt;
    }
    if (name.find('/') != std::string::npos) {
        if (::access(name.c_str(), X_OK) == 0) {
            return name;
        }
        return std::nullopt;
    }
    const char *path_env = std::getenv("PATH");
    std::string path = path_env && path_env[0] != '\0' ? path_env : "/usr/local/bin:/usr/bin:/bin";
    std::size_t pos = 0;
    while (pos <= path.size()) {
        auto next = path.find(':', pos);
        auto dir = path.substr(pos, next == std::string::npos ? std::string::npos : next - pos);
        if (dir.empty()) {
            dir = ".";
        }
        auto candidate = dir + "/" + name;
        if (::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        if (next == std::string::npos) {
            break;
        }
        pos = next + 1;
    }
    return std::nullopt;
}

ProcessOutcome run_process(const ProcessSpec &spec, std::chrono::milliseconds deadline) {
    if (spec.argv.empty()) {
        throw BackendExecutionError("empty argv");
    }
    auto program = find_executable(spec.argv.front());
    if (!program) {
        throw BackendExecutionError("program not found: " + spec.argv.front());
    }

    // Everything the child touches is prepared before fork so the child only
    // calls async-signal-safe functions.
    std::vector<std::string> argv_storage = spec.argv;
    std::vector<std::string> env_storage = build_environment(spec.env_overrides);
    auto c_argv = to_c_array(argv_storage);
    auto c_env = to_c_array(env_storage);
    const char *workdir = spec.working_dir.empty() ? nullptr : spec.working_dir.c_str();

    UniqueFd dev_null(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (dev_null.get() < 0) {
        throw BackendExecutionError("open /dev/null failed: " +
                                    std::string(std::strerror(errno)));
    }
    auto out_pipe = make_pipe();
    auto err_pipe = make_pipe();
    auto exec_pipe = make_pipe();

    pid_t pid = ::fork();
    if (pid < 0) {
        throw BackendExecutionError("fork failed: " + std::string(std::strerror(errno)));
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        sigset_t empty;
        sigemptyset(&empty);
        ::sigprocmask(SIG_SETMASK, &empty, nullptr);
        ::signal(SIGPIPE, SIG_DFL);

        ::dup2(dev_null.get(), STDIN_FILENO);
        ::dup2(out_pipe.write_end.get(), STDOUT_FILENO);
        ::dup2(spec.merge_stderr ? out_pipe.write_end.get() : err_pipe.write_end.get(),
               STDERR_FILENO);
        if (workdir && ::chdir(workdir) != 0) {
            int err = errno;
            (void)!::write(exec_pipe.write_end.get(), &err, sizeof(err));
            ::_exit(127);
        }
        ::execve(program->c_str(), c_argv.data(), c_env.data());
        int err = errno;
        (void)!::write(exec_pipe.write_end.get(), &err, sizeof(err));
        ::_exit(127);
    }

    // Both sides call setpgid so the group exists before either proceeds.
    ::setpgid(pid, pid);
    out_pipe.write_end.reset();
    err_pipe.write_end.reset();
    exec_pipe.write_end.reset();
    dev_null.reset();

    int exec_errno = 0;
    ssize_t got = 0;
    do {
        got = ::read(exec_pipe.read_end.get(), &exec_errno, sizeof(exec_errno));
    } while (got < 0 && errno == EINTR);
    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        reap(pid, status);
        throw BackendExecutionError("failed to launch " + *program + ": " +
                                    std::string(std::strerror(exec_errno)));
    }

    ProcessOutcome outcome;
    asio::io_context io;
    steady_timer timer(io);
    timer.expires_after(deadline);
    WaitState state{timer};

    stream_descriptor out_stream(io, out_pipe.read_end.release());
    std::vector<stream_descriptor *> watched{&out_stream};
    std::optional<stream_descriptor> err_stream;
    if (!spec.merge_stderr) {
        err_stream.emplace(io, err_pipe.read_end.release());
        watched.push_back(&*err_stream);
    }
    std::optional<stream_descriptor> pid_stream;
    int pidfd = open_pidfd(pid);
    if (pidfd >= 0) {
        pid_stream.emplace(io, pidfd);
        watched.push_back(&*pid_stream);
    }

    state.pending = watched.size();
    co_spawn(io, drain_stream(out_stream, outcome.stdout_data, spec.max_output_bytes,
                              outcome.truncated, state),
             detached);
    if (err_stream) {
        co_spawn(io, drain_stream(*err_stream, outcome.stderr_data, spec.max_output_bytes,
                                  outcome.truncated, state),
                 detached);
    }
    if (pid_stream) {
        co_spawn(io, await_exit(*pid_stream, pid, state), detached);
    }
    co_spawn(io, enforce_deadline(state, pid, watched), detached);
    io.run();

    int status = 0;
    if (pid_stream) {
        // The leader is at least a zombie here, so the group id is still ours.
        ::kill(-pid, SIGKILL);
        reap(pid, status);
    } else {
        reap(pid, status);
        ::kill(-pid, SIGKILL);
    }

    outcome.timed_out = state.timed_out;
    if (outcome.timed_out) {
        outcome.exit_code = -1;
    } else if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.term_signal = WTERMSIG(status);
        outcome.exit_code = 128 + outcome.term_signal;
    }
    return outcome;
}
