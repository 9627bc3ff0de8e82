#include "exec/sandbox_registry.h"

#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstdint>

void SandboxRegistry::add(const std::string &name) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_.insert(name);
}

void SandboxRegistry::remove(const std::string &name) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_.erase(name);
}

bool SandboxRegistry::contains(const std::string &name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.find(name) != active_.end();
}

std::vector<std::string> SandboxRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {active_.begin(), active_.end()};
}

SandboxRegistry &active_sandboxes() {
    static SandboxRegistry registry;
    return registry;
}

std::string make_container_name(const std::string &prefix) {
    static std::atomic<std::uint64_t> counter{0};
    const auto seq = counter.fetch_add(1) + 1;
    return prefix + "-" + std::to_string(::getpid()) + "-" + std::to_string(seq);
}

bool owned_by_other_live_process(const std::string &name, const std::string &prefix) {
    const auto head = prefix + "-";
    if (name.compare(0, head.size(), head) != 0) {
        return false;
    }
    const auto pid_end = name.find('-', head.size());
    if (pid_end == std::string::npos || pid_end == head.size()) {
        return false;
    }
    long pid = 0;
    for (auto i = head.size(); i < pid_end; ++i) {
        const char c = name[i];
        if (c < '0' || c > '9' || pid > 100000000) {
            return false;
        }
        pid = pid * 10 + (c - '0');
    }
    if (pid <= 0 || pid == ::getpid()) {
        return false;
    }
    // EPERM still means the process exists.
    return ::kill(static_cast<pid_t>(pid), 0) == 0 || errno == EPERM;
}
