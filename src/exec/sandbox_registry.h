#pragma once

#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

// Names of containers owned by in-flight executions. Shared between the
// container backend and cleanup, which may run on different threads.
class SandboxRegistry {
public:
    void add(const std::string &name);
    void remove(const std::string &name);
    bool contains(const std::string &name) const;
    std::vector<std::string> snapshot() const;

private:
    mutable std::mutex mutex_;
    std::unordered_set<std::string> active_;
};

// The one registry every manager and backend in this process shares.
SandboxRegistry &active_sandboxes();

// <prefix>-<pid>-<counter>; the counter keeps concurrent calls in one
// process apart.
std::string make_container_name(const std::string &prefix);

// True when the name carries the pid of another live process, which may
// still be running that container. Our own pid is answered by the registry.
bool owned_by_other_live_process(const std::string &name, const std::string &prefix);
