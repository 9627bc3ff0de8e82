#pragma once

#include <filesystem>
#include <string>

// Creates a unique directory under the system temp path and removes it,
// with everything inside, on destruction.
class ScopedTempDir {
public:
    explicit ScopedTempDir(const std::string &prefix);
    ~ScopedTempDir();

    ScopedTempDir(const ScopedTempDir &) = delete;
    ScopedTempDir &operator=(const ScopedTempDir &) = delete;

    const std::filesystem::path &path() const { return path_; }

    // Creates a subdirectory and returns its path.
    std::filesystem::path make_subdir(const std::string &name) const;

private:
    std::filesystem::path path_;
};
