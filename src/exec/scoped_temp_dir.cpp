#include "exec/scoped_temp_dir.h"

#include "core/errors.h"
#include "core/logging.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

ScopedTempDir::ScopedTempDir(const std::string &prefix) {
    std::error_code ec;
    auto base = fs::temp_directory_path(ec);
    if (ec) {
        base = "/tmp";
    }
    auto pattern = (base / (prefix + "XXXXXX")).string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    if (!::mkdtemp(buf.data())) {
        throw BackendExecutionError("mkdtemp failed for " + pattern + ": " +
                                    std::string(std::strerror(errno)));
    }
    path_ = buf.data();
}

ScopedTempDir::~ScopedTempDir() {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    // Commands may leave read-only directories behind; make them writable
    // so remove_all can descend.
    fs::permissions(path_, fs::perms::owner_all, fs::perm_options::add, ec);
    ec.clear();
    for (auto it = fs::recursive_directory_iterator(
             path_, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code perm_ec;
        if (it->is_directory(perm_ec) && !it->is_symlink(perm_ec)) {
            fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, perm_ec);
        }
    }
    ec.clear();
    fs::remove_all(path_, ec);
    if (ec) {
        log_warning("failed to remove temp dir " + path_.string() + ": " + ec.message());
    }
}

fs::path ScopedTempDir::make_subdir(const std::string &name) const {
    auto sub = path_ / name;
    std::error_code ec;
    fs::create_directory(sub, ec);
    if (ec) {
        throw BackendExecutionError("cannot create " + sub.string() + ": " + ec.message());
    }
    return sub;
}
