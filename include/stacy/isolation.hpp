#pragma once

#include <stacy/cache.hpp>
#include <stacy/lockfile.hpp>
#include <stacy/result.hpp>
#include <stacy/source.hpp>

#include <map>
#include <set>
#include <string>
#include <vector>

namespace stacy {

// Search path for one run: the cache directories of exactly the locked
// packages, in lockfile order, then the interpreter's BASE library.
// Built once and passed by value into every spawn.
class IsolationPath {
public:
    IsolationPath() = default;
    IsolationPath(std::vector<std::string> package_dirs, bool allow_global);

    // Every locked entry of `groups` must already be cached
    static Result<IsolationPath> from_lock(const LockFile& lock,
                                           PackageCache& cache,
                                           const std::set<DependencyGroup>& groups,
                                           bool allow_global);

    const std::vector<std::string>& package_dirs() const { return package_dirs_; }
    bool allows_global() const { return allow_global_; }

    // Entries as the interpreter sees them, BASE last among isolated ones
    std::vector<std::string> entries() const;

    // "dir1";"dir2";BASE  (plus SITE;PERSONAL;PLUS;OLDPLACE with allow_global)
    std::string s_ado() const;

    std::map<std::string, std::string> to_env() const;

private:
    std::vector<std::string> package_dirs_;
    bool allow_global_ = false;
};

} // namespace stacy
