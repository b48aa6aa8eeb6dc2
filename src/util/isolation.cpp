#include <stacy/isolation.hpp>

namespace stacy {

IsolationPath::IsolationPath(std::vector<std::string> package_dirs, bool allow_global)
    : package_dirs_(std::move(package_dirs)), allow_global_(allow_global) {}

Result<IsolationPath> IsolationPath::from_lock(const LockFile& lock,
                                               PackageCache& cache,
                                               const std::set<DependencyGroup>& groups,
                                               bool allow_global) {
    std::vector<std::string> dirs;
    for (const auto& locked : lock.packages) {
        auto group = parse_group(locked.group);
        if (group.is_err()) return std::move(group).error();
        if (!groups.count(group.value())) continue;

        auto entry = cache.lookup(locked.name, locked.version, locked.digest);
        if (entry.is_err()) return std::move(entry).error();
        if (!entry.value()) {
            return StacyError{StacyError::Dependency,
                "locked package " + locked.name + "@" + locked.version + " is not installed",
                "run 'stacy install'"};
        }
        dirs.push_back(entry.value()->path);
    }
    return Result<IsolationPath>::ok(IsolationPath(std::move(dirs), allow_global));
}

std::vector<std::string> IsolationPath::entries() const {
    std::vector<std::string> out = package_dirs_;
    out.push_back("BASE");
    if (allow_global_) {
        for (const char* e : {"SITE", "PERSONAL", "PLUS", "OLDPLACE"}) out.push_back(e);
    }
    return out;
}

std::string IsolationPath::s_ado() const {
    std::string out;
    for (const auto& dir : package_dirs_) {
        out += "\"" + dir + "\";";
    }
    out += "BASE";
    if (allow_global_) out += ";SITE;PERSONAL;PLUS;OLDPLACE";
    return out;
}

std::map<std::string, std::string> IsolationPath::to_env() const {
    return {{"S_ADO", s_ado()}};
}

} // namespace stacy
