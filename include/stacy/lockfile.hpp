#pragma once

#include <stacy/result.hpp>
#include <set>
#include <string>
#include <vector>

namespace stacy {

struct LockedPackage {
    std::string name;
    std::string version;
    std::string source;          // canonical descriptor, PackageSource::to_string()
    std::string digest;          // content digest of the cached files
    std::string group;           // "dependencies", "dev" or "test"
    std::string ref;             // repository sources: requested ref or chosen tag
    std::string commit;          // repository sources: full SHA

    std::string cache_key() const;   // "<name lowercase>@<version>"
};

struct LockFile {
    int format_version = 1;
    std::string stacy_version;
    std::string manifest_hash;
    std::vector<LockedPackage> packages;   // sorted by name

    static Result<LockFile> parse(const std::string& toml_str);
    static Result<LockFile> load(const std::string& path);

    // Deterministic text: header comment, scalars, then [[package]] by name
    std::string to_toml() const;
    Status save(const std::string& path) const;

    // Case-insensitive lookup (nullptr if not found)
    const LockedPackage* find(const std::string& name) const;

    void sort();
    std::set<std::string> cache_keys() const;
};

// One difference between the lockfile and what the manifest resolves to
struct LockChange {
    enum class Kind { Added, Removed, Changed };

    Kind kind = Kind::Changed;
    std::string name;
    std::string reason;          // Changed: "version", "source", "constraint", "digest", "group"
    std::string locked_version;  // empty for Added
    std::string wanted_version;  // empty for Removed or when unresolvable
    std::string detail;
};

const char* change_kind_name(LockChange::Kind k);

struct LockCheck {
    bool hash_matches = true;
    std::string locked_hash;
    std::string manifest_hash;
    std::vector<LockChange> changes;

    bool in_sync() const { return hash_matches && changes.empty(); }
};

} // namespace stacy
