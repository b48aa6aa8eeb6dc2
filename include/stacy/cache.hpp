#pragma once

#include <stacy/result.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace stacy {

// Package payload: relative path -> file bytes
using FileSet = std::map<std::string, std::string>;

// SHA-256 over the sorted (relative path, NUL, file sha256, newline) list
std::string content_digest(const FileSet& files);

// Same digest computed from a directory tree on disk
Result<std::string> directory_digest(const std::string& dir);

struct CacheEntry {
    std::string name;
    std::string version;
    std::string path;
    std::string digest;
    int64_t size_bytes = 0;
    int64_t created_at = 0;      // unix seconds
    int64_t last_access = 0;     // unix seconds

    std::string key() const { return name + "@" + version; }
};

struct CleanReport {
    std::vector<CacheEntry> removed;
    std::vector<CacheEntry> kept_in_use;   // referenced by the lockfile, not forced
    size_t remaining = 0;
    int64_t freed_bytes = 0;
};

// Machine-global content-addressed package store.
//
// Layout:
//   <root>/packages/<name lowercase>/<version>/   package files
//   <root>/index.db                               SQLite index
//
// Entries are written to "<version>.staging.<pid>.<tid>" and renamed into
// place once the digest is confirmed. A complete entry is never modified.
class PackageCache {
public:
    explicit PackageCache(std::string root);
    ~PackageCache();
    PackageCache(PackageCache&&) noexcept;
    PackageCache& operator=(PackageCache&&) noexcept;

    // STACY_CACHE_DIR, else $XDG_CACHE_HOME/stacy, else ~/.cache/stacy
    static std::string default_root();

    // Create the layout, open the index and reconcile it with the tree
    Status open();
    bool is_open() const;
    const std::string& root() const { return root_; }

    std::string entry_path(const std::string& name, const std::string& version) const;

    // Complete entry for (name, version). With a non-empty expected digest
    // an entry whose content differs is reported as a Checksum error.
    Result<std::optional<CacheEntry>> lookup(const std::string& name,
                                             const std::string& version,
                                             const std::string& expected_digest = "");

    // Write files into the (name, version) slot. Idempotent: if the slot is
    // already complete with the same content it is returned unchanged.
    Result<CacheEntry> store(const std::string& name,
                             const std::string& version,
                             const FileSet& files,
                             const std::string& expected_digest = "");

    // Refresh last-access time
    Status touch(const std::string& name, const std::string& version);

    Result<std::vector<CacheEntry>> list();

    // Remove entries not accessed for `max_age_seconds`. Entries whose key
    // is in `in_use` are kept unless `force`.
    Result<CleanReport> clean(int64_t max_age_seconds,
                              const std::set<std::string>& in_use,
                              bool force);

    // Remove staging directories whose owning process is gone
    Result<int> remove_stale_staging();

private:
    Status reconcile();

    struct Impl;
    std::string root_;
    std::unique_ptr<Impl> impl_;
};

} // namespace stacy
