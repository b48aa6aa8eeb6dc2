#pragma once

#include <stacy/lockfile.hpp>
#include <stacy/manifest.hpp>
#include <stacy/resolver.hpp>
#include <stacy/result.hpp>

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace stacy {

struct GenerateOptions {
    bool update_all = false;               // ignore every lock hint
    std::set<std::string> update;          // ignore hints for these packages
};

struct OutdatedEntry {
    std::string name;
    std::string locked;
    std::string latest;                    // newest the source offers
    bool constrained = false;              // latest does not satisfy the manifest
    std::string error;                     // probe failure, latest empty then
};

// Lockfile operations over a manifest and a resolver
class LockManager {
public:
    explicit LockManager(PackageResolver& resolver) : resolver_(resolver) {}

    // Resolve every manifest entry and build a fresh lockfile. Entries of
    // `existing` act as hints so unchanged packages keep their version.
    Result<LockFile> generate(const Manifest& manifest,
                              const std::optional<LockFile>& existing,
                              const GenerateOptions& options = {});

    // Compare what the manifest resolves to with `lock`, writing nothing.
    // With `probe_changes`, changed entries are re-resolved to report the
    // version they would move to.
    Result<LockCheck> verify(const Manifest& manifest, const LockFile& lock,
                             bool probe_changes = false);

    // Make sure the cache holds every locked entry of the selected groups
    Result<std::vector<ResolvedPackage>> install(const LockFile& lock,
                                                 const std::set<DependencyGroup>& groups);

    Result<std::vector<OutdatedEntry>> outdated(const Manifest& manifest,
                                                const LockFile& lock);

private:
    PackageResolver& resolver_;
};

// All groups
std::set<DependencyGroup> all_groups();

} // namespace stacy
