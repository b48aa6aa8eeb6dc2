#pragma once

#include <stacy/cache.hpp>
#include <stacy/fetcher.hpp>
#include <stacy/git.hpp>
#include <stacy/lockfile.hpp>
#include <stacy/result.hpp>
#include <stacy/source.hpp>

#include <string>
#include <vector>

namespace stacy {

constexpr const char* kSscBaseUrl = "http://fmwww.bc.edu/repec/bocode";
constexpr const char* kSscMirrorUrl =
    "https://raw.githubusercontent.com/labordynamicsinstitute/ssc-mirror/"
    "releases/fmwww.bc.edu/repec/bocode";

struct ResolveOptions {
    bool offline = false;
    std::string project_root = ".";                 // base for local: sources
    std::vector<std::string> index_urls = {kSscBaseUrl, kSscMirrorUrl};
    std::string today;                              // yyyymmdd override, empty: system clock
};

// A concrete, checksummed package. Never edited after creation.
struct ResolvedPackage {
    std::string name;
    std::string version;
    PackageSource source;
    std::string digest;
    std::string path;            // cache location, empty until stored
    DependencyGroup group = DependencyGroup::Default;
    std::string ref;             // repository: ref or tag that was resolved
    std::string commit;          // repository: full SHA

    LockedPackage to_locked() const;
};

class PackageResolver {
public:
    PackageResolver(PackageCache& cache, Fetcher& fetcher, GitCli& git,
                    ResolveOptions options = {});

    // Resolve and make sure the cache holds the result. A lock hint from
    // the same source that still satisfies the constraint is reused
    // without touching the network when the cache has it.
    Result<ResolvedPackage> resolve(const PackageRef& ref,
                                    const LockedPackage* hint = nullptr);

    // What resolution would pick right now, without writing the cache
    Result<ResolvedPackage> probe(const PackageRef& ref);

    // Ensure the cache holds a digest-matching copy of a locked entry.
    // Never re-resolves: upstream drift surfaces as a Checksum error.
    Result<ResolvedPackage> install(const LockedPackage& locked);

    const ResolveOptions& options() const { return options_; }

private:
    struct Fetched {
        ResolvedPackage meta;
        FileSet files;
    };

    Result<Fetched> fetch(const PackageRef& ref, const std::string& pinned_commit);
    Result<Fetched> fetch_index(const PackageRef& ref, const std::vector<std::string>& bases);
    Result<Fetched> fetch_repository(const PackageRef& ref, const std::string& pinned_commit);
    Result<Fetched> fetch_local(const PackageRef& ref);

    Result<ResolvedPackage> store(Fetched fetched, const std::string& expected_digest);

    std::string today() const;

    PackageCache& cache_;
    Fetcher& fetcher_;
    GitCli& git_;
    ResolveOptions options_;
};

// Package files in a directory tree: those named by <name>.pkg when the
// tree has one, otherwise every Stata package file. Keys are file names
// relative to the package root, flattened to the base name.
Result<FileSet> collect_package_files(const std::string& dir, const std::string& name);

} // namespace stacy
