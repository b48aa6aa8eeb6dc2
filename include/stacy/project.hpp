#pragma once

#include <stacy/lockfile.hpp>
#include <stacy/manifest.hpp>
#include <stacy/result.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace stacy {

constexpr const char* kManifestName = "stacy.toml";
constexpr const char* kLockfileName = "stacy.lock";

// A directory holding stacy.toml, with its lockfile beside it
struct Project {
    Manifest manifest;
    std::filesystem::path root_dir;       // canonical
    std::filesystem::path manifest_path;

    // Nearest enclosing project of start_dir
    static Result<Project> discover(const std::filesystem::path& start_dir);
    static Result<Project> load(const std::filesystem::path& project_dir);

    std::filesystem::path lock_path() const { return root_dir / kLockfileName; }

    // Relative paths are taken from the project root
    std::filesystem::path resolve(const std::filesystem::path& p) const;

    // nullopt when there is no stacy.lock; a malformed one is an error
    Result<std::optional<LockFile>> load_lock() const;

    // Like load_lock, but a missing lockfile is NotFound
    Result<LockFile> require_lock() const;

    // The lock was generated from the current dependency declarations
    bool lock_is_current(const LockFile& lock) const;
};

// Path of the nearest stacy.toml at or above start_dir
Result<std::filesystem::path> find_manifest(const std::filesystem::path& start_dir);

bool has_manifest(const std::filesystem::path& dir);

} // namespace stacy
