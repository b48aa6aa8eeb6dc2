#include <stacy/project.hpp>

namespace stacy {

namespace fs = std::filesystem;

static fs::path canonical_or_absolute(const fs::path& p, std::error_code& ec) {
    fs::path out = fs::weakly_canonical(p, ec);
    if (ec) out = fs::absolute(p, ec);
    return out;
}

Result<fs::path> find_manifest(const fs::path& start_dir) {
    std::error_code ec;
    fs::path dir = canonical_or_absolute(start_dir, ec);
    if (ec) {
        return StacyError{StacyError::IO, "cannot resolve path: " + start_dir.string()};
    }

    for (;;) {
        if (has_manifest(dir)) return Result<fs::path>::ok(dir / kManifestName);
        fs::path parent = dir.parent_path();
        if (parent == dir) break;
        dir = parent;
    }
    return StacyError{StacyError::NotFound,
        "no stacy.toml in " + start_dir.string() + " or any parent directory",
        "run 'stacy init' to create a project"};
}

bool has_manifest(const fs::path& dir) {
    std::error_code ec;
    return fs::is_regular_file(dir / kManifestName, ec);
}

Result<Project> Project::load(const fs::path& project_dir) {
    std::error_code ec;
    fs::path root = canonical_or_absolute(project_dir, ec);
    if (ec) {
        return StacyError{StacyError::IO, "cannot resolve path: " + project_dir.string()};
    }

    auto manifest = Manifest::load((root / kManifestName).string());
    if (manifest.is_err()) return std::move(manifest).error();

    Project proj;
    proj.manifest = std::move(manifest).value();
    proj.root_dir = root;
    proj.manifest_path = root / kManifestName;
    return Result<Project>::ok(std::move(proj));
}

Result<Project> Project::discover(const fs::path& start_dir) {
    auto path = find_manifest(start_dir);
    if (path.is_err()) return std::move(path).error();
    return load(path.value().parent_path());
}

fs::path Project::resolve(const fs::path& p) const {
    return p.is_relative() ? root_dir / p : p;
}

Result<std::optional<LockFile>> Project::load_lock() const {
    std::error_code ec;
    if (!fs::exists(lock_path(), ec)) {
        return Result<std::optional<LockFile>>::ok(std::nullopt);
    }
    auto lf = LockFile::load(lock_path().string());
    if (lf.is_err()) return std::move(lf).error();
    return Result<std::optional<LockFile>>::ok(std::move(lf).value());
}

Result<LockFile> Project::require_lock() const {
    auto lock = load_lock();
    if (lock.is_err()) return std::move(lock).error();
    if (!lock.value()) {
        return StacyError{StacyError::NotFound, "no stacy.lock in " + root_dir.string(),
                          "run 'stacy lock' to create it"};
    }
    return Result<LockFile>::ok(std::move(*lock.value()));
}

bool Project::lock_is_current(const LockFile& lock) const {
    return lock.manifest_hash == manifest.dependency_hash();
}

} // namespace stacy
