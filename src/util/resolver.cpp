#include <stacy/resolver.hpp>
#include <stacy/log.hpp>
#include <stacy/pkg_file.hpp>
#include <stacy/version.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <unistd.h>

namespace fs = std::filesystem;

namespace stacy {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

namespace {

// Clone destination removed on scope exit
struct ScratchDir {
    fs::path path;

    ScratchDir() {
        static std::atomic<int> counter{0};
        path = fs::temp_directory_path() /
               ("stacy-git-" + std::to_string(getpid()) + "-" +
                std::to_string(counter.fetch_add(1)));
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;
};

} // namespace

// Version strings name cache directories
static std::string sanitize_version(std::string v) {
    for (auto& c : v) {
        if (c == '/' || c == '\\' || c == ' ') c = '-';
    }
    return v;
}

static Result<std::string> read_file(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) {
        return StacyError{StacyError::IO, "cannot read " + p.string()};
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    return Result<std::string>::ok(buf.str());
}

static std::string base_name(const std::string& rel) {
    auto slash = rel.find_last_of('/');
    return slash == std::string::npos ? rel : rel.substr(slash + 1);
}

static bool in_hidden_dir(const fs::path& rel) {
    for (const auto& part : rel.parent_path()) {
        std::string s = part.string();
        if (!s.empty() && s[0] == '.') return true;
    }
    return false;
}

Result<FileSet> collect_package_files(const std::string& dir, const std::string& name) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return StacyError{StacyError::NotFound, "package directory not found: " + dir};
    }

    std::string pkg_name = lowercase(name) + ".pkg";
    std::vector<fs::path> candidates;
    fs::path descriptor;
    for (auto it = fs::recursive_directory_iterator(dir, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_directory() && it->path().filename().string().rfind('.', 0) == 0) {
            it.disable_recursion_pending();
            continue;
        }
        if (!it->is_regular_file()) continue;
        fs::path rel = fs::relative(it->path(), dir);
        if (in_hidden_dir(rel)) continue;
        std::string fname = it->path().filename().string();
        if (lowercase(fname) == pkg_name) {
            // Shallowest descriptor wins
            if (descriptor.empty() ||
                std::distance(rel.begin(), rel.end()) <
                std::distance(descriptor.begin(), descriptor.end())) {
                descriptor = rel;
            }
        }
        if (is_stata_package_file(fname)) candidates.push_back(rel);
    }
    if (ec) {
        return StacyError{StacyError::IO, "cannot walk " + dir + ": " + ec.message()};
    }

    FileSet files;

    if (!descriptor.empty()) {
        fs::path pkg_path = fs::path(dir) / descriptor;
        auto content = read_file(pkg_path);
        if (content.is_err()) return std::move(content).error();
        auto desc = PkgDescriptor::parse(content.value(), lowercase(name));
        if (desc.is_err()) return std::move(desc).error();

        fs::path pkg_dir = pkg_path.parent_path();
        for (const auto& f : desc.value().files) {
            auto body = read_file(pkg_dir / f.name);
            if (body.is_err()) {
                return StacyError{StacyError::NotFound,
                    name + ".pkg lists " + f.name + " but the file is missing"};
            }
            files[base_name(f.name)] = std::move(body).value();
        }
        files[pkg_name] = std::move(content).value();
        return Result<FileSet>::ok(std::move(files));
    }

    std::sort(candidates.begin(), candidates.end());
    for (const auto& rel : candidates) {
        std::string key = rel.filename().string();
        if (files.count(key)) {
            log::warn("%s: ignoring %s, a file named %s is already included",
                      name.c_str(), rel.generic_string().c_str(), key.c_str());
            continue;
        }
        auto body = read_file(fs::path(dir) / rel);
        if (body.is_err()) return std::move(body).error();
        files[key] = std::move(body).value();
    }

    if (files.empty()) {
        return StacyError{StacyError::Dependency,
            "no Stata package files found for '" + name + "' in " + dir,
            "add a " + pkg_name + " descriptor or .ado files to the package"};
    }
    return Result<FileSet>::ok(std::move(files));
}

LockedPackage ResolvedPackage::to_locked() const {
    LockedPackage p;
    p.name = name;
    p.version = version;
    p.source = source.to_string();
    p.digest = digest;
    p.group = group_name(group);
    p.ref = ref;
    p.commit = commit;
    return p;
}

// ---------------------------------------------------------------------------
// PackageResolver
// ---------------------------------------------------------------------------

PackageResolver::PackageResolver(PackageCache& cache, Fetcher& fetcher, GitCli& git,
                                 ResolveOptions options)
    : cache_(cache), fetcher_(fetcher), git_(git), options_(std::move(options)) {
    git_.set_offline(options_.offline);
}

std::string PackageResolver::today() const {
    if (!options_.today.empty()) return options_.today;
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y%m%d", &tm);
    return buf;
}

Result<PackageResolver::Fetched> PackageResolver::fetch(const PackageRef& ref,
                                                        const std::string& pinned_commit) {
    if (options_.offline && ref.source.kind != SourceKind::Local) {
        return StacyError{StacyError::Network,
            "package '" + ref.name + "' is not cached and stacy is offline",
            "run without --offline to download it"};
    }
    switch (ref.source.kind) {
        case SourceKind::Index:
            if (ref.source.index != "ssc") {
                return StacyError{StacyError::Manifest,
                    "unknown package index '" + ref.source.index + "'"};
            }
            return fetch_index(ref, options_.index_urls);
        case SourceKind::Net:
            return fetch_index(ref, {ref.source.url});
        case SourceKind::Repository:
            return fetch_repository(ref, pinned_commit);
        case SourceKind::Local:
            return fetch_local(ref);
    }
    return StacyError{StacyError::Internal, "unhandled source kind"};
}

Result<PackageResolver::Fetched> PackageResolver::fetch_index(
    const PackageRef& ref, const std::vector<std::string>& bases)
{
    std::string lc = lowercase(ref.name);
    bool by_letter = ref.source.kind == SourceKind::Index;
    bool any_unreachable = false;
    std::string last_message;

    for (size_t i = 0; i < bases.size(); i++) {
        std::string dir = bases[i];
        while (!dir.empty() && dir.back() == '/') dir.pop_back();
        dir += by_letter ? "/" + std::string(1, lc[0]) + "/" : "/";

        auto pkg = fetcher_.fetch(dir + lc + ".pkg");
        if (pkg.is_err()) {
            auto code = pkg.error().code;
            if (code != StacyError::NotFound && code != StacyError::Network) {
                return std::move(pkg).error();
            }
            if (code == StacyError::Network) any_unreachable = true;
            last_message = pkg.error().message;
            if (i + 1 < bases.size()) {
                log::info("%s: %s, trying mirror", ref.name.c_str(),
                          code == StacyError::Network ? "server unreachable" : "not found");
            }
            continue;
        }

        auto desc = PkgDescriptor::parse(pkg.value(), lc);
        if (desc.is_err()) return std::move(desc).error();

        Fetched out;
        out.meta.name = ref.name;
        out.meta.source = ref.source;
        out.meta.group = ref.group;

        const auto& date = desc.value().distribution_date;
        out.meta.version = Version::parse(date).is_ok() ? date : today();

        if (!version_satisfies(out.meta.version, ref.constraint)) {
            return StacyError{StacyError::Version,
                "package '" + ref.name + "': the index only provides version " +
                out.meta.version + ", which does not satisfy '" + ref.constraint + "'",
                "relax the constraint or pin a repository source"};
        }

        for (const auto& f : desc.value().files) {
            auto body = fetcher_.fetch(dir + f.name);
            if (body.is_err()) {
                return StacyError{StacyError::Network,
                    "package '" + ref.name + "': cannot download " + f.name + ": " +
                    body.error().message};
            }
            out.files[base_name(f.name)] = std::move(body).value();
        }
        out.files[lc + ".pkg"] = std::move(pkg).value();

        log::debug("%s: version %s from %s", ref.name.c_str(),
                   out.meta.version.c_str(), dir.c_str());
        return Result<Fetched>::ok(std::move(out));
    }

    if (any_unreachable) {
        return StacyError{StacyError::Network,
            "cannot reach the package index for '" + ref.name + "': " + last_message,
            "check the network connection or use --offline with a populated cache"};
    }
    return StacyError{StacyError::Dependency,
        "package '" + ref.name + "' not found on " +
        (by_letter ? std::string("SSC") : ref.source.url),
        "check the spelling of the package name"};
}

Result<PackageResolver::Fetched> PackageResolver::fetch_repository(
    const PackageRef& ref, const std::string& pinned_commit)
{
    std::string url = ref.source.clone_url();
    std::string commit;
    std::string resolved_ref;
    std::string version;
    bool derived_version = false;   // version built from the commit

    if (!pinned_commit.empty()) {
        commit = pinned_commit;
        derived_version = true;
    } else {
        auto ls = git_.ls_remote(url);
        if (ls.is_err()) return std::move(ls).error();
        auto sel = select_ref(parse_ls_remote(ls.value()), ref.source.ref, ref.constraint)
            .map_err([&](StacyError e) {
                e.message = "package '" + ref.name + "': " + e.message + " in " + url;
                return e;
            });
        if (sel.is_err()) return std::move(sel).error();
        commit = sel.value().commit;
        resolved_ref = sel.value().ref;
        version = sel.value().version;
        derived_version = version.empty();
    }

    ScratchDir scratch;
    STACY_TRY(git_.clone(url, scratch.path.string()));
    STACY_TRY(git_.checkout(scratch.path.string(), commit));
    auto full = git_.rev_parse(scratch.path.string(), "HEAD");
    if (full.is_err()) return std::move(full).error();
    commit = full.value();

    if (derived_version) {
        version = commit_version(resolved_ref.empty() ? "HEAD" : "rev", commit);
    }
    version = sanitize_version(version);

    // With a pinned commit the caller owns the version check
    if (pinned_commit.empty() && !ref.constraint.empty() &&
        !version_satisfies(version, ref.constraint)) {
        return StacyError{StacyError::Version,
            "package '" + ref.name + "': version " + version +
            " does not satisfy '" + ref.constraint + "'"};
    }

    auto files = collect_package_files(scratch.path.string(), ref.name);
    if (files.is_err()) return std::move(files).error();

    Fetched out;
    out.meta.name = ref.name;
    out.meta.version = version;
    out.meta.source = ref.source;
    out.meta.group = ref.group;
    out.meta.ref = resolved_ref;
    out.meta.commit = commit;
    out.files = std::move(files).value();
    return Result<Fetched>::ok(std::move(out));
}

Result<PackageResolver::Fetched> PackageResolver::fetch_local(const PackageRef& ref) {
    fs::path dir = fs::path(ref.source.path);
    if (dir.is_relative()) dir = fs::path(options_.project_root) / dir;

    auto files = collect_package_files(dir.string(), ref.name);
    if (files.is_err()) return std::move(files).error();

    Fetched out;
    out.meta.name = ref.name;
    out.meta.source = ref.source;
    out.meta.group = ref.group;
    out.files = std::move(files).value();

    // Local content can change under the same path, so the version carries
    // the digest unless the descriptor states a distribution date
    std::string version = "local-" + content_digest(out.files).substr(0, 12);
    auto pkg = out.files.find(lowercase(ref.name) + ".pkg");
    if (pkg != out.files.end()) {
        auto desc = PkgDescriptor::parse(pkg->second, lowercase(ref.name));
        if (desc.is_ok() && Version::parse(desc.value().distribution_date).is_ok()) {
            version = desc.value().distribution_date + "-local." +
                      content_digest(out.files).substr(0, 8);
        }
    }
    out.meta.version = version;

    if (!ref.constraint.empty() && !version_satisfies(version, ref.constraint)) {
        return StacyError{StacyError::Version,
            "package '" + ref.name + "': local version " + version +
            " does not satisfy '" + ref.constraint + "'"};
    }
    return Result<Fetched>::ok(std::move(out));
}

Result<ResolvedPackage> PackageResolver::store(Fetched fetched,
                                               const std::string& expected_digest) {
    auto entry = cache_.store(fetched.meta.name, fetched.meta.version,
                              fetched.files, expected_digest);
    if (entry.is_err()) return std::move(entry).error();
    fetched.meta.digest = entry.value().digest;
    fetched.meta.path = entry.value().path;
    return Result<ResolvedPackage>::ok(std::move(fetched.meta));
}

Result<ResolvedPackage> PackageResolver::resolve(const PackageRef& ref,
                                                 const LockedPackage* hint) {
    STACY_TRY(ref.validate());

    if (hint && hint->source == ref.source.to_string() &&
        version_satisfies(hint->version, ref.constraint)) {
        auto cached = cache_.lookup(ref.name, hint->version, hint->digest);
        if (cached.is_ok() && cached.value()) {
            STACY_TRY(cache_.touch(ref.name, hint->version));
            ResolvedPackage pkg;
            pkg.name = ref.name;
            pkg.version = hint->version;
            pkg.source = ref.source;
            pkg.digest = hint->digest;
            pkg.path = cached.value()->path;
            pkg.group = ref.group;
            pkg.ref = hint->ref;
            pkg.commit = hint->commit;
            log::debug("reusing locked %s@%s", ref.name.c_str(), hint->version.c_str());
            return Result<ResolvedPackage>::ok(std::move(pkg));
        }
        if (cached.is_err() && cached.error().code != StacyError::Checksum) {
            return std::move(cached).error();
        }

        if (ref.source.kind == SourceKind::Repository && !hint->commit.empty()) {
            auto fetched = fetch(ref, hint->commit);
            if (fetched.is_err()) return std::move(fetched).error();
            fetched.value().meta.version = hint->version;
            fetched.value().meta.ref = hint->ref;
            return store(std::move(fetched).value(), hint->digest);
        }
    }

    auto fetched = fetch(ref, "");
    if (fetched.is_err()) return std::move(fetched).error();
    return store(std::move(fetched).value(), "");
}

Result<ResolvedPackage> PackageResolver::probe(const PackageRef& ref) {
    STACY_TRY(ref.validate());
    auto fetched = fetch(ref, "");
    if (fetched.is_err()) return std::move(fetched).error();
    fetched.value().meta.digest = content_digest(fetched.value().files);
    return Result<ResolvedPackage>::ok(std::move(fetched.value().meta));
}

Result<ResolvedPackage> PackageResolver::install(const LockedPackage& locked) {
    auto src = PackageSource::parse(locked.source);
    if (src.is_err()) {
        return std::move(src).context("lockfile entry '" + locked.name + "'").error();
    }
    auto group = parse_group(locked.group);
    if (group.is_err()) return std::move(group).error();

    PackageRef ref;
    ref.name = locked.name;
    ref.source = std::move(src).value();
    ref.group = group.value();

    auto cached = cache_.lookup(locked.name, locked.version, locked.digest);
    if (cached.is_err()) return std::move(cached).error();
    if (cached.value()) {
        STACY_TRY(cache_.touch(locked.name, locked.version));
        ResolvedPackage pkg;
        pkg.name = locked.name;
        pkg.version = locked.version;
        pkg.source = ref.source;
        pkg.digest = locked.digest;
        pkg.path = cached.value()->path;
        pkg.group = ref.group;
        pkg.ref = locked.ref;
        pkg.commit = locked.commit;
        return Result<ResolvedPackage>::ok(std::move(pkg));
    }

    auto fetched = fetch(ref, locked.commit);
    if (fetched.is_err()) return std::move(fetched).error();

    if (ref.source.kind != SourceKind::Repository &&
        fetched.value().meta.version != locked.version) {
        return StacyError{StacyError::Checksum,
            "package '" + locked.name + "' is locked at " + locked.version +
            " but the source now provides " + fetched.value().meta.version,
            "run 'stacy update " + locked.name + "' to accept the new version"};
    }

    fetched.value().meta.version = locked.version;
    fetched.value().meta.ref = locked.ref;
    return store(std::move(fetched).value(), locked.digest);
}

} // namespace stacy
