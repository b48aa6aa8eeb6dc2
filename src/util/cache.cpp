#include <stacy/cache.hpp>
#include <stacy/log.hpp>
#include <stacy/sha256.hpp>
#include <stacy/source.hpp>
#include <sqlite3.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <sstream>
#include <thread>

#include <signal.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace stacy {

// ---------------------------------------------------------------------------
// Digests
// ---------------------------------------------------------------------------

static std::string digest_lines(std::vector<std::pair<std::string, std::string>> items) {
    std::sort(items.begin(), items.end());
    SHA256 h;
    for (const auto& [rel, file_hash] : items) {
        h.update(rel);
        h.update(std::string(1, '\0'));
        h.update(file_hash);
        h.update("\n");
    }
    return h.finalize_hex();
}

std::string content_digest(const FileSet& files) {
    std::vector<std::pair<std::string, std::string>> items;
    items.reserve(files.size());
    for (const auto& [rel, body] : files) {
        items.emplace_back(rel, SHA256::hash_hex(body));
    }
    return digest_lines(std::move(items));
}

Result<std::string> directory_digest(const std::string& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return StacyError{StacyError::NotFound, "not a directory: " + dir};
    }

    std::vector<std::pair<std::string, std::string>> items;
    for (auto it = fs::recursive_directory_iterator(dir, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (!it->is_regular_file()) continue;
        std::string rel = fs::relative(it->path(), dir).generic_string();
        auto h = SHA256::hash_file(it->path());
        if (h.is_err()) return std::move(h).error();
        items.emplace_back(rel, std::move(h).value());
    }
    if (ec) {
        return StacyError{StacyError::IO,
            "cannot walk " + dir + ": " + ec.message()};
    }
    return Result<std::string>::ok(digest_lines(std::move(items)));
}

static int64_t now_seconds() {
    return static_cast<int64_t>(std::time(nullptr));
}

static int64_t tree_size(const std::string& dir) {
    int64_t total = 0;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(dir, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file()) {
            total += static_cast<int64_t>(it->file_size(ec));
        }
    }
    return total;
}

static bool is_safe_relative(const std::string& rel) {
    if (rel.empty() || rel[0] == '/') return false;
    for (const auto& part : fs::path(rel)) {
        if (part == "..") return false;
    }
    return true;
}

static bool is_staging_name(const std::string& name) {
    return name.find(".staging.") != std::string::npos;
}

// ---------------------------------------------------------------------------
// pImpl
// ---------------------------------------------------------------------------

static const std::string SCHEMA_VERSION = "1";

struct PackageCache::Impl {
    sqlite3* db = nullptr;
    std::mutex mu;

    sqlite3_stmt* stmt_lookup = nullptr;
    sqlite3_stmt* stmt_upsert = nullptr;
    sqlite3_stmt* stmt_touch = nullptr;
    sqlite3_stmt* stmt_remove = nullptr;
    sqlite3_stmt* stmt_list = nullptr;

    ~Impl() {
        finalize_all();
        if (db) sqlite3_close(db);
    }

    void finalize_all() {
        auto fin = [](sqlite3_stmt*& s) {
            if (s) { sqlite3_finalize(s); s = nullptr; }
        };
        fin(stmt_lookup);
        fin(stmt_upsert);
        fin(stmt_touch);
        fin(stmt_remove);
        fin(stmt_list);
    }

    void close() {
        if (db) {
            finalize_all();
            sqlite3_close(db);
            db = nullptr;
        }
    }

    Status prepare(const char* sql, sqlite3_stmt*& out) {
        if (out) return ok_status();
        int rc = sqlite3_prepare_v2(db, sql, -1, &out, nullptr);
        if (rc != SQLITE_OK) {
            return StacyError(StacyError::IO,
                std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }
        return ok_status();
    }

    Status exec(const char* sql) {
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string msg = errmsg ? errmsg : "unknown error";
            sqlite3_free(errmsg);
            return StacyError(StacyError::IO, "SQLite exec failed: " + msg);
        }
        return ok_status();
    }

    Status init_schema() {
        STACY_TRY(exec(
            "CREATE TABLE IF NOT EXISTS schema_info ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT"
            ");"
            "CREATE TABLE IF NOT EXISTS entry ("
            "  name TEXT NOT NULL,"
            "  version TEXT NOT NULL,"
            "  path TEXT NOT NULL,"
            "  digest TEXT NOT NULL,"
            "  size_bytes INTEGER,"
            "  created_at INTEGER,"
            "  last_access INTEGER,"
            "  PRIMARY KEY (name, version)"
            ");"
        ));

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db,
            "SELECT value FROM schema_info WHERE key='version'", -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            if (stmt) sqlite3_finalize(stmt);
            return StacyError(StacyError::IO,
                std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }
        rc = sqlite3_step(stmt);
        std::string ver;
        if (rc == SQLITE_ROW) {
            const char* v = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            if (v) ver = v;
        }
        sqlite3_finalize(stmt);

        if (ver != SCHEMA_VERSION) {
            // Rows are rebuilt from the tree by reconcile()
            STACY_TRY(exec("DELETE FROM entry;"));
            std::string ver_sql = "INSERT OR REPLACE INTO schema_info (key, value) "
                "VALUES ('version', '" + SCHEMA_VERSION + "');";
            STACY_TRY(exec(ver_sql.c_str()));
        }
        return ok_status();
    }

    static CacheEntry read_row(sqlite3_stmt* s) {
        auto text = [&](int col) {
            const char* v = reinterpret_cast<const char*>(sqlite3_column_text(s, col));
            return std::string(v ? v : "");
        };
        CacheEntry e;
        e.name = text(0);
        e.version = text(1);
        e.path = text(2);
        e.digest = text(3);
        e.size_bytes = sqlite3_column_int64(s, 4);
        e.created_at = sqlite3_column_int64(s, 5);
        e.last_access = sqlite3_column_int64(s, 6);
        return e;
    }

    Result<std::optional<CacheEntry>> find(const std::string& name, const std::string& version) {
        STACY_TRY(prepare(
            "SELECT name, version, path, digest, size_bytes, created_at, last_access "
            "FROM entry WHERE name = ?1 AND version = ?2", stmt_lookup));
        sqlite3_reset(stmt_lookup);
        sqlite3_bind_text(stmt_lookup, 1, name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_lookup, 2, version.c_str(), -1, SQLITE_TRANSIENT);
        int rc = sqlite3_step(stmt_lookup);
        if (rc == SQLITE_ROW) {
            return Result<std::optional<CacheEntry>>::ok(read_row(stmt_lookup));
        }
        if (rc != SQLITE_DONE) {
            return StacyError(StacyError::IO,
                std::string("cache index lookup failed: ") + sqlite3_errmsg(db));
        }
        return Result<std::optional<CacheEntry>>::ok(std::nullopt);
    }

    Status upsert(const CacheEntry& e) {
        STACY_TRY(prepare(
            "INSERT OR REPLACE INTO entry "
            "(name, version, path, digest, size_bytes, created_at, last_access) "
            "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)", stmt_upsert));
        sqlite3_reset(stmt_upsert);
        sqlite3_bind_text(stmt_upsert, 1, e.name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_upsert, 2, e.version.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_upsert, 3, e.path.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_upsert, 4, e.digest.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt_upsert, 5, e.size_bytes);
        sqlite3_bind_int64(stmt_upsert, 6, e.created_at);
        sqlite3_bind_int64(stmt_upsert, 7, e.last_access);
        if (sqlite3_step(stmt_upsert) != SQLITE_DONE) {
            return StacyError(StacyError::IO,
                std::string("cache index write failed: ") + sqlite3_errmsg(db));
        }
        return ok_status();
    }

    Status touch(const std::string& name, const std::string& version, int64_t when) {
        STACY_TRY(prepare(
            "UPDATE entry SET last_access = ?3 WHERE name = ?1 AND version = ?2",
            stmt_touch));
        sqlite3_reset(stmt_touch);
        sqlite3_bind_text(stmt_touch, 1, name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_touch, 2, version.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt_touch, 3, when);
        if (sqlite3_step(stmt_touch) != SQLITE_DONE) {
            return StacyError(StacyError::IO,
                std::string("cache index update failed: ") + sqlite3_errmsg(db));
        }
        return ok_status();
    }

    Status remove(const std::string& name, const std::string& version) {
        STACY_TRY(prepare(
            "DELETE FROM entry WHERE name = ?1 AND version = ?2", stmt_remove));
        sqlite3_reset(stmt_remove);
        sqlite3_bind_text(stmt_remove, 1, name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_remove, 2, version.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt_remove) != SQLITE_DONE) {
            return StacyError(StacyError::IO,
                std::string("cache index delete failed: ") + sqlite3_errmsg(db));
        }
        return ok_status();
    }

    Result<std::vector<CacheEntry>> all() {
        STACY_TRY(prepare(
            "SELECT name, version, path, digest, size_bytes, created_at, last_access "
            "FROM entry ORDER BY name, version", stmt_list));
        sqlite3_reset(stmt_list);
        std::vector<CacheEntry> out;
        int rc;
        while ((rc = sqlite3_step(stmt_list)) == SQLITE_ROW) {
            out.push_back(read_row(stmt_list));
        }
        if (rc != SQLITE_DONE) {
            return StacyError(StacyError::IO,
                std::string("cache index scan failed: ") + sqlite3_errmsg(db));
        }
        return Result<std::vector<CacheEntry>>::ok(std::move(out));
    }
};

// ---------------------------------------------------------------------------
// PackageCache lifecycle
// ---------------------------------------------------------------------------

PackageCache::PackageCache(std::string root)
    : root_(std::move(root)), impl_(std::make_unique<Impl>()) {}
PackageCache::~PackageCache() = default;
PackageCache::PackageCache(PackageCache&&) noexcept = default;
PackageCache& PackageCache::operator=(PackageCache&&) noexcept = default;

std::string PackageCache::default_root() {
    if (const char* env = std::getenv("STACY_CACHE_DIR")) {
        if (*env) return env;
    }
    if (const char* xdg = std::getenv("XDG_CACHE_HOME")) {
        if (*xdg) return std::string(xdg) + "/stacy";
    }
    const char* home = std::getenv("HOME");
    if (!home) home = "/tmp";
    return std::string(home) + "/.cache/stacy";
}

Status PackageCache::open() {
    impl_->close();

    std::error_code ec;
    fs::create_directories(fs::path(root_) / "packages", ec);
    if (ec) {
        return StacyError(StacyError::IO,
            "failed to create cache directory " + root_ + ": " + ec.message(),
            "set STACY_CACHE_DIR or cache_dir in the user config to a writable location");
    }

    std::string db_path = (fs::path(root_) / "index.db").string();

    auto setup = [&]() -> Status {
        int rc = sqlite3_open(db_path.c_str(), &impl_->db);
        if (rc != SQLITE_OK) {
            std::string msg = impl_->db ? sqlite3_errmsg(impl_->db) : "unknown";
            impl_->close();
            return StacyError(StacyError::IO, "failed to open cache index: " + msg);
        }
        sqlite3_busy_timeout(impl_->db, 5000);
        STACY_TRY(impl_->exec(
            "PRAGMA journal_mode=WAL;"
            "PRAGMA synchronous=NORMAL;"
        ));
        STACY_TRY(impl_->init_schema());
        return ok_status();
    };

    auto first = setup();
    if (first.is_err()) {
        // Corrupt index: the tree is authoritative, so rebuild from scratch
        log::warn("cache index unusable (%s); rebuilding", first.error().message.c_str());
        impl_->close();
        fs::remove(db_path, ec);
        fs::remove(db_path + "-wal", ec);
        fs::remove(db_path + "-shm", ec);
        STACY_TRY(setup());
    }

    auto stale = remove_stale_staging();
    if (stale.is_err()) return std::move(stale).error();

    return reconcile();
}

bool PackageCache::is_open() const {
    return impl_->db != nullptr;
}

std::string PackageCache::entry_path(const std::string& name,
                                     const std::string& version) const {
    return (fs::path(root_) / "packages" / lowercase(name) / version).string();
}

Status PackageCache::reconcile() {
    std::lock_guard<std::mutex> lock(impl_->mu);

    auto rows = impl_->all();
    if (rows.is_err()) return std::move(rows).error();

    std::set<std::string> indexed;
    std::error_code ec;
    for (const auto& e : rows.value()) {
        if (!fs::is_directory(e.path, ec)) {
            log::debug("cache: dropping index row for missing %s", e.key().c_str());
            STACY_TRY(impl_->remove(e.name, e.version));
            continue;
        }
        indexed.insert(e.path);
    }

    fs::path pkgs = fs::path(root_) / "packages";
    for (auto nit = fs::directory_iterator(pkgs, ec);
         !ec && nit != fs::directory_iterator(); nit.increment(ec)) {
        if (!nit->is_directory()) continue;
        std::error_code ec2;
        for (auto vit = fs::directory_iterator(nit->path(), ec2);
             !ec2 && vit != fs::directory_iterator(); vit.increment(ec2)) {
            if (!vit->is_directory()) continue;
            std::string vname = vit->path().filename().string();
            if (is_staging_name(vname)) continue;
            std::string path = vit->path().string();
            if (indexed.count(path)) continue;

            auto digest = directory_digest(path);
            if (digest.is_err()) return std::move(digest).error();
            CacheEntry e;
            e.name = nit->path().filename().string();
            e.version = vname;
            e.path = path;
            e.digest = digest.value();
            e.size_bytes = tree_size(path);
            e.created_at = now_seconds();
            e.last_access = e.created_at;
            log::debug("cache: indexing %s", e.key().c_str());
            STACY_TRY(impl_->upsert(e));
        }
    }
    if (ec) {
        return StacyError(StacyError::IO,
            "cannot scan cache " + pkgs.string() + ": " + ec.message());
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Entries
// ---------------------------------------------------------------------------

Result<std::optional<CacheEntry>> PackageCache::lookup(const std::string& name,
                                                       const std::string& version,
                                                       const std::string& expected_digest) {
    if (!is_open()) {
        return StacyError(StacyError::Internal, "package cache is not open");
    }
    std::string key = lowercase(name);
    std::string path = entry_path(name, version);

    std::optional<CacheEntry> row;
    {
        std::lock_guard<std::mutex> lock(impl_->mu);
        auto r = impl_->find(key, version);
        if (r.is_err()) return std::move(r).error();
        row = std::move(r).value();
    }

    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        if (row) {
            std::lock_guard<std::mutex> lock(impl_->mu);
            STACY_TRY(impl_->remove(key, version));
        }
        return Result<std::optional<CacheEntry>>::ok(std::nullopt);
    }

    if (!row) {
        // Written by another process after our reconcile
        auto digest = directory_digest(path);
        if (digest.is_err()) return std::move(digest).error();
        CacheEntry e;
        e.name = key;
        e.version = version;
        e.path = path;
        e.digest = digest.value();
        e.size_bytes = tree_size(path);
        e.created_at = now_seconds();
        e.last_access = e.created_at;
        std::lock_guard<std::mutex> lock(impl_->mu);
        STACY_TRY(impl_->upsert(e));
        row = e;
    }

    if (!expected_digest.empty() && row->digest != expected_digest) {
        return StacyError(StacyError::Checksum,
            "cached " + row->key() + " has digest " + row->digest.substr(0, 12) +
            ", lockfile expects " + expected_digest.substr(0, 12),
            "the upstream package changed; run 'stacy update " + name + "' to relock");
    }

    return Result<std::optional<CacheEntry>>::ok(std::move(row));
}

Result<CacheEntry> PackageCache::store(const std::string& name,
                                       const std::string& version,
                                       const FileSet& files,
                                       const std::string& expected_digest) {
    if (!is_open()) {
        return StacyError(StacyError::Internal, "package cache is not open");
    }
    if (files.empty()) {
        return StacyError(StacyError::InvalidArg,
            "refusing to cache " + name + "@" + version + " with no files");
    }
    if (version.empty() || version.find('/') != std::string::npos || version == "." ||
        version == ".." || is_staging_name(version)) {
        return StacyError(StacyError::InvalidArg, "invalid cache version '" + version + "'");
    }
    for (const auto& [rel, body] : files) {
        if (!is_safe_relative(rel)) {
            return StacyError(StacyError::InvalidArg,
                "package " + name + " contains unsafe path '" + rel + "'");
        }
    }

    std::string digest = content_digest(files);
    if (!expected_digest.empty() && digest != expected_digest) {
        return StacyError(StacyError::Checksum,
            "downloaded " + name + "@" + version + " has digest " + digest.substr(0, 12) +
            ", expected " + expected_digest.substr(0, 12),
            "the upstream package changed; run 'stacy update " + name + "' to relock");
    }

    // Fast path: already complete
    auto existing = lookup(name, version, digest);
    if (existing.is_err()) return std::move(existing).error();
    if (existing.value()) {
        STACY_TRY(touch(name, version));
        return Result<CacheEntry>::ok(*existing.value());
    }

    std::string final_path = entry_path(name, version);
    std::ostringstream staging_name;
    staging_name << version << ".staging." << getpid() << "."
                 << std::hash<std::thread::id>{}(std::this_thread::get_id());
    fs::path staging = fs::path(final_path).parent_path() / staging_name.str();

    std::error_code ec;
    fs::remove_all(staging, ec);
    fs::create_directories(staging, ec);
    if (ec) {
        return StacyError(StacyError::IO,
            "cannot create staging directory " + staging.string() + ": " + ec.message());
    }

    auto cleanup = [&]() {
        std::error_code ignored;
        fs::remove_all(staging, ignored);
    };

    for (const auto& [rel, body] : files) {
        fs::path dest = staging / rel;
        fs::create_directories(dest.parent_path(), ec);
        std::ofstream out(dest, std::ios::binary | std::ios::trunc);
        if (!out) {
            cleanup();
            return StacyError(StacyError::IO, "cannot write " + dest.string());
        }
        out.write(body.data(), static_cast<std::streamsize>(body.size()));
        out.close();
        if (!out) {
            cleanup();
            return StacyError(StacyError::IO, "failed writing " + dest.string());
        }
    }

    // Confirm what reached the disk before promotion
    auto written = directory_digest(staging.string());
    if (written.is_err()) {
        cleanup();
        return std::move(written).error();
    }
    if (written.value() != digest) {
        cleanup();
        return StacyError(StacyError::Checksum,
            "staged copy of " + name + "@" + version + " does not match its digest");
    }

    if (std::rename(staging.c_str(), final_path.c_str()) != 0) {
        int err = errno;
        cleanup();
        if (err == EEXIST || err == ENOTEMPTY) {
            // Another installer promoted the same slot first
            log::debug("cache: %s@%s promoted concurrently", name.c_str(), version.c_str());
            auto winner = lookup(name, version, digest);
            if (winner.is_err()) return std::move(winner).error();
            if (winner.value()) return Result<CacheEntry>::ok(*winner.value());
        }
        return StacyError(StacyError::IO,
            "cannot promote " + staging.string() + " to " + final_path +
            ": " + std::strerror(err));
    }

    CacheEntry e;
    e.name = lowercase(name);
    e.version = version;
    e.path = final_path;
    e.digest = digest;
    e.size_bytes = tree_size(final_path);
    e.created_at = now_seconds();
    e.last_access = e.created_at;
    {
        std::lock_guard<std::mutex> lock(impl_->mu);
        STACY_TRY(impl_->upsert(e));
    }
    log::info("cached %s@%s", name.c_str(), version.c_str());
    return Result<CacheEntry>::ok(std::move(e));
}

Status PackageCache::touch(const std::string& name, const std::string& version) {
    if (!is_open()) {
        return StacyError(StacyError::Internal, "package cache is not open");
    }
    std::lock_guard<std::mutex> lock(impl_->mu);
    return impl_->touch(lowercase(name), version, now_seconds());
}

Result<std::vector<CacheEntry>> PackageCache::list() {
    if (!is_open()) {
        return StacyError(StacyError::Internal, "package cache is not open");
    }
    std::lock_guard<std::mutex> lock(impl_->mu);
    return impl_->all();
}

Result<CleanReport> PackageCache::clean(int64_t max_age_seconds,
                                        const std::set<std::string>& in_use,
                                        bool force) {
    auto entries = list();
    if (entries.is_err()) return std::move(entries).error();

    std::set<std::string> in_use_lc;
    for (const auto& k : in_use) in_use_lc.insert(lowercase(k));

    CleanReport report;
    int64_t cutoff = now_seconds() - max_age_seconds;
    for (const auto& e : entries.value()) {
        if (e.last_access > cutoff) {
            report.remaining++;
            continue;
        }
        if (!force && in_use_lc.count(lowercase(e.key()))) {
            report.kept_in_use.push_back(e);
            report.remaining++;
            continue;
        }

        std::error_code ec;
        fs::remove_all(e.path, ec);
        if (ec) {
            return StacyError(StacyError::IO,
                "cannot remove " + e.path + ": " + ec.message());
        }
        // Drop the now-empty name directory
        fs::path parent = fs::path(e.path).parent_path();
        if (fs::is_empty(parent, ec)) fs::remove(parent, ec);
        {
            std::lock_guard<std::mutex> lock(impl_->mu);
            STACY_TRY(impl_->remove(e.name, e.version));
        }
        report.freed_bytes += e.size_bytes;
        report.removed.push_back(e);
    }
    return Result<CleanReport>::ok(std::move(report));
}

Result<int> PackageCache::remove_stale_staging() {
    int removed = 0;
    std::error_code ec;
    fs::path pkgs = fs::path(root_) / "packages";
    if (!fs::exists(pkgs, ec)) return Result<int>::ok(0);

    for (auto nit = fs::directory_iterator(pkgs, ec);
         !ec && nit != fs::directory_iterator(); nit.increment(ec)) {
        if (!nit->is_directory()) continue;
        std::error_code ec2;
        std::vector<fs::path> stale;
        for (auto vit = fs::directory_iterator(nit->path(), ec2);
             !ec2 && vit != fs::directory_iterator(); vit.increment(ec2)) {
            std::string vname = vit->path().filename().string();
            auto pos = vname.find(".staging.");
            if (pos == std::string::npos) continue;
            // <version>.staging.<pid>.<tid>
            std::string rest = vname.substr(pos + 9);
            long pid = std::strtol(rest.c_str(), nullptr, 10);
            if (pid <= 0) {
                stale.push_back(vit->path());
                continue;
            }
            if (pid == static_cast<long>(getpid())) continue;
            if (::kill(static_cast<pid_t>(pid), 0) != 0 && errno == ESRCH) {
                stale.push_back(vit->path());
            }
        }
        for (const auto& p : stale) {
            log::debug("cache: removing stale staging %s", p.string().c_str());
            fs::remove_all(p, ec2);
            if (!ec2) removed++;
        }
    }
    if (ec) {
        return StacyError(StacyError::IO,
            "cannot scan cache " + pkgs.string() + ": " + ec.message());
    }
    return Result<int>::ok(removed);
}

} // namespace stacy
