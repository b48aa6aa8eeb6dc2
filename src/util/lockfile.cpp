#include <stacy/lockfile.hpp>
#include <stacy/source.hpp>
#include <tomlplusplus/toml.hpp>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <sstream>

namespace stacy {

std::string LockedPackage::cache_key() const {
    return lowercase(name) + "@" + version;
}

const char* change_kind_name(LockChange::Kind k) {
    switch (k) {
        case LockChange::Kind::Added:   return "added";
        case LockChange::Kind::Removed: return "removed";
        case LockChange::Kind::Changed: return "changed";
    }
    return "changed";
}

static std::string quote(const std::string& s) {
    std::ostringstream ss;
    ss << toml::value<std::string>(s);
    return ss.str();
}

// ---------------------------------------------------------------------------
// Parse
// ---------------------------------------------------------------------------

Result<LockFile> LockFile::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return StacyError{StacyError::Parse,
            std::string("malformed lockfile: ") + std::string(e.description()),
            "delete stacy.lock and run 'stacy lock' to regenerate it", "stacy.lock",
            static_cast<int>(e.source().begin.line)};
    }

    LockFile lf;
    if (auto v = doc["version"].value<int64_t>()) lf.format_version = static_cast<int>(*v);
    if (lf.format_version != 1) {
        return StacyError{StacyError::Version,
            "unsupported lockfile format version " + std::to_string(lf.format_version),
            "this stacy understands version 1; upgrade stacy or regenerate the lockfile"};
    }
    if (auto v = doc["stacy_version"].value<std::string>()) lf.stacy_version = *v;
    if (auto v = doc["manifest_hash"].value<std::string>()) lf.manifest_hash = *v;

    if (auto arr = doc["package"].as_array()) {
        for (const auto& elem : *arr) {
            auto tbl = elem.as_table();
            if (!tbl) {
                return StacyError{StacyError::Parse,
                    "malformed lockfile: [[package]] entries must be tables"};
            }
            LockedPackage p;
            auto str = [&](const char* key) {
                auto v = (*tbl)[key].value<std::string>();
                return v ? *v : std::string();
            };
            p.name = str("name");
            p.version = str("version");
            p.source = str("source");
            p.digest = str("digest");
            p.group = str("group");
            p.ref = str("ref");
            p.commit = str("commit");
            if (p.group.empty()) p.group = "dependencies";

            if (p.name.empty() || p.version.empty() || p.source.empty() || p.digest.empty()) {
                return StacyError{StacyError::Parse,
                    "malformed lockfile: package entry '" + p.name +
                    "' needs name, version, source and digest",
                    "run 'stacy lock' to regenerate it"};
            }
            if (lf.find(p.name)) {
                return StacyError{StacyError::Duplicate,
                    "malformed lockfile: package '" + p.name + "' appears twice"};
            }
            lf.packages.push_back(std::move(p));
        }
    }

    lf.sort();
    return Result<LockFile>::ok(std::move(lf));
}

Result<LockFile> LockFile::load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return StacyError{StacyError::NotFound,
            "cannot open lockfile: " + path, "run 'stacy lock' to create it"};
    }
    std::stringstream buf;
    buf << in.rdbuf();
    auto r = parse(buf.str());
    if (r.is_err()) r.error().file = path;
    return r;
}

// ---------------------------------------------------------------------------
// Save
// ---------------------------------------------------------------------------

std::string LockFile::to_toml() const {
    LockFile sorted = *this;
    sorted.sort();

    std::ostringstream out;
    out << "# This file is auto-generated by stacy. Do not edit it by hand.\n";
    out << "version = " << format_version << "\n";
    out << "stacy_version = " << quote(stacy_version) << "\n";
    out << "manifest_hash = " << quote(manifest_hash) << "\n";

    for (const auto& p : sorted.packages) {
        out << "\n[[package]]\n";
        out << "name = " << quote(p.name) << "\n";
        out << "version = " << quote(p.version) << "\n";
        out << "source = " << quote(p.source) << "\n";
        out << "digest = " << quote(p.digest) << "\n";
        out << "group = " << quote(p.group) << "\n";
        if (!p.ref.empty()) out << "ref = " << quote(p.ref) << "\n";
        if (!p.commit.empty()) out << "commit = " << quote(p.commit) << "\n";
    }
    return out.str();
}

Status LockFile::save(const std::string& path) const {
    std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            return StacyError{StacyError::IO, "cannot write lockfile: " + path};
        }
        out << to_toml();
        if (!out.good()) {
            return StacyError{StacyError::IO, "failed writing lockfile: " + path};
        }
    }
    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        std::remove(tmp.c_str());
        return StacyError{StacyError::IO, "cannot replace lockfile: " + path};
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

const LockedPackage* LockFile::find(const std::string& name) const {
    std::string lc = lowercase(name);
    for (const auto& p : packages) {
        if (lowercase(p.name) == lc) return &p;
    }
    return nullptr;
}

void LockFile::sort() {
    std::sort(packages.begin(), packages.end(),
              [](const LockedPackage& a, const LockedPackage& b) {
                  return lowercase(a.name) < lowercase(b.name);
              });
}

std::set<std::string> LockFile::cache_keys() const {
    std::set<std::string> keys;
    for (const auto& p : packages) keys.insert(p.cache_key());
    return keys;
}

} // namespace stacy
