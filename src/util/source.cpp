#include <stacy/source.hpp>
#include <stacy/version.hpp>
#include <cctype>

namespace stacy {

const char* group_name(DependencyGroup g) {
    switch (g) {
        case DependencyGroup::Default: return "dependencies";
        case DependencyGroup::Dev:     return "dev";
        case DependencyGroup::Test:    return "test";
    }
    return "dependencies";
}

Result<DependencyGroup> parse_group(const std::string& s) {
    if (s.empty() || s == "dependencies" || s == "default" || s == "production") {
        return Result<DependencyGroup>::ok(DependencyGroup::Default);
    }
    if (s == "dev") return Result<DependencyGroup>::ok(DependencyGroup::Dev);
    if (s == "test") return Result<DependencyGroup>::ok(DependencyGroup::Test);
    return StacyError{StacyError::InvalidArg,
        "unknown dependency group '" + s + "'",
        "expected one of: dependencies, dev, test"};
}

bool is_valid_package_name(const std::string& name) {
    if (name.empty() || name.size() > 32) return false;
    unsigned char first = static_cast<unsigned char>(name[0]);
    if (!std::isalpha(first) && first != '_') return false;
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
    }
    return true;
}

std::string lowercase(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// ---------------------------------------------------------------------------
// PackageSource
// ---------------------------------------------------------------------------

static bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

Result<PackageSource> PackageSource::parse(const std::string& spec) {
    PackageSource src;

    if (spec.empty() || spec == "ssc") {
        src.kind = SourceKind::Index;
        src.index = "ssc";
        return Result<PackageSource>::ok(std::move(src));
    }

    if (starts_with(spec, "github:")) {
        std::string rest = spec.substr(7);
        size_t at = rest.find('@');
        if (at != std::string::npos) {
            src.ref = rest.substr(at + 1);
            rest = rest.substr(0, at);
            if (src.ref->empty()) {
                return StacyError{StacyError::Manifest,
                    "empty ref in source '" + spec + "'"};
            }
        }
        size_t slash = rest.find('/');
        if (slash == std::string::npos || slash == 0 || slash + 1 == rest.size() ||
            rest.find('/', slash + 1) != std::string::npos) {
            return StacyError{StacyError::Manifest,
                "invalid GitHub source '" + spec + "'",
                "expected github:user/repo or github:user/repo@ref"};
        }
        src.kind = SourceKind::Repository;
        src.github = rest;
        src.url = "https://github.com/" + rest + ".git";
        return Result<PackageSource>::ok(std::move(src));
    }

    if (starts_with(spec, "git:")) {
        std::string rest = spec.substr(4);
        size_t hash = rest.rfind('#');
        if (hash != std::string::npos) {
            src.ref = rest.substr(hash + 1);
            rest = rest.substr(0, hash);
        }
        if (rest.empty()) {
            return StacyError{StacyError::Manifest,
                "empty repository URL in source '" + spec + "'"};
        }
        src.kind = SourceKind::Repository;
        src.url = rest;
        return Result<PackageSource>::ok(std::move(src));
    }

    if (starts_with(spec, "local:")) {
        src.kind = SourceKind::Local;
        src.path = spec.substr(6);
        if (src.path.empty()) {
            return StacyError{StacyError::Manifest,
                "empty path in source '" + spec + "'"};
        }
        return Result<PackageSource>::ok(std::move(src));
    }

    if (starts_with(spec, "net:")) {
        src.kind = SourceKind::Net;
        src.url = spec.substr(4);
        while (!src.url.empty() && src.url.back() == '/') src.url.pop_back();
        if (src.url.empty()) {
            return StacyError{StacyError::Manifest,
                "empty URL in source '" + spec + "'"};
        }
        return Result<PackageSource>::ok(std::move(src));
    }

    return StacyError{StacyError::Manifest,
        "unknown package source '" + spec + "'",
        "use ssc, github:user/repo[@ref], git:<url>[#ref], local:<dir> or net:<url>"};
}

std::string PackageSource::to_string() const {
    switch (kind) {
        case SourceKind::Index:
            return index;
        case SourceKind::Repository:
            if (!github.empty()) {
                return "github:" + github + (ref ? "@" + *ref : "");
            }
            return "git:" + url + (ref ? "#" + *ref : "");
        case SourceKind::Local:
            return "local:" + path;
        case SourceKind::Net:
            return "net:" + url;
    }
    return index;
}

bool PackageSource::same_origin(const PackageSource& o) const {
    if (kind != o.kind) return false;
    switch (kind) {
        case SourceKind::Index:      return index == o.index;
        case SourceKind::Repository: return url == o.url;
        case SourceKind::Local:      return path == o.path;
        case SourceKind::Net:        return url == o.url;
    }
    return false;
}

std::string PackageSource::clone_url() const {
    return url;
}

// ---------------------------------------------------------------------------
// PackageRef
// ---------------------------------------------------------------------------

Status PackageRef::validate() const {
    if (!is_valid_package_name(name)) {
        return StacyError{StacyError::Manifest,
            "invalid package name '" + name + "'",
            "package names are Stata command names: [A-Za-z_][A-Za-z0-9_]*"};
    }
    if (!constraint.empty() && constraint != "*") {
        auto req = VersionReq::parse(constraint);
        if (req.is_err()) {
            return StacyError{StacyError::Manifest,
                "package '" + name + "' has invalid version constraint: " +
                req.error().message};
        }
    }
    return ok_status();
}

} // namespace stacy
