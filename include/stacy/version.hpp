#pragma once

#include <stacy/result.hpp>
#include <string>
#include <vector>

#define STACY_VERSION "0.1.0"

namespace stacy {

// Package version: 1 to 3 numeric components plus an optional label.
// Index packages use their distribution date ("20240115"), repository
// packages their tag ("2.49.1"), so both forms must compare.
struct Version {
    int major = 0;
    int minor = 0;
    int micro = 0;
    int components = 3;   // how many numeric parts were written
    std::string label;    // "rc1", empty for release

    static Result<Version> parse(const std::string& s);
    std::string to_string() const;

    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const;
    bool operator<(const Version& o) const;
    bool operator<=(const Version& o) const;
    bool operator>(const Version& o) const;
    bool operator>=(const Version& o) const;
};

// Partial version for constraints: "1", "1.2", "1.2.3"
struct PartialVersion {
    int major = 0;
    int minor = -1;  // -1 means unset
    int micro = -1;  // -1 means unset

    static Result<PartialVersion> parse(const std::string& s);
    std::string to_string() const;
};

enum class ConstraintOp {
    Exact,       // =1.2.3
    Caret,       // ^1.2.3 (compatible with)
    Tilde,       // ~1.2.3 (patch-level changes)
    GreaterEq,   // >=1.2.3
    Greater,     // >1.2.3
    LessEq,      // <=1.2.3
    Less,        // <1.2.3
};

struct VersionConstraint {
    ConstraintOp op;
    PartialVersion version;

    bool matches(const Version& v) const;
    std::string to_string() const;
};

// Conjunction: ">=20230101, <20250101"
struct VersionReq {
    std::vector<VersionConstraint> constraints;

    static Result<VersionReq> parse(const std::string& s);
    bool matches(const Version& v) const;
    std::string to_string() const;
};

// True when `version` satisfies `req`. An empty requirement matches
// everything; a version that does not parse matches only "*".
bool version_satisfies(const std::string& version, const std::string& req);

} // namespace stacy
