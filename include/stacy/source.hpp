#pragma once

#include <stacy/result.hpp>
#include <string>
#include <optional>

namespace stacy {

enum class SourceKind {
    Index,       // "ssc": package index, latest distribution
    Repository,  // "github:user/repo[@ref]" or "git:<url>[#ref]"
    Local,       // "local:relative/dir"
    Net,         // "net:<base url>": index protocol at a custom location
};

enum class DependencyGroup { Default, Dev, Test };

const char* group_name(DependencyGroup g);
Result<DependencyGroup> parse_group(const std::string& s);

struct PackageSource {
    SourceKind kind = SourceKind::Index;
    std::string index = "ssc";          // Index
    std::string github;                 // Repository on GitHub: "user/repo"
    std::string url;                    // Repository clone URL, or Net base URL
    std::optional<std::string> ref;     // Repository: tag, branch or commit
    std::string path;                   // Local

    static Result<PackageSource> parse(const std::string& spec);

    // Canonical descriptor; parse(to_string()) round-trips
    std::string to_string() const;

    // Same location, ignoring the requested ref
    bool same_origin(const PackageSource& o) const;

    std::string clone_url() const;
};

// A dependency as declared in the manifest
struct PackageRef {
    std::string name;
    PackageSource source;
    std::string constraint;   // empty: any version
    DependencyGroup group = DependencyGroup::Default;

    Status validate() const;
};

// Stata command names: letter or underscore first, then [A-Za-z0-9_],
// at most 32 characters
bool is_valid_package_name(const std::string& name);

// ASCII lowercase; package names compare case-insensitively
std::string lowercase(std::string s);

} // namespace stacy
