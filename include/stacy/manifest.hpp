#pragma once

#include <stacy/result.hpp>
#include <stacy/source.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stacy {

// [project] section
struct ProjectInfo {
    std::string name;
    std::string description;
    std::string url;
    std::vector<std::string> authors;
};

// [scripts.<name>] entry
struct TaskDef {
    enum class Kind {
        Script,     // run one script
        Sequence,   // run steps in order, stop at the first failure
        Parallel,   // run steps concurrently
    };

    std::string name;
    Kind kind = Kind::Script;
    std::string script;                          // Script
    std::map<std::string, std::string> args;     // Script: STACY_ARG_<KEY>
    std::vector<std::string> steps;              // Sequence/Parallel: task names or scripts
    std::string description;
};

// [run] section; unset fields defer to user config and defaults
struct RunSettings {
    std::optional<std::string> log_dir;
    std::optional<int> jobs;
    std::optional<int> timeout_seconds;
    std::optional<bool> allow_global;
};

struct Manifest {
    ProjectInfo project;
    std::vector<PackageRef> packages;            // every group, declaration order
    std::map<std::string, TaskDef> tasks;
    RunSettings run;

    static Result<Manifest> parse(const std::string& toml_str);
    static Result<Manifest> load(const std::string& path);

    std::string to_toml() const;
    Status save(const std::string& path) const;

    const PackageRef* find_package(const std::string& name) const;
    std::vector<const PackageRef*> packages_in(DependencyGroup g) const;

    // Declare or replace a package; the name is matched case-insensitively
    Status add_package(PackageRef ref);
    bool remove_package(const std::string& name);

    // SHA-256 over the sorted "group:name=source@constraint" lines. Task and
    // project metadata do not contribute.
    std::string dependency_hash() const;
};

} // namespace stacy
