#pragma once

#include <stacy/result.hpp>
#include <stacy/graph.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace stacy {

enum class RefKind { Do, Run, Include, Package };

const char* ref_kind_name(RefKind kind);

// One inclusion or requirement statement found in a script
struct ScriptReference {
    RefKind kind = RefKind::Do;
    std::string target;      // path as written, or package name
    std::string installer;   // "ssc", "net", "require", "which" for packages
    int line = 0;
    bool guarded = false;    // under capture
    bool dynamic = false;    // path built from macros; cannot be followed
};

// Scan script text. Comment lines, trailing // comments and /* */ blocks
// are ignored.
std::vector<ScriptReference> scan_script(const std::string& content);

struct DependencyNode {
    std::string path;        // absolute path, or package name
    RefKind kind = RefKind::Do;
    bool is_package = false;
    bool exists = true;
    bool cyclic = false;     // participates in at least one cycle
};

struct DependencyEdge {
    RefKind kind = RefKind::Do;
    int line = 0;
    bool guarded = false;
    bool circular = false;   // target was on the expansion stack
};

struct FlatDependency {
    std::string path;
    RefKind kind = RefKind::Do;
    size_t depth = 0;
    bool exists = true;
    bool is_package = false;
};

struct DependencyAnalysis {
    using DepGraph = Graph<DependencyNode, DependencyEdge>;

    DepGraph graph;
    DepGraph::NodeId root = 0;
    std::filesystem::path base_dir;          // for display

    std::vector<std::vector<std::string>> cycles;  // each closed: A, B, C, A
    std::vector<std::string> missing;              // first-discovery order
    std::vector<std::string> packages;
    std::vector<ScriptReference> unresolved;       // dynamic paths

    size_t unique_count() const;
    bool has_circular() const { return !cycles.empty(); }
    size_t circular_count() const { return cycles.size(); }
    bool has_missing() const { return !missing.empty(); }

    std::string format_tree() const;
    std::vector<FlatDependency> flatten() const;

    // Path relative to base_dir when below it
    std::string display_path(const std::string& path) const;
};

class DependencyAnalyzer {
public:
    // Missing root script is a NotFound error; missing transitive
    // dependencies are reported in the analysis.
    Result<DependencyAnalysis> analyze(const std::filesystem::path& root_script);
};

} // namespace stacy
