#include <stacy/script_deps.hpp>
#include <stacy/log.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace fs = std::filesystem;

namespace stacy {

const char* ref_kind_name(RefKind kind) {
    switch (kind) {
        case RefKind::Do:      return "do";
        case RefKind::Run:     return "run";
        case RefKind::Include: return "include";
        case RefKind::Package: return "package";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Statement scanning
// ---------------------------------------------------------------------------

static std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Remove /* ... */ segments, carrying block state across lines
static std::string strip_block_comments(const std::string& line, bool& in_block) {
    std::string out;
    size_t i = 0;
    while (i < line.size()) {
        if (in_block) {
            size_t close = line.find("*/", i);
            if (close == std::string::npos) return out;
            in_block = false;
            i = close + 2;
            continue;
        }
        size_t open = line.find("/*", i);
        if (open == std::string::npos) {
            out += line.substr(i);
            break;
        }
        out += line.substr(i, open - i);
        in_block = true;
        i = open + 2;
    }
    return out;
}

// Cut a trailing // or /// comment (must follow whitespace, so URLs survive)
static std::string strip_line_comment(const std::string& s) {
    for (size_t i = 1; i + 1 < s.size(); ++i) {
        if (s[i] == '/' && s[i + 1] == '/' &&
            std::isspace(static_cast<unsigned char>(s[i - 1]))) {
            return trim(s.substr(0, i));
        }
    }
    return s;
}

static std::string next_word(const std::string& s, size_t& pos) {
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) ++pos;
    size_t start = pos;
    while (pos < s.size() && !std::isspace(static_cast<unsigned char>(s[pos])) &&
           s[pos] != ',' && s[pos] != ':') {
        ++pos;
    }
    std::string w = s.substr(start, pos - start);
    if (pos < s.size() && s[pos] == ':') ++pos;
    return w;
}

static bool is_prefix_of(const std::string& word, const std::string& full,
                         size_t min_len) {
    return word.size() >= min_len && word.size() <= full.size() &&
           full.compare(0, word.size(), word) == 0;
}

// Path argument: "a b.do", `"a b.do"', 'a.do', or a bare token
static std::string parse_path_arg(const std::string& s, size_t pos) {
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) ++pos;
    if (pos >= s.size()) return "";

    if (s.compare(pos, 2, "`\"") == 0) {
        size_t end = s.find("\"'", pos + 2);
        if (end == std::string::npos) return "";
        return s.substr(pos + 2, end - pos - 2);
    }
    if (s[pos] == '"' || s[pos] == '\'') {
        char q = s[pos];
        size_t end = s.find(q, pos + 1);
        if (end == std::string::npos) return "";
        return s.substr(pos + 1, end - pos - 1);
    }
    size_t end = pos;
    while (end < s.size() && !std::isspace(static_cast<unsigned char>(s[end])) &&
           s[end] != ',') {
        ++end;
    }
    return s.substr(pos, end - pos);
}

std::vector<ScriptReference> scan_script(const std::string& content) {
    std::vector<ScriptReference> refs;
    std::istringstream stream(content);
    std::string raw;
    int line_no = 0;
    bool in_block = false;

    while (std::getline(stream, raw)) {
        ++line_no;
        std::string t = trim(strip_block_comments(raw, in_block));
        if (t.empty() || t[0] == '*' || t.compare(0, 2, "//") == 0) continue;
        t = strip_line_comment(t);

        size_t pos = 0;
        bool guarded = false;
        std::string cmd;
        for (;;) {
            size_t save = pos;
            std::string w = lower(next_word(t, pos));
            if (is_prefix_of(w, "capture", 3)) {
                guarded = true;
            } else if (is_prefix_of(w, "quietly", 3) || is_prefix_of(w, "noisily", 3)) {
                // output prefixes only
            } else {
                cmd = w;
                if (w.empty()) pos = save;
                break;
            }
        }

        ScriptReference ref;
        ref.line = line_no;
        ref.guarded = guarded;

        if (cmd == "do" || cmd == "run" || cmd == "include") {
            ref.kind = cmd == "do" ? RefKind::Do
                     : cmd == "run" ? RefKind::Run : RefKind::Include;
            ref.target = parse_path_arg(t, pos);
            if (ref.target.empty()) continue;
            ref.dynamic = ref.target.find('`') != std::string::npos ||
                          ref.target.find('$') != std::string::npos;
            if (!ref.dynamic && !fs::path(ref.target).has_extension()) {
                ref.target += ".do";
            }
            refs.push_back(std::move(ref));
            continue;
        }

        ref.kind = RefKind::Package;
        if (cmd == "ssc" || cmd == "net") {
            if (lower(next_word(t, pos)) != "install") continue;
            ref.installer = cmd;
        } else if (cmd == "require" || cmd == "which") {
            ref.installer = cmd;
        } else {
            continue;
        }
        ref.target = next_word(t, pos);
        if (ref.target.empty()) continue;
        refs.push_back(std::move(ref));
    }
    return refs;
}

// ---------------------------------------------------------------------------
// Traversal
// ---------------------------------------------------------------------------

namespace {

using NodeId = DependencyAnalysis::DepGraph::NodeId;

struct Walker {
    DependencyAnalysis& out;
    std::unordered_map<std::string, NodeId> index;
    std::unordered_set<NodeId> on_path;
    std::unordered_set<NodeId> resolved;
    std::vector<NodeId> stack;

    explicit Walker(DependencyAnalysis& a) : out(a) {}

    NodeId intern_file(const fs::path& p, RefKind kind) {
        std::error_code ec;
        bool exists = fs::is_regular_file(p, ec);
        fs::path key = exists ? fs::weakly_canonical(p, ec) : p.lexically_normal();
        if (ec) key = p.lexically_normal();

        auto it = index.find(key.string());
        if (it != index.end()) return it->second;

        DependencyNode node;
        node.path = key.string();
        node.kind = kind;
        node.exists = exists;
        NodeId id = out.graph.add_node(std::move(node));
        index.emplace(key.string(), id);
        return id;
    }

    NodeId intern_package(const std::string& name) {
        std::string key = "package:" + lower(name);
        auto it = index.find(key);
        if (it != index.end()) return it->second;

        DependencyNode node;
        node.path = name;
        node.kind = RefKind::Package;
        node.is_package = true;
        NodeId id = out.graph.add_node(std::move(node));
        index.emplace(key, id);
        out.packages.push_back(name);
        return id;
    }

    void record_cycle(NodeId target) {
        auto it = std::find(stack.begin(), stack.end(), target);
        std::vector<std::string> cycle;
        for (; it != stack.end(); ++it) {
            out.graph.node(*it).cyclic = true;
            cycle.push_back(out.display_path(out.graph.node(*it).path));
        }
        cycle.push_back(out.display_path(out.graph.node(target).path));
        out.cycles.push_back(std::move(cycle));
    }

    void expand(NodeId id) {
        on_path.insert(id);
        stack.push_back(id);

        fs::path script = out.graph.node(id).path;
        std::ifstream in(script);
        if (!in) {
            log::warn("cannot read %s", script.string().c_str());
        } else {
            std::ostringstream ss;
            ss << in.rdbuf();
            fs::path dir = script.parent_path();

            for (auto& ref : scan_script(ss.str())) {
                DependencyEdge edge;
                edge.kind = ref.kind;
                edge.line = ref.line;
                edge.guarded = ref.guarded;

                if (ref.kind == RefKind::Package) {
                    out.graph.add_edge(id, intern_package(ref.target), edge);
                    continue;
                }
                if (ref.dynamic) {
                    log::debug("%s:%d: cannot follow '%s'",
                               script.string().c_str(), ref.line, ref.target.c_str());
                    out.unresolved.push_back(std::move(ref));
                    continue;
                }

                fs::path target(ref.target);
                if (target.is_relative()) target = dir / target;
                NodeId child = intern_file(target, ref.kind);

                if (on_path.count(child)) {
                    edge.circular = true;
                    out.graph.add_edge(id, child, edge);
                    record_cycle(child);
                    continue;
                }

                out.graph.add_edge(id, child, edge);
                const DependencyNode& cn = out.graph.node(child);
                if (!cn.exists) {
                    std::string shown = out.display_path(cn.path);
                    if (std::find(out.missing.begin(), out.missing.end(), shown) ==
                        out.missing.end()) {
                        out.missing.push_back(shown);
                    }
                    continue;
                }
                if (resolved.count(child)) continue;  // shared dependency
                expand(child);
            }
        }

        stack.pop_back();
        on_path.erase(id);
        resolved.insert(id);
    }
};

} // namespace

Result<DependencyAnalysis> DependencyAnalyzer::analyze(const fs::path& root_script) {
    std::error_code ec;
    if (!fs::is_regular_file(root_script, ec)) {
        return StacyError{StacyError::NotFound,
            "script not found: " + root_script.string()};
    }

    DependencyAnalysis analysis;
    fs::path abs = fs::absolute(root_script, ec);
    analysis.base_dir = fs::weakly_canonical(abs, ec).parent_path();

    Walker walker(analysis);
    analysis.root = walker.intern_file(abs, RefKind::Do);
    walker.expand(analysis.root);

    log::debug("analyzed %s: %zu unique, %zu circular, %zu missing",
               root_script.string().c_str(), analysis.unique_count(),
               analysis.circular_count(), analysis.missing.size());
    return Result<DependencyAnalysis>::ok(std::move(analysis));
}

// ---------------------------------------------------------------------------
// Output
// ---------------------------------------------------------------------------

size_t DependencyAnalysis::unique_count() const {
    return graph.node_count() == 0 ? 0 : graph.node_count() - 1;
}

std::string DependencyAnalysis::display_path(const std::string& path) const {
    if (base_dir.empty()) return path;
    fs::path p(path);
    if (!p.is_absolute()) return path;
    fs::path rel = p.lexically_relative(base_dir);
    if (rel.empty() || rel.native().compare(0, 2, "..") == 0) return path;
    return rel.generic_string();
}

std::string DependencyAnalysis::format_tree() const {
    if (graph.node_count() == 0) return "";
    return graph.tree_display(root,
        [this](NodeId id, const DepGraph::Edge* via) {
            const DependencyNode& n = graph.node(id);
            std::string s = n.is_package ? n.path + " [package]" : display_path(n.path);
            if (!via) return s;
            if (via->data.guarded) s += " (guarded)";
            if (via->data.circular) s += " (circular)";
            if (!n.exists) s += " (missing)";
            return s;
        },
        [this](const DepGraph::Edge& e) {
            const DependencyNode& n = graph.node(e.to);
            return !e.data.circular && !n.is_package && n.exists;
        });
}

std::vector<FlatDependency> DependencyAnalysis::flatten() const {
    std::vector<FlatDependency> flat;
    if (graph.node_count() == 0) return flat;

    std::unordered_set<NodeId> seen{root};
    std::function<void(NodeId, size_t)> walk = [&](NodeId u, size_t depth) {
        for (const auto& e : graph.successors(u)) {
            if (e.data.circular || !seen.insert(e.to).second) continue;
            const DependencyNode& n = graph.node(e.to);
            flat.push_back({n.is_package ? n.path : display_path(n.path),
                            e.data.kind, depth, n.exists, n.is_package});
            if (!n.is_package && n.exists) walk(e.to, depth + 1);
        }
    };
    walk(root, 1);
    return flat;
}

} // namespace stacy
