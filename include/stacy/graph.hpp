#pragma once

#include <stacy/result.hpp>
#include <string>
#include <vector>
#include <unordered_map>
#include <unordered_set>
#include <algorithm>
#include <functional>
#include <sstream>

namespace stacy {

// ---------------------------------------------------------------------------
// Graph<NodeData, EdgeData>: arena of nodes with ordered adjacency lists
// ---------------------------------------------------------------------------

template<typename NodeData, typename EdgeData = std::monostate>
class Graph {
public:
    using NodeId = size_t;

    struct Edge {
        NodeId from;
        NodeId to;
        EdgeData data;
    };

    NodeId add_node(NodeData data) {
        NodeId id = nodes_.size();
        nodes_.push_back(std::move(data));
        adj_.push_back({});
        return id;
    }

    void add_edge(NodeId from, NodeId to, EdgeData data = {}) {
        adj_[from].push_back({from, to, std::move(data)});
    }

    size_t node_count() const { return nodes_.size(); }

    const NodeData& node(NodeId id) const { return nodes_[id]; }
    NodeData& node(NodeId id) { return nodes_[id]; }

    // In insertion order
    const std::vector<Edge>& successors(NodeId id) const { return adj_[id]; }

    // First cycle reachable from `start` as a closed path (first == last),
    // or an empty vector. Uses an explicit on-path set.
    std::vector<NodeId> find_cycle(NodeId start) const {
        std::vector<NodeId> path;
        std::unordered_set<NodeId> on_path;
        std::unordered_set<NodeId> done;
        std::vector<NodeId> cycle;
        find_cycle_impl(start, path, on_path, done, cycle);
        return cycle;
    }

    // Tree rendering with box-drawing connectors. `label` renders a node
    // reached through `via` (nullptr for the root); `expand` decides whether
    // the child reached through an edge is descended into.
    std::string tree_display(
        NodeId root,
        const std::function<std::string(NodeId, const Edge*)>& label,
        const std::function<bool(const Edge&)>& expand) const
    {
        std::ostringstream out;
        out << label(root, nullptr) << "\n";
        tree_children(root, "", label, expand, out);
        return out.str();
    }

private:
    std::vector<NodeData> nodes_;
    std::vector<std::vector<Edge>> adj_;

    bool find_cycle_impl(NodeId u,
                         std::vector<NodeId>& path,
                         std::unordered_set<NodeId>& on_path,
                         std::unordered_set<NodeId>& done,
                         std::vector<NodeId>& cycle) const {
        path.push_back(u);
        on_path.insert(u);
        for (const auto& e : adj_[u]) {
            if (on_path.count(e.to)) {
                auto it = std::find(path.begin(), path.end(), e.to);
                cycle.assign(it, path.end());
                cycle.push_back(e.to);
                return true;
            }
            if (done.count(e.to)) continue;
            if (find_cycle_impl(e.to, path, on_path, done, cycle)) return true;
        }
        on_path.erase(u);
        path.pop_back();
        done.insert(u);
        return false;
    }

    void tree_children(
        NodeId u,
        const std::string& prefix,
        const std::function<std::string(NodeId, const Edge*)>& label,
        const std::function<bool(const Edge&)>& expand,
        std::ostringstream& out) const
    {
        const auto& edges = adj_[u];
        for (size_t i = 0; i < edges.size(); ++i) {
            bool last = (i + 1 == edges.size());
            out << prefix << (last ? "└── " : "├── ")
                << label(edges[i].to, &edges[i]) << "\n";
            if (expand(edges[i])) {
                tree_children(edges[i].to, prefix + (last ? "    " : "│   "),
                              label, expand, out);
            }
        }
    }
};

// ---------------------------------------------------------------------------
// GraphMap: string-keyed convenience wrapper
// ---------------------------------------------------------------------------

template<typename EdgeData = std::monostate>
class GraphMap {
public:
    using NodeId = typename Graph<std::string, EdgeData>::NodeId;

    NodeId add_node(const std::string& name) {
        auto it = name_to_id_.find(name);
        if (it != name_to_id_.end()) return it->second;
        NodeId id = graph_.add_node(name);
        name_to_id_[name] = id;
        return id;
    }

    bool has_node(const std::string& name) const {
        return name_to_id_.count(name) > 0;
    }

    NodeId node_id(const std::string& name) const {
        return name_to_id_.at(name);
    }

    void add_edge(const std::string& from, const std::string& to,
                  EdgeData data = {}) {
        NodeId f = add_node(from);
        NodeId t = add_node(to);
        graph_.add_edge(f, t, std::move(data));
    }

    // Cycle reachable from `start`, as names ("a", "b", "a"); empty if none
    std::vector<std::string> find_cycle(const std::string& start) const {
        std::vector<std::string> names;
        auto it = name_to_id_.find(start);
        if (it == name_to_id_.end()) return names;
        for (auto id : graph_.find_cycle(it->second)) {
            names.push_back(graph_.node(id));
        }
        return names;
    }

    size_t node_count() const { return graph_.node_count(); }

    const Graph<std::string, EdgeData>& inner() const { return graph_; }

private:
    Graph<std::string, EdgeData> graph_;
    std::unordered_map<std::string, NodeId> name_to_id_;
};

} // namespace stacy
