#pragma once

#include <pkglint/result.hpp>
#include <string>
#include <vector>
#include <unordered_map>
#include <queue>

namespace pkglint {

// ---------------------------------------------------------------------------
// Graph<NodeData>: directed graph with forward and reverse adjacency
// ---------------------------------------------------------------------------

template<typename NodeData>
class Graph {
public:
    using NodeId = size_t;

    NodeId add_node(NodeData data) {
        NodeId id = nodes_.size();
        nodes_.push_back(std::move(data));
        adj_.emplace_back();
        radj_.emplace_back();
        return id;
    }

    // Parallel edges are collapsed
    void add_edge(NodeId from, NodeId to) {
        if (has_edge(from, to)) return;
        adj_[from].push_back(to);
        radj_[to].push_back(from);
    }

    bool has_edge(NodeId from, NodeId to) const {
        for (NodeId t : adj_[from]) {
            if (t == to) return true;
        }
        return false;
    }

    size_t node_count() const { return nodes_.size(); }

    const NodeData& node(NodeId id) const { return nodes_[id]; }

    const std::vector<NodeId>& successors(NodeId id) const { return adj_[id]; }
    const std::vector<NodeId>& predecessors(NodeId id) const { return radj_[id]; }

    // Kahn's algorithm. Ties are broken by insertion order, so the result is
    // deterministic. On a cycle, the error lists the nodes left unsorted.
    template<typename NameFn>
    Result<std::vector<NodeId>> topological_sort(NameFn&& name_of) const {
        size_t n = nodes_.size();
        std::vector<size_t> in_deg(n);
        for (size_t i = 0; i < n; ++i) in_deg[i] = radj_[i].size();

        std::queue<NodeId> q;
        for (NodeId i = 0; i < n; ++i) {
            if (in_deg[i] == 0) q.push(i);
        }

        std::vector<NodeId> order;
        order.reserve(n);
        while (!q.empty()) {
            NodeId u = q.front();
            q.pop();
            order.push_back(u);
            for (NodeId v : adj_[u]) {
                if (--in_deg[v] == 0) q.push(v);
            }
        }

        if (order.size() != n) {
            std::string members;
            for (NodeId i = 0; i < n; ++i) {
                if (in_deg[i] == 0) continue;
                if (!members.empty()) members += ", ";
                members += name_of(nodes_[i]);
            }
            return LintError{LintError::Cycle,
                "dependency cycle detected among: " + members};
        }
        return Result<std::vector<NodeId>>::ok(std::move(order));
    }

    // Every node with a path to `id` (excluding `id` itself)
    std::vector<bool> ancestors(NodeId id) const {
        std::vector<bool> seen(nodes_.size(), false);
        std::queue<NodeId> q;
        q.push(id);
        while (!q.empty()) {
            NodeId u = q.front();
            q.pop();
            for (NodeId p : radj_[u]) {
                if (!seen[p]) {
                    seen[p] = true;
                    q.push(p);
                }
            }
        }
        seen[id] = false;
        return seen;
    }

private:
    std::vector<NodeData> nodes_;
    std::vector<std::vector<NodeId>> adj_;
    std::vector<std::vector<NodeId>> radj_;
};

// ---------------------------------------------------------------------------
// GraphMap: string-keyed convenience wrapper
// ---------------------------------------------------------------------------

class GraphMap {
public:
    using NodeId = Graph<std::string>::NodeId;

    NodeId add_node(const std::string& name) {
        auto it = ids_.find(name);
        if (it != ids_.end()) return it->second;
        NodeId id = graph_.add_node(name);
        ids_.emplace(name, id);
        return id;
    }

    bool has_node(const std::string& name) const {
        return ids_.count(name) > 0;
    }

    void add_edge(const std::string& from, const std::string& to) {
        NodeId f = add_node(from);
        NodeId t = add_node(to);
        graph_.add_edge(f, t);
    }

    Result<std::vector<std::string>> topological_sort() const {
        auto r = graph_.topological_sort([](const std::string& s) { return s; });
        if (r.is_err()) return std::move(r).error();
        std::vector<std::string> names;
        names.reserve(r.value().size());
        for (auto id : r.value()) names.push_back(graph_.node(id));
        return Result<std::vector<std::string>>::ok(std::move(names));
    }

    // Nodes with a path to `name`, in topological order. Unknown name or a
    // cycle is an error.
    Result<std::vector<std::string>> ancestors_sorted(const std::string& name) const {
        auto it = ids_.find(name);
        if (it == ids_.end()) {
            return LintError{LintError::NotFound,
                "'" + name + "' is not in the dependency graph"};
        }
        auto order = topological_sort();
        if (order.is_err()) return std::move(order).error();

        auto seen = graph_.ancestors(it->second);
        std::vector<std::string> result;
        for (auto& n : order.value()) {
            if (seen[ids_.at(n)]) result.push_back(std::move(n));
        }
        return Result<std::vector<std::string>>::ok(std::move(result));
    }

    bool has_cycle() const { return topological_sort().is_err(); }

    size_t node_count() const { return graph_.node_count(); }

    const Graph<std::string>& inner() const { return graph_; }

private:
    Graph<std::string> graph_;
    std::unordered_map<std::string, NodeId> ids_;
};

} // namespace pkglint
