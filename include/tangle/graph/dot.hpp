#pragma once

#include "async_graph.hpp"
#include <fmt/format.h>
#include <cstdio>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tangle::graph {

/// Escape text for a double-quoted Graphviz string
inline std::string escape_label(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            default:   out += c; break;
        }
    }
    return out;
}

/// Render the part of `graph` reachable from `from` for Graphviz dot
///
/// Vertex ids n1, n2, ... are assigned on first encounter. The walk is
/// iterative and tracks visited nodes, so long chains, diamonds and cycles
/// are all fine. Pipe the result through `dot -Tsvg` to view it.
///
/// @throws std::out_of_range if `from` is not a node of `graph`
inline std::string async_graph_to_dot(const async_graph& graph, node_id from) {
    if (!graph.contains(from)) {
        throw std::out_of_range(fmt::format("async_graph_to_dot: no node {}", from));
    }

    fmt::memory_buffer out;
    auto it = std::back_inserter(out);
    fmt::format_to(it, "digraph {{\n");

    std::unordered_map<node_id, size_t> node_to_id;
    size_t next_id = 0;
    auto id_of = [&](node_id node) {
        auto [pos, inserted] = node_to_id.try_emplace(node, next_id + 1);
        if (inserted) ++next_id;
        return pos->second;
    };

    std::vector<bool> seen(graph.size(), false);
    std::vector<node_id> q{from};
    while (!q.empty()) {
        node_id node = q.back();
        q.pop_back();
        if (seen[node]) continue;
        seen[node] = true;

        fmt::format_to(it, "  n{} [label=\"{}\" shape=box];\n",
                       id_of(node), escape_label(graph.label(node)));
        for (node_id child : graph.awaited_by(node)) {
            q.push_back(child);
            fmt::format_to(it, "n{} -> n{};\n", id_of(node), id_of(child));
        }
    }
    fmt::format_to(it, "}}\n");
    return fmt::to_string(out);
}

/// Render from the graph's head
inline std::string async_graph_to_dot(const async_graph& graph) {
    return async_graph_to_dot(graph, graph.head());
}

/// Write the rendering of `graph` to `out`
inline void write_dot(std::FILE* out, const async_graph& graph) {
    fmt::print(out, "{}", async_graph_to_dot(graph));
}

} // namespace tangle::graph
