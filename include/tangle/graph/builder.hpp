#pragma once

#include "async_graph.hpp"
#include <tangle/coro/execution_frame.hpp>
#include <tangle/log/macros.hpp>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tangle::graph {

/// Runtime hook returning the schedulable unit running right now, or null
using current_unit_hook = std::function<std::shared_ptr<schedulable_unit>()>;

inline constexpr std::string_view exit_frame_not_found =
    "Could not find exit frame for current task";
inline constexpr std::string_view entry_point_not_found =
    "Could not link current task to entry point.";

namespace detail {

/// Chain frame nodes from `frame` to the end of the frame chain.
/// Returns the first node, or invalid_node if `frame` is null.
inline node_id chain_frames(async_graph& graph, const coro::execution_frame* frame) {
    node_id first = invalid_node;
    node_id last = invalid_node;
    for (; frame; frame = frame->caller()) {
        node_id next = graph.add_frame(*frame);
        if (first == invalid_node) {
            first = next;
        } else {
            graph.add_edge(last, next);
        }
        last = next;
    }
    return first;
}

} // namespace detail

/// Build the logical call graph from `caller` back to the program entry
///
/// Without a current unit this is a plain walk of the frame chain. With one,
/// the unit and everything transitively awaiting it are expanded (each
/// awaitable once), the frames above the unit are grafted on top, and the
/// frames below the scheduler that drives it are attached under every
/// terminal node. Linkage failures become error nodes; the graph is always
/// returned with head() set to the caller's side of the graph.
///
/// Must not suspend: the awaiter sets it reads belong to the scheduler.
///
/// @throws std::invalid_argument if `caller` is null
/// @throws std::logic_error if the awaiter traversal finds no terminal node
[[nodiscard]] inline async_graph get_async_graph(const coro::execution_frame* caller,
                                                 const current_unit_hook& current_unit = {}) {
    if (!caller) {
        throw std::invalid_argument("get_async_graph: caller has no execution frame");
    }

    async_graph graph;
    std::shared_ptr<schedulable_unit> unit = current_unit ? current_unit() : nullptr;

    if (!unit) {
        graph.set_head(detail::chain_frames(graph, caller));
        TANGLE_LOG_DEBUG("async graph: no current unit, walked {} frames", graph.size());
        return graph;
    }

    // Expand the current unit and everything waiting on it
    auto [task_node, task_head_node] = unit->make_async_graph_nodes(graph);
    node_id head_node = task_head_node;

    std::vector<node_id> node_q{task_node};
    std::vector<node_id> terminal_async_nodes;
    std::unordered_map<const awaitable*, node_id> awaitable_to_head_node{
        {unit.get(), task_head_node}};

    while (!node_q.empty()) {
        node_id node = node_q.back();
        node_q.pop_back();

        auto awaiters = graph.awaiters_of(node);
        if (awaiters.empty()) {
            terminal_async_nodes.push_back(node);
            continue;
        }
        for (auto& child : awaiters) {
            auto it = awaitable_to_head_node.find(child.get());
            if (it != awaitable_to_head_node.end()) {
                graph.add_edge(node, it->second);
                continue;
            }
            auto [child_node, child_head_node] = child->make_async_graph_nodes(graph);
            awaitable_to_head_node.emplace(child.get(), child_head_node);
            node_q.push_back(child_node);
            graph.add_edge(node, child_head_node);
        }
    }

    if (terminal_async_nodes.empty()) {
        TANGLE_LOG_ERROR("async graph: {} awaitables expanded from {} but none is terminal",
                         awaitable_to_head_node.size(), unit->describe());
        throw std::logic_error("get_async_graph: awaiter traversal found no terminal node");
    }

    // Top: frames above the current unit's innermost frame
    const coro::execution_frame* frame = caller;
    if (graph.kind(task_head_node) == node_kind::frame) {
        const coro::execution_frame* exit_frame = graph.frame_of(task_head_node);
        node_id tail_node = invalid_node;
        while (frame != exit_frame) {
            node_id new_node = graph.add_frame(*frame);
            if (tail_node == invalid_node) {
                head_node = new_node;
            } else {
                graph.add_edge(tail_node, new_node);
            }
            tail_node = new_node;
            frame = frame->caller();
            if (!frame) {
                node_id error = graph.add_error(std::string(exit_frame_not_found));
                graph.add_edge(tail_node, error);
                tail_node = error;
                break;
            }
        }
        if (tail_node != invalid_node) {
            graph.add_edge(tail_node, task_head_node);
        }
    }

    // Bottom: frames after the unit's entry frame, down to the program entry
    const coro::execution_frame* entry_frame = unit->entry_frame();
    bool entry_found = false;
    while (frame) {
        const coro::execution_frame* visited = frame;
        frame = frame->caller();
        if (entry_frame && visited == entry_frame) {
            entry_found = true;
            break;
        }
    }

    if (!entry_found) {
        node_id error = graph.add_error(std::string(entry_point_not_found));
        for (node_id terminal : terminal_async_nodes) {
            graph.add_edge(terminal, error);
        }
    } else if (node_id rest = detail::chain_frames(graph, frame); rest != invalid_node) {
        for (node_id terminal : terminal_async_nodes) {
            graph.add_edge(terminal, rest);
        }
    }

    graph.set_head(head_node);
    TANGLE_LOG_DEBUG("async graph: {} nodes, {} edges, {} terminal",
                     graph.size(), graph.edge_count(), terminal_async_nodes.size());
    return graph;
}

} // namespace tangle::graph
