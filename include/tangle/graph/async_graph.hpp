#pragma once

#include "awaitable.hpp"
#include <tangle/coro/execution_frame.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cstdint>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tangle::graph {

inline constexpr node_id invalid_node = std::numeric_limits<node_id>::max();

enum class node_kind : uint8_t {
    frame,
    awaitable,
    error
};

constexpr const char* node_kind_to_string(node_kind kind) noexcept {
    switch (kind) {
        case node_kind::frame:     return "frame";
        case node_kind::awaitable: return "awaitable";
        case node_kind::error:     return "error";
        default:                   return "unknown";
    }
}

/// Logical call graph from a calling point back to the program entry
///
/// Nodes live in an arena and are addressed by node_id; edges are stored
/// forward in causal time ("awaited by"), from the node that happened
/// earlier to the node that later depended on it. Node identity is the
/// index, so two nodes with equal labels are still distinct vertices.
class async_graph {
public:
    struct frame_node {
        /// Identity only; the frame may be gone once construction is over
        const coro::execution_frame* frame;
        std::string label;
    };

    struct awaitable_node {
        std::shared_ptr<awaitable> target;
    };

    struct error_node {
        std::string text;
        awaiter_set awaiters;
    };

    struct node {
        std::variant<frame_node, awaitable_node, error_node> payload;
        std::vector<node_id> awaited_by;
    };

    async_graph() = default;
    async_graph(async_graph&&) noexcept = default;
    async_graph& operator=(async_graph&&) noexcept = default;
    async_graph(const async_graph&) = delete;
    async_graph& operator=(const async_graph&) = delete;

    node_id add_frame(const coro::execution_frame& frame) {
        return push(frame_node{&frame, frame.describe()});
    }

    node_id add_awaitable(std::shared_ptr<awaitable> target) {
        if (!target) {
            throw std::invalid_argument("async_graph: null awaitable");
        }
        return push(awaitable_node{std::move(target)});
    }

    /// Each call gets its own awaiter set
    node_id add_error(std::string text, awaiter_set awaiters = {}) {
        return push(error_node{std::move(text), std::move(awaiters)});
    }

    /// Record that `to` was awaited by / called `from`. Idempotent.
    void add_edge(node_id from, node_id to) {
        auto& edges = at(from).awaited_by;
        check(to);
        if (std::find(edges.begin(), edges.end(), to) == edges.end()) {
            edges.push_back(to);
        }
    }

    [[nodiscard]] node_kind kind(node_id id) const {
        return static_cast<node_kind>(at(id).payload.index());
    }

    [[nodiscard]] std::string label(node_id id) const {
        const auto& payload = at(id).payload;
        if (auto* f = std::get_if<frame_node>(&payload)) return f->label;
        if (auto* a = std::get_if<awaitable_node>(&payload)) return a->target->describe();
        return std::get<error_node>(payload).text;
    }

    [[nodiscard]] const std::vector<node_id>& awaited_by(node_id id) const {
        return at(id).awaited_by;
    }

    /// Live awaiters of a node: none for frames, the wrapped awaitable's
    /// awaiters for awaitable nodes, the fixed set for error nodes
    [[nodiscard]] std::vector<std::shared_ptr<awaitable>> awaiters_of(node_id id) const {
        const auto& payload = at(id).payload;
        if (auto* a = std::get_if<awaitable_node>(&payload)) {
            return a->target->get_awaiters().snapshot();
        }
        if (auto* e = std::get_if<error_node>(&payload)) {
            return e->awaiters.snapshot();
        }
        return {};
    }

    /// Frame identity of a frame node, nullptr for other kinds
    [[nodiscard]] const coro::execution_frame* frame_of(node_id id) const {
        if (auto* f = std::get_if<frame_node>(&at(id).payload)) return f->frame;
        return nullptr;
    }

    [[nodiscard]] std::shared_ptr<awaitable> awaitable_of(node_id id) const {
        if (auto* a = std::get_if<awaitable_node>(&at(id).payload)) return a->target;
        return nullptr;
    }

    [[nodiscard]] bool contains(node_id id) const noexcept { return id < nodes_.size(); }
    [[nodiscard]] size_t size() const noexcept { return nodes_.size(); }
    [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }

    [[nodiscard]] node_id head() const noexcept { return head_; }
    void set_head(node_id id) {
        check(id);
        head_ = id;
    }

    [[nodiscard]] size_t edge_count() const noexcept {
        size_t total = 0;
        for (const auto& n : nodes_) total += n.awaited_by.size();
        return total;
    }

private:
    template<typename Payload>
    node_id push(Payload&& payload) {
        nodes_.push_back(node{std::forward<Payload>(payload), {}});
        return nodes_.size() - 1;
    }

    void check(node_id id) const {
        if (!contains(id)) {
            throw std::out_of_range(fmt::format("async_graph: no node {}", id));
        }
    }

    node& at(node_id id) {
        check(id);
        return nodes_[id];
    }

    const node& at(node_id id) const {
        check(id);
        return nodes_[id];
    }

    std::vector<node> nodes_;
    node_id head_ = invalid_node;
};

} // namespace tangle::graph
