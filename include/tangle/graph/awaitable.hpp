#pragma once

#include <tangle/coro/execution_frame.hpp>
#include <algorithm>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace tangle::graph {

class async_graph;
class awaitable;

/// Index of a node inside an async_graph
using node_id = std::size_t;

/// Result of expanding an awaitable into graph nodes
struct node_pair {
    /// Node standing for "this awaitable reached this point"; carries the
    /// awaitable's awaiters
    node_id tail;
    /// Node to wire whatever comes causally before the awaitable into
    node_id head;
};

/// Set of awaitables currently suspended on another awaitable
///
/// Shared helper composed by every awaitable kind. Holds weak references so
/// that waiting never extends an awaiter's lifetime; destroyed awaiters are
/// skipped by snapshot(). Duplicate registrations are ignored and
/// registration order is kept.
class awaiter_set {
public:
    /// Returns false if `awaiter` was already registered
    bool add(const std::shared_ptr<awaitable>& awaiter) {
        if (!awaiter || contains(awaiter)) {
            return false;
        }
        awaiters_.emplace_back(awaiter);
        return true;
    }

    [[nodiscard]] bool contains(const std::shared_ptr<awaitable>& awaiter) const noexcept {
        return std::any_of(awaiters_.begin(), awaiters_.end(),
            [&](const std::weak_ptr<awaitable>& w) {
                return !w.owner_before(awaiter) && !awaiter.owner_before(w);
            });
    }

    /// Live awaiters at the time of the call
    [[nodiscard]] std::vector<std::shared_ptr<awaitable>> snapshot() const {
        std::vector<std::shared_ptr<awaitable>> live;
        live.reserve(awaiters_.size());
        for (const auto& w : awaiters_) {
            if (auto a = w.lock()) {
                live.push_back(std::move(a));
            }
        }
        return live;
    }

    /// Number of registrations, including awaiters destroyed since
    [[nodiscard]] size_t size() const noexcept { return awaiters_.size(); }
    [[nodiscard]] bool empty() const noexcept { return awaiters_.empty(); }

private:
    std::vector<std::weak_ptr<awaitable>> awaiters_;
};

/// Capability of anything other awaitables can wait on
///
/// Implemented by schedulable units, deferred results and synchronization
/// primitives. The runtime registers awaiters as a side effect of
/// suspension; the graph builder only reads them.
class awaitable : public std::enable_shared_from_this<awaitable> {
public:
    virtual ~awaitable() = default;

    /// Current awaiters. A reference, not a copy.
    [[nodiscard]] virtual const awaiter_set& get_awaiters() const noexcept = 0;

    virtual void add_awaiter(std::shared_ptr<awaitable> awaiter) = 0;

    /// Expand into a sub-graph of `graph`, returning its tail and head
    [[nodiscard]] virtual node_pair make_async_graph_nodes(async_graph& graph) = 0;

    [[nodiscard]] virtual std::string describe() const = 0;
};

/// A unit of cooperative work tracked by a scheduler
class schedulable_unit : public awaitable {
public:
    /// Outermost frame of the unit's coroutine stack; nullptr when the unit
    /// has not started or has finished
    [[nodiscard]] virtual const coro::execution_frame* entry_frame() const noexcept = 0;
};

} // namespace tangle::graph
