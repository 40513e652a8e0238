#pragma once

#include "event_loop.hpp"
#include "join_handle.hpp"
#include <tangle/graph/async_graph.hpp>
#include <fmt/format.h>
#include <coroutine>
#include <exception>
#include <memory>
#include <string>
#include <vector>

namespace tangle::runtime {

namespace detail {

/// Completion state shared by gather() and task_group
///
/// Registered as an awaiter of every child unit, so a graph taken from a
/// child shows the join point, and whoever waits on the join shows after it.
class join_state final : public graph::awaitable {
public:
    explicit join_state(const char* kind) noexcept : kind_(kind) {}

    [[nodiscard]] const graph::awaiter_set& get_awaiters() const noexcept override {
        return awaiters_;
    }

    void add_awaiter(std::shared_ptr<graph::awaitable> awaiter) override {
        awaiters_.add(awaiter);
    }

    [[nodiscard]] graph::node_pair make_async_graph_nodes(graph::async_graph& graph) override {
        return single_node(graph, *this);
    }

    [[nodiscard]] std::string describe() const override {
        return fmt::format("{} [{}/{} done]", kind_, finished_, children_.size());
    }

    /// Track `child`; the join is pending until it finishes
    void watch(const std::shared_ptr<unit_base>& child) {
        children_.push_back(child);
        child->add_awaiter(shared_from_this());
        child->add_done_callback([weak = weak_from_this(), raw = child.get()] {
            if (auto self = weak.lock()) {
                static_cast<join_state&>(*self).child_done(*raw);
            }
        });
    }

    [[nodiscard]] bool done() const noexcept { return finished_ == children_.size(); }
    [[nodiscard]] size_t size() const noexcept { return children_.size(); }

    void wait(std::coroutine_handle<> leaf) {
        park_current_unit(*this, callbacks_, leaf);
    }

    /// First child failure, in completion order
    [[nodiscard]] std::exception_ptr first_exception() const noexcept { return first_exception_; }

private:
    void child_done(const unit_base& child) {
        ++finished_;
        if (child.failed() && !first_exception_) {
            first_exception_ = child.exception();
        }
        if (done()) {
            callbacks_.fire();
        }
    }

    const char* kind_;
    graph::awaiter_set awaiters_;
    done_callbacks callbacks_;
    std::vector<std::shared_ptr<unit_base>> children_;
    size_t finished_ = 0;
    std::exception_ptr first_exception_;
};

} // namespace detail

/// Awaitable completing when every gathered unit has finished
///
/// Rethrows the first child exception on resume. Child results are read
/// through their join handles.
class gather_awaitable {
public:
    explicit gather_awaitable(std::shared_ptr<detail::join_state> state) noexcept
        : state_(std::move(state)) {}

    [[nodiscard]] bool await_ready() const noexcept { return state_->done(); }

    void await_suspend(std::coroutine_handle<> leaf) { state_->wait(leaf); }

    void await_resume() const {
        if (auto ex = state_->first_exception()) {
            std::rethrow_exception(ex);
        }
    }

    [[nodiscard]] std::shared_ptr<graph::awaitable> as_awaitable() const noexcept {
        return state_;
    }

private:
    std::shared_ptr<detail::join_state> state_;
};

/// Wait for several spawned units: co_await runtime::gather(h1, h2, ...);
template<typename... Ts>
[[nodiscard]] gather_awaitable gather(const join_handle<Ts>&... handles) {
    auto state = std::make_shared<detail::join_state>("gather");
    (state->watch(handles.unit()), ...);
    return gather_awaitable(std::move(state));
}

/// Wait for a homogeneous set of spawned units
template<typename T>
[[nodiscard]] gather_awaitable gather(const std::vector<join_handle<T>>& handles) {
    auto state = std::make_shared<detail::join_state>("gather");
    for (const auto& handle : handles) {
        state->watch(handle.unit());
    }
    return gather_awaitable(std::move(state));
}

} // namespace tangle::runtime
