#pragma once

#include <tangle/graph/async_graph.hpp>
#include <tangle/runtime/event_loop.hpp>
#include <fmt/format.h>
#include <coroutine>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace tangle::sync {

namespace detail {

/// Shared state of an event; the awaitable identity seen by graphs
class event_state final : public graph::awaitable {
public:
    [[nodiscard]] const graph::awaiter_set& get_awaiters() const noexcept override {
        return awaiters_;
    }

    void add_awaiter(std::shared_ptr<graph::awaitable> awaiter) override {
        awaiters_.add(awaiter);
    }

    [[nodiscard]] graph::node_pair make_async_graph_nodes(graph::async_graph& graph) override {
        return runtime::detail::single_node(graph, *this);
    }

    [[nodiscard]] std::string describe() const override {
        return fmt::format("event [{}]", signaled_ ? "set" : "clear");
    }

    bool signaled_ = false;
    runtime::detail::done_callbacks waiters_;

private:
    graph::awaiter_set awaiters_;
};

/// Shared state of a semaphore
class semaphore_state final : public graph::awaitable {
public:
    explicit semaphore_state(int count) noexcept : count_(count) {}

    [[nodiscard]] const graph::awaiter_set& get_awaiters() const noexcept override {
        return awaiters_;
    }

    void add_awaiter(std::shared_ptr<graph::awaitable> awaiter) override {
        awaiters_.add(awaiter);
    }

    [[nodiscard]] graph::node_pair make_async_graph_nodes(graph::async_graph& graph) override {
        return runtime::detail::single_node(graph, *this);
    }

    [[nodiscard]] std::string describe() const override {
        return fmt::format("semaphore [count={} waiting={}]", count_, waiters_.size());
    }

    int count_;
    std::deque<std::function<void()>> waiters_;

private:
    graph::awaiter_set awaiters_;
};

} // namespace detail

/// Coroutine-aware event (manual reset)
///
/// Copies share one state. Units waiting on the event are registered as its
/// awaiters.
class event {
public:
    event() : state_(std::make_shared<detail::event_state>()) {}

    /// Wait awaitable
    class wait_awaitable {
    public:
        explicit wait_awaitable(std::shared_ptr<detail::event_state> state) noexcept
            : state_(std::move(state)) {}

        bool await_ready() const noexcept {
            return state_->signaled_;
        }

        void await_suspend(std::coroutine_handle<> awaiter) {
            runtime::detail::park_current_unit(*state_, state_->waiters_, awaiter);
        }

        void await_resume() const noexcept {}

    private:
        std::shared_ptr<detail::event_state> state_;
    };

    /// Wait for the event to be signaled
    [[nodiscard]] wait_awaitable wait() const {
        return wait_awaitable(state_);
    }

    /// Signal the event (wake all waiters)
    void set() {
        state_->signaled_ = true;
        state_->waiters_.fire();
    }

    /// Reset the event
    void reset() noexcept {
        state_->signaled_ = false;
    }

    /// Check if signaled
    [[nodiscard]] bool is_set() const noexcept {
        return state_->signaled_;
    }

    [[nodiscard]] std::shared_ptr<graph::awaitable> as_awaitable() const noexcept {
        return state_;
    }

private:
    std::shared_ptr<detail::event_state> state_;
};

/// Coroutine-aware counting semaphore
///
/// Waiters are woken in FIFO order, one per released count.
class semaphore {
public:
    explicit semaphore(int initial_count = 0)
        : state_(std::make_shared<detail::semaphore_state>(initial_count)) {}

    /// Acquire awaitable
    class acquire_awaitable {
    public:
        explicit acquire_awaitable(std::shared_ptr<detail::semaphore_state> state) noexcept
            : state_(std::move(state)) {}

        bool await_ready() const noexcept {
            if (state_->count_ > 0) {
                --state_->count_;
                return true;
            }
            return false;
        }

        void await_suspend(std::coroutine_handle<> awaiter) {
            auto& waiters = state_->waiters_;
            runtime::detail::park_current_unit(*state_, awaiter,
                [&waiters](std::function<void()> wake) {
                    waiters.push_back(std::move(wake));
                });
        }

        void await_resume() const noexcept {}

    private:
        std::shared_ptr<detail::semaphore_state> state_;
    };

    /// Acquire (decrement) the semaphore
    [[nodiscard]] acquire_awaitable acquire() const {
        return acquire_awaitable(state_);
    }

    /// Try to acquire without waiting
    bool try_acquire() noexcept {
        if (state_->count_ > 0) {
            --state_->count_;
            return true;
        }
        return false;
    }

    /// Release (increment) the semaphore; a woken waiter takes the count
    void release(int count = 1) {
        while (count > 0 && !state_->waiters_.empty()) {
            auto wake = std::move(state_->waiters_.front());
            state_->waiters_.pop_front();
            wake();
            --count;
        }
        state_->count_ += count;
    }

    /// Get current count
    [[nodiscard]] int count() const noexcept {
        return state_->count_;
    }

    [[nodiscard]] std::shared_ptr<graph::awaitable> as_awaitable() const noexcept {
        return state_;
    }

private:
    std::shared_ptr<detail::semaphore_state> state_;
};

} // namespace tangle::sync
