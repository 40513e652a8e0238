#pragma once

#include "event_loop.hpp"
#include <tangle/graph/async_graph.hpp>
#include <fmt/format.h>
#include <atomic>
#include <coroutine>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace tangle::runtime {

namespace detail {

inline uint64_t next_future_id() noexcept {
    static std::atomic<uint64_t> counter{1};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

/// Shared state of a future<T>; the awaitable identity seen by graphs
template<typename T>
class future_state final : public graph::awaitable {
public:
    future_state() : id_(next_future_id()) {}

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
        return fmt::format("future #{} [{}]", id_,
                           !done_ ? "pending" : exception_ ? "failed" : "done");
    }

    [[nodiscard]] bool done() const noexcept { return done_; }

    template<typename... Args>
    void set_value(Args&&... args) {
        check_not_done();
        if constexpr (!std::is_void_v<T>) {
            value_.emplace(std::forward<Args>(args)...);
        }
        complete();
    }

    void set_exception(std::exception_ptr ex) {
        check_not_done();
        exception_ = std::move(ex);
        complete();
    }

    void wait(std::coroutine_handle<> leaf) {
        park_current_unit(*this, callbacks_, leaf);
    }

    T get() const {
        if (!done_) {
            throw std::logic_error(describe() + " has no result yet");
        }
        if (exception_) {
            std::rethrow_exception(exception_);
        }
        if constexpr (!std::is_void_v<T>) {
            return *value_;
        }
    }

private:
    struct empty {};
    using storage = std::conditional_t<std::is_void_v<T>, empty, T>;

    void check_not_done() const {
        if (done_) {
            throw std::logic_error(describe() + " already has a result");
        }
    }

    void complete() {
        done_ = true;
        callbacks_.fire();
    }

    uint64_t id_;
    graph::awaiter_set awaiters_;
    done_callbacks callbacks_;
    std::optional<storage> value_;
    std::exception_ptr exception_;
    bool done_ = false;
};

} // namespace detail

/// Deferred result, completed by whoever holds a copy
///
/// Copies share one state. Any number of units may co_await the same future;
/// each is registered as an awaiter of it.
template<typename T = void>
class future {
public:
    future() : state_(std::make_shared<detail::future_state<T>>()) {}

    template<typename U = T>
    requires (!std::is_void_v<U>)
    void set_result(U value) {
        state_->set_value(std::move(value));
    }

    template<typename U = T>
    requires std::is_void_v<U>
    void set_result() {
        state_->set_value();
    }

    void set_exception(std::exception_ptr ex) {
        state_->set_exception(std::move(ex));
    }

    [[nodiscard]] bool done() const noexcept { return state_->done(); }

    /// Result of a completed future; rethrows its exception
    T get() const { return state_->get(); }

    [[nodiscard]] std::shared_ptr<graph::awaitable> as_awaitable() const noexcept {
        return state_;
    }

    [[nodiscard]] bool await_ready() const noexcept { return state_->done(); }

    void await_suspend(std::coroutine_handle<> leaf) {
        state_->wait(leaf);
    }

    T await_resume() const { return state_->get(); }

private:
    std::shared_ptr<detail::future_state<T>> state_;
};

} // namespace tangle::runtime
