#pragma once

#include "event_loop.hpp"
#include <tangle/coro/task.hpp>
#include <coroutine>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace tangle::runtime {

/// Handle to a spawned unit
///
/// Copyable; every copy refers to the same unit. Any number of units may
/// co_await it, each becoming an awaiter of the unit in the causal graph.
template<typename T>
class join_handle {
public:
    explicit join_handle(std::shared_ptr<detail::unit_state<T>> unit) noexcept
        : unit_(std::move(unit)) {}

    [[nodiscard]] bool await_ready() const noexcept {
        return unit_->done();
    }

    void await_suspend(std::coroutine_handle<> leaf) {
        auto& unit = *unit_;
        detail::park_current_unit(unit, leaf, [&unit](std::function<void()> wake) {
            unit.add_done_callback(std::move(wake));
        });
    }

    T await_resume() const {
        return unit_->result();
    }

    /// Check if the spawned unit has finished
    [[nodiscard]] bool is_ready() const noexcept {
        return unit_->done();
    }

    [[nodiscard]] const std::shared_ptr<detail::unit_state<T>>& unit() const noexcept {
        return unit_;
    }

private:
    std::shared_ptr<detail::unit_state<T>> unit_;
};

/// Run `t` as a new unit on the current loop
///
/// Usage: auto h = runtime::spawn(work()); auto v = co_await h;
///
/// @throws std::logic_error if no loop is running on this thread
template<typename T>
[[nodiscard]] join_handle<T> spawn(coro::task<T> t, std::string name = {}) {
    auto* loop = event_loop::current();
    if (!loop) {
        throw std::logic_error("spawn() requires a running event loop");
    }
    return join_handle<T>(loop->spawn(std::move(t), std::move(name)));
}

} // namespace tangle::runtime
