#pragma once

#include "unit.hpp"
#include <tangle/coro/task.hpp>
#include <tangle/graph/awaitable.hpp>
#include <tangle/log/macros.hpp>
#include <coroutine>
#include <deque>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace tangle::runtime {

/// Single-threaded cooperative scheduler
///
/// Runs schedulable units one step at a time from a FIFO ready queue. A unit
/// runs until it awaits something that is not ready, then the loop moves on.
/// Awaitables put units back on the queue through call_soon() when they
/// complete. The loop owns every unit until it finishes; everything else
/// refers to units weakly or through join handles.
class event_loop {
public:
    event_loop() = default;

    ~event_loop() {
        self_.reset();
        if (current_loop_ == this) {
            current_loop_ = nullptr;
        }
        ready_.clear();
        if (!units_.empty()) {
            TANGLE_LOG_DEBUG("event loop destroyed with {} pending units", units_.size());
        }
        units_.clear();
    }

    event_loop(const event_loop&) = delete;
    event_loop& operator=(const event_loop&) = delete;
    event_loop(event_loop&&) = delete;
    event_loop& operator=(event_loop&&) = delete;

    /// Loop running on this thread, if any
    [[nodiscard]] static event_loop* current() noexcept {
        return current_loop_;
    }

    /// Weak handle to this loop; expires when the loop is destroyed
    [[nodiscard]] std::weak_ptr<event_loop*> handle() const noexcept {
        return self_;
    }

    /// Unit being stepped right now, if any
    [[nodiscard]] std::shared_ptr<detail::unit_base> current_unit() const noexcept {
        return current_unit_;
    }

    /// Wrap `t` in a new unit and queue its first step
    template<typename T>
    std::shared_ptr<detail::unit_state<T>> spawn(coro::task<T> t, std::string name = {}) {
        if (!t.handle()) {
            throw std::invalid_argument("event_loop::spawn: empty task");
        }
        auto unit = std::make_shared<detail::unit_state<T>>(std::move(t), std::move(name));
        units_.emplace(unit.get(), unit);
        TANGLE_LOG_DEBUG("spawned {}", unit->name());
        call_soon(unit);
        return unit;
    }

    /// Queue a step of `unit`
    void call_soon(std::shared_ptr<detail::unit_base> unit) {
        if (!unit || unit->done()) return;
        ready_.push_back(std::move(unit));
    }

    /// Step ready units until the queue is empty
    void run() {
        TANGLE_FRAME();
        current_guard guard(this);
        while (!ready_.empty()) {
            auto unit = std::move(ready_.front());
            ready_.pop_front();
            if (unit->done()) continue;
            step(unit);
        }
    }

    /// Run `t` as a unit and return its result
    ///
    /// @throws std::runtime_error if the queue drains while `t` is still
    ///         pending (every remaining unit is waiting on something)
    template<typename T>
    T run_until_complete(coro::task<T> t) {
        TANGLE_FRAME();
        current_guard guard(this);
        auto unit = spawn(std::move(t));
        run();
        if (!unit->done()) {
            TANGLE_LOG_WARNING("event loop drained with {} still pending ({} units blocked)",
                               unit->name(), units_.size());
            throw std::runtime_error("event loop stopped before the task completed");
        }
        return unit->take_result();
    }

    [[nodiscard]] size_t pending_units() const noexcept { return units_.size(); }
    [[nodiscard]] size_t steps_executed() const noexcept { return steps_; }

private:
    /// Makes a loop current for a scope, restoring the previous one
    class current_guard {
    public:
        explicit current_guard(event_loop* loop) noexcept
            : previous_(std::exchange(current_loop_, loop)) {}
        ~current_guard() { current_loop_ = previous_; }
        current_guard(const current_guard&) = delete;
        current_guard& operator=(const current_guard&) = delete;
    private:
        event_loop* previous_;
    };

    void step(const std::shared_ptr<detail::unit_base>& unit) {
        TANGLE_FRAME();
        auto previous = std::exchange(current_unit_, unit);
        unit->resume();
        current_unit_ = std::move(previous);
        ++steps_;
        if (unit->done()) {
            units_.erase(unit.get());
        }
    }

    std::shared_ptr<event_loop*> self_ = std::make_shared<event_loop*>(this);
    std::deque<std::shared_ptr<detail::unit_base>> ready_;
    std::unordered_map<const detail::unit_base*, std::shared_ptr<detail::unit_base>> units_;
    std::shared_ptr<detail::unit_base> current_unit_;
    size_t steps_ = 0;

    static inline thread_local event_loop* current_loop_ = nullptr;
};

/// Unit running on the current loop, or null
[[nodiscard]] inline std::shared_ptr<detail::unit_base> current_unit() noexcept {
    auto* loop = event_loop::current();
    return loop ? loop->current_unit() : nullptr;
}

namespace detail {

/// Suspend the running unit on `target` until it completes
///
/// Registers the unit as an awaiter of `target` (graph linkage) and hands
/// `on_done` a callback that queues the unit again (scheduling). The callback
/// does nothing once either the unit or its loop is gone.
///
/// @throws std::logic_error outside of a running unit
template<typename OnDone>
void park_current_unit(graph::awaitable& target, std::coroutine_handle<> leaf, OnDone&& on_done) {
    auto* loop = event_loop::current();
    auto unit = loop ? loop->current_unit() : nullptr;
    if (!unit) {
        throw std::logic_error("awaiting " + target.describe() + " outside of a running task");
    }
    if (unit.get() == &target) {
        throw std::logic_error(unit->name() + " awaits itself");
    }
    unit->suspend(leaf);
    target.add_awaiter(unit);
    on_done([weak_loop = loop->handle(), weak = std::weak_ptr<unit_base>(unit)] {
        auto owner = weak_loop.lock();
        auto waiter = weak.lock();
        if (owner && waiter) {
            (*owner)->call_soon(std::move(waiter));
        }
    });
}

inline void park_current_unit(graph::awaitable& target, done_callbacks& callbacks,
                              std::coroutine_handle<> leaf) {
    park_current_unit(target, leaf, [&callbacks](std::function<void()> wake) {
        callbacks.add(std::move(wake));
    });
}

} // namespace detail

/// Awaitable that reschedules the current unit behind the ready queue
class yield_awaiter {
public:
    [[nodiscard]] bool await_ready() const noexcept { return false; }

    void await_suspend(std::coroutine_handle<> leaf) const {
        auto* loop = event_loop::current();
        auto unit = loop ? loop->current_unit() : nullptr;
        if (!unit) {
            throw std::logic_error("yield() outside of a running task");
        }
        unit->suspend(leaf);
        loop->call_soon(std::move(unit));
    }

    void await_resume() const noexcept {}
};

/// Let the other ready units run: co_await runtime::yield();
[[nodiscard]] inline yield_awaiter yield() noexcept {
    return {};
}

} // namespace tangle::runtime
