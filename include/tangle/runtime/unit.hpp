#pragma once

#include <tangle/coro/task.hpp>
#include <tangle/graph/async_graph.hpp>
#include <tangle/log/macros.hpp>
#include <fmt/format.h>
#include <atomic>
#include <coroutine>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tangle::runtime::detail {

/// Callbacks run once when an awaitable completes
class done_callbacks {
public:
    void add(std::function<void()> callback) {
        callbacks_.push_back(std::move(callback));
    }

    /// Run and drop every registered callback. Callbacks added while firing
    /// wait for the next fire().
    void fire() {
        auto callbacks = std::move(callbacks_);
        callbacks_.clear();
        for (auto& callback : callbacks) {
            callback();
        }
    }

    [[nodiscard]] size_t size() const noexcept { return callbacks_.size(); }
    [[nodiscard]] bool empty() const noexcept { return callbacks_.empty(); }

private:
    std::vector<std::function<void()>> callbacks_;
};

/// Expand an awaitable that has no stack of its own into a single node
inline graph::node_pair single_node(graph::async_graph& graph, graph::awaitable& self) {
    graph::node_id node = graph.add_awaitable(self.shared_from_this());
    return {node, node};
}

/// Type-erased schedulable unit: a root coroutine driven by the event loop
///
/// The unit owns the root coroutine. Its local stack is the chain of
/// coroutine frames from the innermost one awaiting something out to the
/// root; every frame in it is owned by the unit.
class unit_base : public graph::schedulable_unit {
public:
    unit_base(std::coroutine_handle<> root, coro::promise_base& root_promise, std::string name)
        : root_(root)
        , root_promise_(root_promise)
        , id_(next_id_.fetch_add(1, std::memory_order_relaxed))
        , name_(name.empty() ? fmt::format("task-{}", id_) : std::move(name)) {
        root_promise_.frame().set_owner(this);
    }

    ~unit_base() override = default;

    unit_base(const unit_base&) = delete;
    unit_base& operator=(const unit_base&) = delete;

    // Graph capability

    [[nodiscard]] const graph::awaiter_set& get_awaiters() const noexcept override {
        return awaiters_;
    }

    void add_awaiter(std::shared_ptr<graph::awaitable> awaiter) override {
        awaiters_.add(awaiter);
    }

    /// Frames of the local stack, innermost first, then the unit itself
    [[nodiscard]] graph::node_pair make_async_graph_nodes(graph::async_graph& graph) override {
        graph::node_id tail = graph.add_awaitable(shared_from_this());
        const coro::execution_frame* top = innermost_frame();
        if (!top) {
            return {tail, tail};
        }

        graph::node_id head = graph::invalid_node;
        graph::node_id prev = graph::invalid_node;
        for (auto* frame = top; frame && frame->owner() == this; frame = frame->caller()) {
            graph::node_id node = graph.add_frame(*frame);
            if (prev == graph::invalid_node) {
                head = node;
            } else {
                graph.add_edge(prev, node);
            }
            prev = node;
            if (frame == &root_promise_.frame()) break;
        }
        if (head == graph::invalid_node) {
            return {tail, tail};
        }
        graph.add_edge(prev, tail);
        return {tail, head};
    }

    [[nodiscard]] std::string describe() const override {
        return fmt::format("{} {} [{}]", name_, root_promise_.frame().describe(), status());
    }

    [[nodiscard]] const coro::execution_frame* entry_frame() const noexcept override {
        if (!started_ || done_) return nullptr;
        return &root_promise_.frame();
    }

    // Runtime side

    [[nodiscard]] uint64_t id() const noexcept { return id_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] bool started() const noexcept { return started_; }
    [[nodiscard]] bool running() const noexcept { return running_; }
    [[nodiscard]] bool done() const noexcept { return done_; }

    [[nodiscard]] const char* status() const noexcept {
        if (done_) return failed() ? "failed" : "done";
        if (running_) return "running";
        return started_ ? "pending" : "created";
    }

    [[nodiscard]] bool failed() const noexcept { return static_cast<bool>(exception_); }
    [[nodiscard]] std::exception_ptr exception() const noexcept { return exception_; }

    /// Run `callback` once the unit finishes (immediately if it already has)
    void add_done_callback(std::function<void()> callback) {
        if (done_) {
            callback();
            return;
        }
        callbacks_.add(std::move(callback));
    }

    /// Record where the running unit suspended. `leaf` is the coroutine to
    /// resume; the current frame is the innermost frame of the local stack.
    void suspend(std::coroutine_handle<> leaf) noexcept {
        resume_handle_ = leaf;
        suspended_frame_ = coro::execution_frame::current();
    }

    /// Advance the unit until it suspends or finishes
    ///
    /// The root frame is relinked under the current (loop) frame and the
    /// innermost suspended frame made current, so the thread's frame chain
    /// reads through the unit while it runs.
    void resume() {
        if (done_) return;

        coro::execution_frame* loop_frame = coro::execution_frame::current();
        std::coroutine_handle<> handle;
        if (!started_) {
            started_ = true;
            handle = root_;
            root_promise_.enter(loop_frame);
        } else {
            if (!resume_handle_) {
                TANGLE_LOG_DEBUG("{} scheduled while not suspended", name_);
                return;
            }
            handle = std::exchange(resume_handle_, nullptr);
            root_promise_.frame().set_caller(loop_frame);
            coro::execution_frame::set_current(
                suspended_frame_ ? suspended_frame_ : &root_promise_.frame());
        }
        suspended_frame_ = nullptr;

        running_ = true;
        handle.resume();
        running_ = false;
        coro::execution_frame::set_current(loop_frame);

        if (root_.done()) {
            finish();
        }
    }

protected:
    /// Move the root coroutine's result into the unit
    virtual void collect_result() = 0;

private:
    /// Innermost frame of the local stack right now, if any
    [[nodiscard]] const coro::execution_frame* innermost_frame() const noexcept {
        if (!started_ || done_) return nullptr;
        if (running_) {
            for (auto* frame = coro::execution_frame::current(); frame; frame = frame->caller()) {
                if (frame->owner() == this) return frame;
            }
            return &root_promise_.frame();
        }
        return suspended_frame_ ? suspended_frame_ : &root_promise_.frame();
    }

    void finish() {
        exception_ = root_promise_.exception();
        collect_result();
        done_ = true;
        TANGLE_LOG_DEBUG("{} finished ({}), waking {} waiters", name_, status(), callbacks_.size());
        callbacks_.fire();
    }

    std::coroutine_handle<> root_;
    coro::promise_base& root_promise_;
    uint64_t id_;
    std::string name_;

    graph::awaiter_set awaiters_;
    done_callbacks callbacks_;

    std::coroutine_handle<> resume_handle_;
    coro::execution_frame* suspended_frame_ = nullptr;
    std::exception_ptr exception_;
    bool started_ = false;
    bool running_ = false;
    bool done_ = false;

    static inline std::atomic<uint64_t> next_id_{1};
};

/// Unit running a coro::task<T>
template<typename T>
class unit_state final : public unit_base {
public:
    explicit unit_state(coro::task<T> t, std::string name = {})
        : unit_base(t.handle(), t.handle().promise(), std::move(name))
        , task_(std::move(t)) {}

    /// Copy of the result; rethrows the unit's exception
    [[nodiscard]] T result() const {
        if (exception()) {
            std::rethrow_exception(exception());
        }
        return *value_;
    }

    /// Move the result out; rethrows the unit's exception
    [[nodiscard]] T take_result() {
        if (exception()) {
            std::rethrow_exception(exception());
        }
        return std::move(*value_);
    }

protected:
    void collect_result() override {
        auto& promise = task_.handle().promise();
        if (!promise.exception() && promise.value_) {
            value_.emplace(std::move(*promise.value_));
        }
    }

private:
    coro::task<T> task_;
    std::optional<T> value_;
};

template<>
class unit_state<void> final : public unit_base {
public:
    explicit unit_state(coro::task<void> t, std::string name = {})
        : unit_base(t.handle(), t.handle().promise(), std::move(name))
        , task_(std::move(t)) {}

    void result() const {
        if (exception()) {
            std::rethrow_exception(exception());
        }
    }

    void take_result() { result(); }

protected:
    void collect_result() override {}

private:
    coro::task<void> task_;
};

} // namespace tangle::runtime::detail
