#pragma once

#include "execution_frame.hpp"
#include <exception>
#include <atomic>
#include <cstdint>

namespace tangle::coro {

/// Coroutine state for debugging
enum class coroutine_state : uint8_t {
    created = 0,    // Just created, not started
    running = 1,    // Started and not finished
    completed = 2,  // Finished execution
    failed = 3      // Threw an exception
};

/// Thread-local ID allocator for coroutine debug IDs
/// Allocates IDs in batches to avoid global atomic contention
class id_allocator {
public:
    static constexpr uint64_t BATCH_SIZE = 1024;

    static uint64_t allocate() noexcept {
        auto& alloc = instance();
        if (alloc.next_id_ >= alloc.end_id_) {
            uint64_t batch_start = global_counter_.fetch_add(BATCH_SIZE, std::memory_order_relaxed);
            alloc.next_id_ = batch_start;
            alloc.end_id_ = batch_start + BATCH_SIZE;
        }
        return alloc.next_id_++;
    }

private:
    id_allocator() noexcept : next_id_(0), end_id_(0) {}

    static id_allocator& instance() noexcept {
        static thread_local id_allocator alloc;
        return alloc;
    }

    uint64_t next_id_;
    uint64_t end_id_;

    static inline std::atomic<uint64_t> global_counter_{1};
};

/// Base class for all coroutine promise types
///
/// Owns the coroutine's execution_frame. The frame is not linked into the
/// thread's chain at creation; enter() links it under whoever starts the
/// coroutine and leave() hands the chain back when it finishes.
class promise_base {
public:
    promise_base() noexcept {
        frame_.set_id(id_allocator::allocate());
    }

    ~promise_base() noexcept = default;

    promise_base(const promise_base&) = delete;
    promise_base& operator=(const promise_base&) = delete;
    promise_base(promise_base&&) = delete;
    promise_base& operator=(promise_base&&) = delete;

    void unhandled_exception() noexcept {
        exception_ = std::current_exception();
        state_ = coroutine_state::failed;
    }

    [[nodiscard]] std::exception_ptr exception() const noexcept {
        return exception_;
    }

    [[nodiscard]] execution_frame& frame() noexcept { return frame_; }
    [[nodiscard]] const execution_frame& frame() const noexcept { return frame_; }

    [[nodiscard]] uint64_t id() const noexcept { return frame_.id(); }
    [[nodiscard]] coroutine_state state() const noexcept { return state_; }

    void set_location(const char* file, const char* func, uint32_t line) noexcept {
        frame_.set_location(file, func, line);
    }

    /// Link the frame under `caller`, inherit its owning unit and make it current
    void enter(execution_frame* caller) noexcept {
        frame_.set_caller(caller);
        if (caller && caller->owner()) {
            frame_.set_owner(caller->owner());
        }
        state_ = coroutine_state::running;
        execution_frame::set_current(&frame_);
    }

    /// Make the caller's frame current again
    void leave() noexcept {
        if (state_ == coroutine_state::running) {
            state_ = coroutine_state::completed;
        }
        execution_frame::set_current(frame_.caller());
    }

private:
    execution_frame frame_;
    std::exception_ptr exception_;
    coroutine_state state_ = coroutine_state::created;
};

} // namespace tangle::coro
