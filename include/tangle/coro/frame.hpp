#pragma once

#include "promise_base.hpp"
#include <vector>
#include <string>
#include <coroutine>
#include <source_location>
#include <fmt/format.h>

namespace tangle::coro {

/// Get the current logical stack depth
inline size_t get_stack_depth() noexcept {
    size_t depth = 0;
    for (auto* frame = execution_frame::current(); frame; frame = frame->caller()) {
        ++depth;
    }
    return depth;
}

/// Dump the logical stack, innermost first
inline std::vector<std::string> dump_stack() {
    std::vector<std::string> frames;
    size_t index = 0;
    for (auto* frame = execution_frame::current(); frame; frame = frame->caller()) {
        frames.push_back(fmt::format("#{} {}", index++, frame->describe()));
    }
    return frames;
}

/// Record the enclosing coroutine's source location in its frame
///
/// Never suspends. Usage, first statement of a coroutine body:
///   co_await tangle::coro::trace_location();
class trace_location {
public:
    explicit trace_location(std::source_location loc = std::source_location::current()) noexcept
        : loc_(loc) {}

    [[nodiscard]] bool await_ready() const noexcept { return false; }

    template<typename Promise>
    bool await_suspend(std::coroutine_handle<Promise> h) const noexcept {
        h.promise().frame().set_location(loc_);
        return false;
    }

    void await_resume() const noexcept {}

private:
    std::source_location loc_;
};

} // namespace tangle::coro
