#pragma once

/// Tangle Debug Support
///
/// Entry points for capturing the logical call graph of the calling point:
/// - get_async_graph(): snapshot from the innermost execution frame, using
///   the running event loop (if any) as the current-unit hook
/// - print_async_graph(): render that snapshot as Graphviz dot
///
/// Usage:
///   void report() {
///       TANGLE_FRAME();
///       tangle::debug::print_async_graph();
///   }
///
///   ./program 2>&1 >/dev/null | dot -Tsvg -o graph.svg

#include "coro/execution_frame.hpp"
#include "graph/builder.hpp"
#include "graph/dot.hpp"
#include "runtime/event_loop.hpp"
#include <fmt/format.h>
#include <cstdio>
#include <memory>

namespace tangle::debug {

/// Hook exposing the unit running on this thread's loop
inline graph::current_unit_hook running_loop_hook() {
    return []() -> std::shared_ptr<graph::schedulable_unit> {
        return runtime::current_unit();
    };
}

/// Snapshot the logical call graph of the calling point
///
/// The calling point is the innermost registered frame: the caller's
/// TANGLE_FRAME() or, when called straight from a coroutine body, that
/// coroutine.
///
/// @throws std::invalid_argument if no frame is registered on this thread
[[nodiscard]] inline graph::async_graph get_async_graph() {
    return graph::get_async_graph(coro::execution_frame::current(), running_loop_hook());
}

/// Write the graph of the calling point to `out` as dot
inline void print_async_graph(std::FILE* out = stderr) {
    graph::write_dot(out, get_async_graph());
}

/// Walk the current thread's logical stack, innermost first
template<typename Func>
void walk_current_stack(Func&& func) {
    for (auto* frame = coro::execution_frame::current(); frame; frame = frame->caller()) {
        func(*frame);
    }
}

} // namespace tangle::debug
