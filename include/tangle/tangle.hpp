#pragma once

/// Tangle - logical call graphs for coroutine programs
///
/// Version: 0.1.0
///
/// This header provides convenient access to all Tangle components.

// Version information
#define TANGLE_VERSION_MAJOR 0
#define TANGLE_VERSION_MINOR 1
#define TANGLE_VERSION_PATCH 0

// Execution frames and coroutines
#include "coro/execution_frame.hpp"
#include "coro/promise_base.hpp"
#include "coro/task.hpp"
#include "coro/frame.hpp"

// Causal graph
#include "graph/awaitable.hpp"
#include "graph/async_graph.hpp"
#include "graph/builder.hpp"
#include "graph/dot.hpp"

// Runtime
#include "runtime/event_loop.hpp"
#include "runtime/join_handle.hpp"
#include "runtime/future.hpp"
#include "runtime/gather.hpp"
#include "runtime/task_group.hpp"
#include "runtime/async_main.hpp"

// Synchronization primitives
#include "sync/primitives.hpp"

// Logging
#include "log/logger.hpp"
#include "log/macros.hpp"

// Debug entry points
#include "debug.hpp"

#include <tuple>

/// Root namespace for the Tangle library
namespace tangle {

/// Get library version string
inline const char* version() noexcept {
    return "0.1.0";
}

/// Get library version as tuple
inline constexpr auto version_tuple() noexcept {
    return std::make_tuple(TANGLE_VERSION_MAJOR, TANGLE_VERSION_MINOR, TANGLE_VERSION_PATCH);
}

} // namespace tangle

/// Quick Start Example:
///
/// ```cpp
/// #include <tangle/tangle.hpp>
///
/// using namespace tangle;
///
/// void report() {
///     TANGLE_FRAME();
///     debug::print_async_graph();
/// }
///
/// coro::task<void> worker(runtime::future<void> go) {
///     co_await coro::trace_location();
///     co_await go;
///     report();
/// }
///
/// coro::task<void> async_main() {
///     co_await coro::trace_location();
///     runtime::future<void> go;
///     auto w = runtime::spawn(worker(go));
///     go.set_result();
///     co_await w;
/// }
///
/// TANGLE_ASYNC_MAIN_VOID_NOARGS(async_main)
/// ```
