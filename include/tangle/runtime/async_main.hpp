#pragma once

#include "event_loop.hpp"
#include <tangle/coro/execution_frame.hpp>
#include <tangle/coro/task.hpp>
#include <tangle/log/logger.hpp>
#include <optional>

namespace tangle::runtime {

/// Configuration for running async tasks
struct run_config {
    /// Minimum log level for the run; unset keeps the logger's level
    /// (TANGLE_LOG_LEVEL or info)
    std::optional<log::level> log_level;
};

/// Run a coroutine task to completion and return its result
///
/// Creates an event loop, runs the given task as its first unit and steps
/// every unit until the task is done. Exceptions thrown by the task are
/// rethrown here.
///
/// Example:
/// @code
/// coro::task<int> async_main() {
///     co_return 42;
/// }
///
/// int main() {
///     return tangle::run(async_main());
/// }
/// @endcode
///
/// @throws std::runtime_error if every remaining unit is blocked before the
///         task completes
template<typename T>
T run(coro::task<T> task, const run_config& config = {}) {
    TANGLE_FRAME();
    if (config.log_level) {
        log::logger::instance().set_level(*config.log_level);
    }
    event_loop loop;
    return loop.run_until_complete(std::move(task));
}

} // namespace tangle::runtime

namespace tangle {

/// Convenience alias - run a coroutine to completion
using runtime::run;

/// Convenience alias for run configuration
using runtime::run_config;

} // namespace tangle

/// Macro to define main() that runs an async_main coroutine with argc/argv
///
/// The async_main function should have signature:
///   coro::task<int> async_main(int argc, char* argv[])
#define TANGLE_ASYNC_MAIN(async_main_func) \
    int main(int argc, char* argv[]) { \
        TANGLE_FRAME(); \
        return tangle::run(async_main_func(argc, argv)); \
    }

/// Macro for async_main without arguments, returning void (exits with 0)
///
/// The async_main function should have signature:
///   coro::task<void> async_main()
#define TANGLE_ASYNC_MAIN_VOID_NOARGS(async_main_func) \
    int main() { \
        TANGLE_FRAME(); \
        tangle::run(async_main_func()); \
        return 0; \
    }
