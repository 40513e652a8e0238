#include <tangle/coro/frame.hpp>
#include <tangle/coro/task.hpp>
#include <tangle/runtime/async_main.hpp>
#include <tangle/log/macros.hpp>
#include <iostream>

using namespace tangle;

// Innermost coroutine (level 3)
coro::task<int> level3_compute() {
    co_await coro::trace_location();
    TANGLE_LOG_INFO("Level 3: Computing base value");
    std::cout << "  [Level 3] Logical stack:" << std::endl;
    for (const auto& line : coro::dump_stack()) {
        std::cout << "    " << line << std::endl;
    }
    co_return 10;
}

// Middle coroutine (level 2)
coro::task<int> level2_multiply(int multiplier) {
    co_await coro::trace_location();
    TANGLE_LOG_INFO("Level 2: Awaiting level 3");
    std::cout << "  [Level 2] Logical stack depth: " << coro::get_stack_depth() << std::endl;

    int base = co_await level3_compute();
    int result = base * multiplier;

    std::cout << "  [Level 2] Result: " << base << " * " << multiplier << " = " << result << std::endl;
    co_return result;
}

// Outer coroutine (level 1)
coro::task<void> level1_orchestrate() {
    co_await coro::trace_location();
    TANGLE_LOG_INFO("Level 1: Starting orchestration");
    std::cout << "  [Level 1] Logical stack depth: " << coro::get_stack_depth() << std::endl;

    int result1 = co_await level2_multiply(2);
    int result2 = co_await level2_multiply(3);

    std::cout << "  [Level 1] Total: " << result1 << " + " << result2
              << " = " << result1 + result2 << std::endl;
    co_return;
}

int main() {
    TANGLE_FRAME();
    std::cout << "=== Tangle Chained Coroutines Example ===" << std::endl;
    std::cout << "The logical stack follows the awaiting coroutines, then the event loop" << std::endl;

    tangle::run(level1_orchestrate(), {.log_level = log::level::debug});

    std::cout << "=== Example completed ===" << std::endl;
    return 0;
}
