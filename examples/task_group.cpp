#include <tangle/tangle.hpp>
#include <iostream>

using namespace tangle;

// The graph is taken inside a task group child: the child is awaited by
// the group's join, which the parent unit waits on.

void print_graph() {
    TANGLE_FRAME();
    std::cout << graph::async_graph_to_dot(debug::get_async_graph());
}

coro::task<void> coro_print_graph() {
    co_await coro::trace_location();
    print_graph();
    co_return;
}

coro::task<void> use_task_group() {
    co_await coro::trace_location();
    runtime::task_group group;
    group.spawn(coro_print_graph());
    co_await group.join();
}

coro::task<void> async_main() {
    co_await coro::trace_location();
    co_await use_task_group();
}

TANGLE_ASYNC_MAIN_VOID_NOARGS(async_main)
