#include <tangle/tangle.hpp>
#include <iostream>

using namespace tangle;

// A task group child and its parent hand control back and forth through two
// futures. When the child prints, the parent is suspended inside
// other_coro() on the second future, and also joins the group later.

void print_graph() {
    TANGLE_FRAME();
    std::cout << graph::async_graph_to_dot(debug::get_async_graph());
}

coro::task<void> coro_print_graph(runtime::future<void> f1, runtime::future<void> f2) {
    co_await coro::trace_location();
    co_await f1;
    print_graph();
    f2.set_result();
}

coro::task<void> other_coro(runtime::future<void> f1, runtime::future<void> f2) {
    co_await coro::trace_location();
    f1.set_result();
    co_await f2;
}

coro::task<void> use_task_group() {
    co_await coro::trace_location();
    runtime::future<void> f1;
    runtime::future<void> f2;
    runtime::task_group group;
    group.spawn(coro_print_graph(f1, f2));
    co_await other_coro(f1, f2);
    co_await group.join();
}

coro::task<void> async_main() {
    co_await coro::trace_location();
    co_await use_task_group();
}

TANGLE_ASYNC_MAIN_VOID_NOARGS(async_main)
