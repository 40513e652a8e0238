#include <tangle/tangle.hpp>
#include <iostream>
#include <vector>

using namespace tangle;

// One unit prints the graph while two others wait on it and a gather waits
// on those two. The printed graph forks after the printing unit and joins
// again at the gather.

void print_graph() {
    TANGLE_FRAME();
    std::cout << graph::async_graph_to_dot(debug::get_async_graph());
}

coro::task<void> coro_print_graph(runtime::future<void> release) {
    co_await coro::trace_location();
    co_await release;
    print_graph();
}

coro::task<void> coro_await(runtime::future<void> first, runtime::join_handle<void> second) {
    co_await coro::trace_location();
    co_await first;
    co_await second;
}

coro::task<void> release_futures(std::vector<runtime::future<void>> futures) {
    co_await coro::trace_location();
    for (auto& f : futures) {
        f.set_result();
        co_await runtime::yield();
    }
}

coro::task<void> async_main() {
    co_await coro::trace_location();

    runtime::future<void> release_print;
    auto printer = runtime::spawn(coro_print_graph(release_print), "printer");

    runtime::future<void> release_awaits;
    auto t1 = runtime::spawn(coro_await(release_awaits, printer), "awaiter-1");
    auto t2 = runtime::spawn(coro_await(release_awaits, printer), "awaiter-2");
    auto releaser = runtime::spawn(release_futures({release_awaits, release_print}), "releaser");

    co_await runtime::gather(t1, t2, releaser);
}

TANGLE_ASYNC_MAIN_VOID_NOARGS(async_main)
