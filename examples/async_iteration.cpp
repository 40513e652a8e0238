#include <tangle/tangle.hpp>
#include <iostream>
#include <optional>

using namespace tangle;

// A pull-based async source: each next() spawns a unit and waits for it
// before handing out an item. The graph taken in that unit runs through
// next() and the consuming loop of the main unit.

void print_graph() {
    TANGLE_FRAME();
    std::cout << graph::async_graph_to_dot(debug::get_async_graph());
}

coro::task<void> coro_print_graph() {
    co_await coro::trace_location();
    print_graph();
    co_return;
}

class item_source {
public:
    explicit item_source(int items) : remaining_(items) {}

    coro::task<std::optional<int>> next() {
        co_await coro::trace_location();
        if (remaining_ == 0) {
            co_return std::nullopt;
        }
        auto printer = runtime::spawn(coro_print_graph(), "printer");
        co_await printer;
        co_return remaining_--;
    }

private:
    int remaining_;
};

coro::task<void> consume() {
    co_await coro::trace_location();
    item_source source(1);
    while (auto item = co_await source.next()) {
        TANGLE_LOG_INFO("consumed item {}", *item);
    }
}

coro::task<void> async_main() {
    co_await coro::trace_location();
    co_await consume();
}

TANGLE_ASYNC_MAIN_VOID_NOARGS(async_main)
