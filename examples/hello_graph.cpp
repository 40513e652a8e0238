#include <tangle/debug.hpp>
#include <tangle/coro/execution_frame.hpp>
#include <tangle/log/macros.hpp>
#include <iostream>

using namespace tangle;

// Without an event loop the graph is the plain call stack: three frames
// from print_graph() down to main().

void print_graph() {
    TANGLE_FRAME();
    std::cout << graph::async_graph_to_dot(debug::get_async_graph());
}

void middle() {
    TANGLE_FRAME();
    print_graph();
}

int main() {
    TANGLE_FRAME();
    log::logger::instance().set_level(log::level::debug);

    TANGLE_LOG_INFO("Capturing a graph outside of any event loop");
    middle();
    return 0;
}
