#include <catch2/catch.hpp>
#include <tangle/graph/builder.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "../test_main.cpp"

using namespace tangle;
using namespace tangle::graph;
using tangle::test::frame_chain;
using tangle::test::stub_awaitable;
using tangle::test::stub_unit;

namespace {

enum : size_t { main_frame, run_frame, step_frame, root_frame, inner_frame, report_frame };

// main() -> loop_run() -> loop_step() -> root_coro() -> inner_coro() -> report()
// The two coroutine frames form the local stack of the current unit.
struct loop_stack {
    frame_chain chain;

    loop_stack() {
        chain.push("main()")
             .push("loop_run()")
             .push("loop_step()")
             .push("root_coro()")
             .push("inner_coro()")
             .push("report()");
    }

    coro::execution_frame& operator[](size_t i) { return chain[i]; }

    std::shared_ptr<stub_unit> make_unit(std::string name) {
        return std::make_shared<stub_unit>(std::move(name),
            std::vector<const coro::execution_frame*>{&chain[inner_frame], &chain[root_frame]},
            &chain[root_frame]);
    }
};

current_unit_hook hook_for(std::shared_ptr<schedulable_unit> unit) {
    return [unit]() { return unit; };
}

std::vector<std::string> expected(std::initializer_list<const char*> labels) {
    std::vector<std::string> result;
    for (const char* label : labels) result.emplace_back(label);
    return result;
}

} // namespace

TEST_CASE("get_async_graph rejects a null caller", "[graph][builder]") {
    REQUIRE_THROWS_AS(get_async_graph(nullptr), std::invalid_argument);
}

TEST_CASE("without a current unit the frame chain is walked", "[graph][builder]") {
    loop_stack stack;

    SECTION("no hook") {
        auto g = get_async_graph(&stack[report_frame]);

        REQUIRE(g.size() == 6);
        REQUIRE(g.edge_count() == 5);
        REQUIRE(test::path_labels(g) == expected({
            "report() (chain.cpp:1)",
            "inner_coro() (chain.cpp:1)",
            "root_coro() (chain.cpp:1)",
            "loop_step() (chain.cpp:1)",
            "loop_run() (chain.cpp:1)",
            "main() (chain.cpp:1)"}));
    }

    SECTION("hook reporting no unit") {
        auto g = get_async_graph(&stack[inner_frame],
            []() -> std::shared_ptr<schedulable_unit> { return nullptr; });

        REQUIRE(g.size() == 5);
        REQUIRE(g.label(g.head()) == "inner_coro() (chain.cpp:1)");
    }

    SECTION("a single frame") {
        coro::execution_frame lone;
        lone.set_location("lone.cpp", "lone()", 9);
        auto g = get_async_graph(&lone);

        REQUIRE(g.size() == 1);
        REQUIRE(g.edge_count() == 0);
        REQUIRE(g.label(g.head()) == "lone() (lone.cpp:9)");
    }
}

TEST_CASE("current unit is spliced between its frames and the loop", "[graph][builder]") {
    loop_stack stack;
    auto unit = stack.make_unit("unit-A");

    auto g = get_async_graph(&stack[report_frame], hook_for(unit));

    REQUIRE(test::path_labels(g) == expected({
        "report() (chain.cpp:1)",
        "inner_coro() (chain.cpp:1)",
        "root_coro() (chain.cpp:1)",
        "unit-A",
        "loop_step() (chain.cpp:1)",
        "loop_run() (chain.cpp:1)",
        "main() (chain.cpp:1)"}));
    REQUIRE(g.size() == 7);
    REQUIRE(g.edge_count() == 6);
    REQUIRE(unit->expansions == 1);
    REQUIRE(test::count_nodes(g, "error") == 0);
}

TEST_CASE("caller at the unit's innermost frame adds no top chain", "[graph][builder]") {
    loop_stack stack;
    auto unit = stack.make_unit("unit-A");

    auto g = get_async_graph(&stack[inner_frame], hook_for(unit));

    node_id head = g.head();
    REQUIRE(g.label(head) == "inner_coro() (chain.cpp:1)");
    REQUIRE(g.kind(head) == node_kind::frame);
    // No self loop on the head
    for (node_id next : g.awaited_by(head)) {
        REQUIRE(next != head);
    }
    REQUIRE(test::count_nodes(g, "inner_coro()") == 1);
    REQUIRE_FALSE(test::find_node(g, "report()").has_value());
    REQUIRE(test::path_labels(g).size() == 6);
}

TEST_CASE("awaiters converging on one awaitable expand it once", "[graph][builder]") {
    loop_stack stack;
    auto unit = stack.make_unit("unit-A");
    auto waiter1 = std::make_shared<stub_unit>("awaiter-1");
    auto waiter2 = std::make_shared<stub_unit>("awaiter-2");
    auto join = std::make_shared<stub_awaitable>("gather");
    auto parent = std::make_shared<stub_unit>("main-unit");

    unit->add_awaiter(waiter1);
    unit->add_awaiter(waiter2);
    waiter1->add_awaiter(join);
    waiter2->add_awaiter(join);
    join->add_awaiter(parent);

    auto g = get_async_graph(&stack[report_frame], hook_for(unit));

    REQUIRE(join->expansions == 1);
    REQUIRE(parent->expansions == 1);
    REQUIRE(test::count_nodes(g, "gather") == 1);

    auto join_node = *test::find_node(g, "gather");
    auto preds = test::predecessors(g, join_node);
    REQUIRE(preds.size() == 2);

    auto unit_node = *test::find_node(g, "unit-A");
    REQUIRE(g.awaited_by(unit_node).size() == 2);

    // Only the outermost awaiter continues into the loop's frames
    auto parent_node = *test::find_node(g, "main-unit");
    REQUIRE(g.awaited_by(parent_node).size() == 1);
    REQUIRE(g.label(g.awaited_by(parent_node).front()) == "loop_step() (chain.cpp:1)");
    REQUIRE(g.awaited_by(*test::find_node(g, "awaiter-1")) == std::vector<node_id>{join_node});

    auto ends = test::sinks(g);
    REQUIRE(ends.size() == 1);
    REQUIRE(g.label(ends.front()) == "main() (chain.cpp:1)");
}

TEST_CASE("every terminal awaiter continues into the loop's frames", "[graph][builder]") {
    loop_stack stack;
    auto unit = stack.make_unit("unit-A");
    auto waiter1 = std::make_shared<stub_unit>("awaiter-1");
    auto waiter2 = std::make_shared<stub_unit>("awaiter-2");
    unit->add_awaiter(waiter1);
    unit->add_awaiter(waiter2);

    auto g = get_async_graph(&stack[report_frame], hook_for(unit));

    auto step_node = *test::find_node(g, "loop_step()");
    REQUIRE(test::count_nodes(g, "loop_step()") == 1);
    auto preds = test::predecessors(g, step_node);
    REQUIRE(preds.size() == 2);
    REQUIRE(test::sinks(g).size() == 1);
}

TEST_CASE("awaiters cycling back to the current unit have no terminal", "[graph][builder]") {
    loop_stack stack;
    auto unit = stack.make_unit("unit-A");
    auto other = std::make_shared<stub_unit>("unit-B");
    unit->add_awaiter(other);
    other->add_awaiter(unit);

    REQUIRE_THROWS_AS(get_async_graph(&stack[report_frame], hook_for(unit)), std::logic_error);
    REQUIRE(unit->expansions == 1);
    REQUIRE(other->expansions == 1);
}

TEST_CASE("shared dependencies terminate", "[graph][builder]") {
    loop_stack stack;
    auto unit = stack.make_unit("unit-A");
    auto b = std::make_shared<stub_awaitable>("B");
    auto c = std::make_shared<stub_awaitable>("C");
    auto d = std::make_shared<stub_awaitable>("D");
    auto e = std::make_shared<stub_unit>("E");

    // A -> {B, C}, B -> {C, D}, C -> {D}, D -> {E}
    unit->add_awaiter(b);
    unit->add_awaiter(c);
    b->add_awaiter(c);
    b->add_awaiter(d);
    c->add_awaiter(d);
    d->add_awaiter(e);

    auto g = get_async_graph(&stack[report_frame], hook_for(unit));

    REQUIRE(b->expansions == 1);
    REQUIRE(c->expansions == 1);
    REQUIRE(d->expansions == 1);
    REQUIRE(e->expansions == 1);
    REQUIRE(test::predecessors(g, *test::find_node(g, "D")).size() == 2);
    REQUIRE(test::predecessors(g, *test::find_node(g, "C")).size() == 2);
    REQUIRE(test::sinks(g).size() == 1);
}

TEST_CASE("destroyed awaiters are not expanded", "[graph][builder]") {
    loop_stack stack;
    auto unit = stack.make_unit("unit-A");
    {
        auto gone = std::make_shared<stub_unit>("gone");
        unit->add_awaiter(gone);
    }

    auto g = get_async_graph(&stack[report_frame], hook_for(unit));

    REQUIRE_FALSE(test::find_node(g, "gone").has_value());
    auto unit_node = *test::find_node(g, "unit-A");
    REQUIRE(g.label(g.awaited_by(unit_node).front()) == "loop_step() (chain.cpp:1)");
}

TEST_CASE("caller chain missing the unit's frames", "[graph][builder]") {
    loop_stack stack;
    auto unit = stack.make_unit("unit-A");

    coro::execution_frame stray;
    stray.set_location("stray.cpp", "stray()", 5);

    auto g = get_async_graph(&stray, hook_for(unit));

    node_id head = g.head();
    REQUIRE(g.label(head) == "stray() (stray.cpp:5)");

    auto exit_error = test::find_node(g, std::string(exit_frame_not_found));
    REQUIRE(exit_error.has_value());
    REQUIRE(g.kind(*exit_error) == node_kind::error);
    REQUIRE(g.awaited_by(head) == std::vector<node_id>{*exit_error});
    REQUIRE(g.label(g.awaited_by(*exit_error).front()) == "inner_coro() (chain.cpp:1)");

    // The walk ran out of frames, so the entry could not be found either
    auto entry_error = test::find_node(g, std::string(entry_point_not_found));
    REQUIRE(entry_error.has_value());
    REQUIRE(test::predecessors(g, *entry_error) ==
            std::vector<node_id>{*test::find_node(g, "unit-A")});
}

TEST_CASE("unlinkable entry becomes the unique sink", "[graph][builder]") {
    loop_stack stack;
    auto unit = stack.make_unit("unit-A");
    auto waiter1 = std::make_shared<stub_unit>("awaiter-1");
    auto waiter2 = std::make_shared<stub_unit>("awaiter-2");
    unit->add_awaiter(waiter1);
    unit->add_awaiter(waiter2);
    coro::execution_frame elsewhere;

    SECTION("unit reports no entry frame") {
        unit->set_entry(nullptr);
    }

    SECTION("entry frame is not on the caller's chain") {
        unit->set_entry(&elsewhere);
    }

    auto g = get_async_graph(&stack[report_frame], hook_for(unit));

    REQUIRE(test::count_nodes(g, std::string(entry_point_not_found)) == 1);
    auto error = *test::find_node(g, std::string(entry_point_not_found));

    auto ends = test::sinks(g);
    REQUIRE(ends == std::vector<node_id>{error});
    REQUIRE(test::predecessors(g, error).size() == 2);
    REQUIRE_FALSE(test::find_node(g, "loop_step()").has_value());
    for (node_id id = 0; id < g.size(); ++id) {
        REQUIRE(test::reaches(g, id, error));
    }
}

TEST_CASE("entry frame with nothing below it", "[graph][builder]") {
    frame_chain chain;
    chain.push("root_coro()").push("inner_coro()").push("report()");
    auto unit = std::make_shared<stub_unit>("unit-A",
        std::vector<const coro::execution_frame*>{&chain[1], &chain[0]}, &chain[0]);

    auto g = get_async_graph(&chain[2], hook_for(unit));

    REQUIRE(test::count_nodes(g, "Could not") == 0);
    auto ends = test::sinks(g);
    REQUIRE(ends.size() == 1);
    REQUIRE(g.label(ends.front()) == "unit-A");
}

TEST_CASE("unit without a local stack is its own head", "[graph][builder]") {
    loop_stack stack;
    auto bare = std::make_shared<stub_unit>("bare", std::vector<const coro::execution_frame*>{},
                                            &stack[step_frame]);

    auto g = get_async_graph(&stack[report_frame], hook_for(bare));

    REQUIRE(g.kind(g.head()) == node_kind::awaitable);
    REQUIRE(test::path_labels(g) == expected({
        "bare",
        "loop_run() (chain.cpp:1)",
        "main() (chain.cpp:1)"}));
}
