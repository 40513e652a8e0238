#pragma once

#include "gather.hpp"
#include "join_handle.hpp"
#include <tangle/coro/task.hpp>
#include <memory>
#include <string>
#include <utility>

namespace tangle::runtime {

/// Scope for spawning child units and waiting for all of them
///
/// @code
/// runtime::task_group group;
/// group.spawn(fetch(a));
/// group.spawn(fetch(b));
/// co_await group.join();
/// @endcode
///
/// Children left running when the group is destroyed keep running.
class task_group {
public:
    task_group() : state_(std::make_shared<detail::join_state>("task_group")) {}

    task_group(const task_group&) = delete;
    task_group& operator=(const task_group&) = delete;

    template<typename T>
    join_handle<T> spawn(coro::task<T> t, std::string name = {}) {
        auto handle = runtime::spawn(std::move(t), std::move(name));
        state_->watch(handle.unit());
        return handle;
    }

    /// Wait until every child spawned so far has finished
    [[nodiscard]] gather_awaitable join() const noexcept {
        return gather_awaitable(state_);
    }

    [[nodiscard]] size_t size() const noexcept { return state_->size(); }
    [[nodiscard]] bool done() const noexcept { return state_->done(); }

private:
    std::shared_ptr<detail::join_state> state_;
};

} // namespace tangle::runtime
