#pragma once

#include <cstdint>
#include <cstring>
#include <source_location>
#include <string>
#include <string_view>
#include <fmt/format.h>

namespace tangle::graph {
class schedulable_unit;
}

namespace tangle::coro {

namespace detail {

/// Compact a source_location function name to its qualified name
///
/// Drops the return type and the parameter list but keeps enclosing scopes:
///   "task<void> {anonymous}::fetch(int)"        -> "{anonymous}::fetch()"
///   "task<int> outer()::<lambda()>(...Frame*)"  -> "outer()::<lambda()>()"
inline std::string short_function_name(std::string_view name) {
    size_t start = 0;
    size_t cut = name.size();
    int angles = 0;
    for (size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        if (c == '<') {
            ++angles;
        } else if (c == '>') {
            if (angles > 0) --angles;
        } else if (angles > 0) {
            continue;
        } else if (c == ' ') {
            start = i + 1;
        } else if (c == '(') {
            size_t close = i;
            int parens = 0;
            for (; close < name.size(); ++close) {
                if (name[close] == '(') {
                    ++parens;
                } else if (name[close] == ')' && --parens == 0) {
                    break;
                }
            }
            if (close == name.size()) {
                cut = i;
                break;
            }
            // "operator()" and scopes such as "outer()::" are part of the name
            if (name.substr(start, i - start).ends_with("operator") ||
                name.substr(close + 1).starts_with("::")) {
                i = close;
                continue;
            }
            cut = i;
            break;
        }
    }
    return fmt::format("{}()", name.substr(start, cut - start));
}

} // namespace detail

/// Source location for debugging
struct debug_location {
    const char* file = nullptr;
    const char* function = nullptr;
    uint32_t line = 0;
};

/// One entry of the logical call stack of a thread
///
/// Frames form an intrusive list through caller(), read from the innermost
/// running function out to main(). Synchronous functions push a frame with
/// frame_scope. Coroutine promises embed one and relink it every time the
/// coroutine is started or resumed, so the chain always reflects who is
/// driving the coroutine right now rather than who created it.
///
/// The thread-local current() pointer is the head of the chain.
class execution_frame {
public:
    execution_frame() noexcept = default;

    explicit execution_frame(const std::source_location& loc) noexcept {
        set_location(loc);
    }

    execution_frame(const execution_frame&) = delete;
    execution_frame& operator=(const execution_frame&) = delete;
    execution_frame(execution_frame&&) = delete;
    execution_frame& operator=(execution_frame&&) = delete;

    [[nodiscard]] execution_frame* caller() const noexcept { return caller_; }
    void set_caller(execution_frame* caller) noexcept { caller_ = caller; }

    /// Schedulable unit whose local stack this frame belongs to, if any
    [[nodiscard]] graph::schedulable_unit* owner() const noexcept { return owner_; }
    void set_owner(graph::schedulable_unit* owner) noexcept { owner_ = owner; }

    [[nodiscard]] const debug_location& location() const noexcept { return location_; }
    [[nodiscard]] bool has_location() const noexcept { return location_.function != nullptr; }

    void set_location(const char* file, const char* func, uint32_t line) noexcept {
        location_.file = file;
        location_.function = func;
        location_.line = line;
    }

    void set_location(const std::source_location& loc) noexcept {
        set_location(loc.file_name(), loc.function_name(), loc.line());
    }

    /// Numeric tag used in the description of frames without a location
    [[nodiscard]] uint64_t id() const noexcept { return id_; }
    void set_id(uint64_t id) noexcept { id_ = id; }

    /// "function (file:line)", "coroutine #N" or "frame@0x..."
    ///
    /// Coroutine frames (those with an id) show the compact name only; the
    /// compiler's name for a coroutine body carries its frame type.
    [[nodiscard]] std::string describe() const {
        if (has_location()) {
            const char* file = location_.file ? location_.file : "?";
            if (const char* slash = std::strrchr(file, '/')) {
                file = slash + 1;
            }
            if (id_ != 0) {
                return fmt::format("{} ({}:{})", detail::short_function_name(location_.function),
                                   file, location_.line);
            }
            return fmt::format("{} ({}:{})", location_.function, file, location_.line);
        }
        if (id_ != 0) {
            return fmt::format("coroutine #{}", id_);
        }
        return fmt::format("frame@{}", static_cast<const void*>(this));
    }

    [[nodiscard]] static execution_frame* current() noexcept {
        return current_;
    }

    static void set_current(execution_frame* frame) noexcept {
        current_ = frame;
    }

private:
    execution_frame* caller_ = nullptr;
    graph::schedulable_unit* owner_ = nullptr;
    debug_location location_;
    uint64_t id_ = 0;

    static inline thread_local execution_frame* current_ = nullptr;
};

/// RAII frame for a synchronous function
///
/// Must not outlive a suspension point when used inside a coroutine body.
class frame_scope {
public:
    explicit frame_scope(std::source_location loc = std::source_location::current()) noexcept
        : frame_(loc) {
        frame_.set_caller(execution_frame::current());
        execution_frame::set_current(&frame_);
    }

    ~frame_scope() noexcept {
        execution_frame::set_current(frame_.caller());
    }

    frame_scope(const frame_scope&) = delete;
    frame_scope& operator=(const frame_scope&) = delete;

    [[nodiscard]] execution_frame& frame() noexcept { return frame_; }

private:
    execution_frame frame_;
};

} // namespace tangle::coro

#define TANGLE_FRAME_CONCAT_IMPL(a, b) a##b
#define TANGLE_FRAME_CONCAT(a, b) TANGLE_FRAME_CONCAT_IMPL(a, b)

/// Push an execution frame for the enclosing function until end of scope
#define TANGLE_FRAME() \
    ::tangle::coro::frame_scope TANGLE_FRAME_CONCAT(tangle_frame_scope_, __LINE__) {}
