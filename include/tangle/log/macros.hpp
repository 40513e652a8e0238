#pragma once

#include "logger.hpp"

/// Log through the global logger, tagged with the call site
///
/// The level check happens before the arguments are evaluated, so a
/// filtered line costs one atomic load:
///   TANGLE_LOG(::tangle::log::level::info, "expanded {} units", n);
#define TANGLE_LOG(lvl, ...) \
    do { \
        auto& tangle_log_sink_ = ::tangle::log::logger::instance(); \
        if (tangle_log_sink_.enabled(lvl)) { \
            tangle_log_sink_.log((lvl), __FILE__, __LINE__, __VA_ARGS__); \
        } \
    } while (false)

// Debug lines exist only in TANGLE_DEBUG builds; the arguments are not
// evaluated otherwise.
#ifdef TANGLE_DEBUG
    #define TANGLE_LOG_DEBUG(...) TANGLE_LOG(::tangle::log::level::debug, __VA_ARGS__)
#else
    #define TANGLE_LOG_DEBUG(...) do {} while (false)
#endif

#define TANGLE_LOG_INFO(...) TANGLE_LOG(::tangle::log::level::info, __VA_ARGS__)
#define TANGLE_LOG_WARNING(...) TANGLE_LOG(::tangle::log::level::warning, __VA_ARGS__)
#define TANGLE_LOG_ERROR(...) TANGLE_LOG(::tangle::log::level::error, __VA_ARGS__)
