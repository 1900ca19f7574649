#pragma once

#include "logger.hpp"

/// Logging macros tagging each message with file and line.
/// Format arguments are evaluated only when the level is enabled, so hot
/// paths (reader/writer loops) pay a single atomic load otherwise.

#define MPVIPC_LOG_AT(lvl, ...) \
    do { \
        auto& mpvipc_log_instance_ = ::mpvipc::log::logger::instance(); \
        if (mpvipc_log_instance_.should_log(lvl)) { \
            mpvipc_log_instance_.log((lvl), __FILE__, __LINE__, __VA_ARGS__); \
        } \
    } while (0)

#ifdef MPVIPC_DEBUG
    #define MPVIPC_LOG_DEBUG(...) MPVIPC_LOG_AT(::mpvipc::log::level::debug, __VA_ARGS__)
#else
    #define MPVIPC_LOG_DEBUG(...) ((void)0)
#endif

#define MPVIPC_LOG_INFO(...) MPVIPC_LOG_AT(::mpvipc::log::level::info, __VA_ARGS__)
#define MPVIPC_LOG_WARNING(...) MPVIPC_LOG_AT(::mpvipc::log::level::warning, __VA_ARGS__)
#define MPVIPC_LOG_ERROR(...) MPVIPC_LOG_AT(::mpvipc::log::level::error, __VA_ARGS__)
