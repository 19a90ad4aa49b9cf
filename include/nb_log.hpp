// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file nb_log.hpp
 * @brief Leveled stream logging.
 *
 * Messages go to a configurable std::ostream (std::cerr by default).
 * The level comes from ImportConfig, the -v flag of nbrun, or the
 * NBIMPORT_LOG environment variable.
 */

#pragma once

#include <cstdio>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

namespace nbimport {

enum class LogLevel {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3
};

const char* log_level_name(LogLevel level);

class Log {
public:
    static LogLevel level();
    static void set_level(LogLevel level);

    static std::ostream& stream();
    static void set_stream(std::ostream& out);

    static bool enabled(LogLevel level) { return level <= Log::level(); }
    static void write(LogLevel level, const std::string& message);

    // "error", "warn", "info", "debug" (case-insensitive)
    static std::optional<LogLevel> ParseLevel(std::string_view text);

    // Applies NBIMPORT_LOG if it is set to a known level.
    static void ConfigureFromEnvironment();
};

} // namespace nbimport

#define NB_LOG(lvl, expr)                                                  \
    do {                                                                   \
        if (::nbimport::Log::enabled(lvl)) {                               \
            std::ostringstream nb_log_oss_;                                \
            nb_log_oss_ << expr;                                           \
            ::nbimport::Log::write(lvl, nb_log_oss_.str());                \
        }                                                                  \
    } while (0)

#define NB_LOG_ERROR(expr) NB_LOG(::nbimport::LogLevel::Error, expr)
#define NB_LOG_WARN(expr)  NB_LOG(::nbimport::LogLevel::Warn, expr)
#define NB_LOG_INFO(expr)  NB_LOG(::nbimport::LogLevel::Info, expr)
#define NB_LOG_DEBUG(expr) NB_LOG(::nbimport::LogLevel::Debug, expr)

// Import tracing compiled in only for NB_DEBUG builds
#ifdef NB_DEBUG
    #define NB_DEBUG_IMPORT(fmt, ...) \
        fprintf(stderr, "[IMPORT] " fmt "\n", ##__VA_ARGS__)
#else
    #define NB_DEBUG_IMPORT(fmt, ...)
#endif
