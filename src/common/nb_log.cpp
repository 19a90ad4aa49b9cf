// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file nb_log.cpp
 * @brief Process-wide log level and sink.
 */

#include "pch.h"
#include "nb_log.hpp"

namespace nbimport {

namespace {

struct LogState {
    LogLevel level{LogLevel::Warn};
    std::ostream* out{&std::cerr};
};

LogState& state() {
    static LogState s_state;
    return s_state;
}

} // anonymous namespace

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "error";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Info:  return "info";
        case LogLevel::Debug: return "debug";
    }
    return "unknown";
}

LogLevel Log::level() {
    return state().level;
}

void Log::set_level(LogLevel level) {
    state().level = level;
}

std::ostream& Log::stream() {
    return *state().out;
}

void Log::set_stream(std::ostream& out) {
    state().out = &out;
}

void Log::write(LogLevel level, const std::string& message) {
    std::ostream& out = stream();
    out << "[nbimport] " << log_level_name(level) << ": " << message << "\n";
    out.flush();
}

std::optional<LogLevel> Log::ParseLevel(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "error") return LogLevel::Error;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "debug") return LogLevel::Debug;
    return std::nullopt;
}

void Log::ConfigureFromEnvironment() {
    const char* env = std::getenv("NBIMPORT_LOG");
    if (!env) return;
    if (auto parsed = ParseLevel(env)) {
        set_level(*parsed);
    } else {
        NB_LOG_WARN("ignoring unknown NBIMPORT_LOG level '" << env << "'");
    }
}

} // namespace nbimport
