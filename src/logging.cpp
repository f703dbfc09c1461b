//
//  logging.cpp
//  CueForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "logging.hpp"

#include <atomic>
#include <iostream>

namespace cueforge {

static std::atomic<int> g_log_level{static_cast<int>(LogVerbosity::Info)};

void set_log_verbosity(LogVerbosity level) {
    g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogVerbosity get_log_verbosity() {
    return static_cast<LogVerbosity>(g_log_level.load(std::memory_order_relaxed));
}

LogVerbosity parse_log_verbosity(std::string_view name) {
    if (name == "debug") return LogVerbosity::Debug;
    if (name == "info") return LogVerbosity::Info;
    if (name == "warn" || name == "warning") return LogVerbosity::Warn;
    return LogVerbosity::Error;
}

LogVerbosity severity_for_tag(std::string_view tag) {
    if (tag == "error") return LogVerbosity::Error;
    if (tag == "warn" || tag == "warning") return LogVerbosity::Warn;
    if (tag == "info") return LogVerbosity::Info;
    return LogVerbosity::Debug;
}

bool log_enabled(std::string_view tag) {
    return static_cast<int>(severity_for_tag(tag)) <= g_log_level.load(std::memory_order_relaxed);
}

void log_write(std::string_view tag, const std::string &msg, const char *file, int line,
               const char *func) {
    std::cerr << "[CueForge][" << tag << "]";
    if (severity_for_tag(tag) == LogVerbosity::Error) {
        std::cerr << "[" << file << ":" << line << " " << func << "]";
    }
    std::cerr << " " << msg << std::endl;
}

}  // namespace cueforge
