//
//  logging.hpp
//  CueForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <sstream>
#include <string>
#include <string_view>

namespace cueforge {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Map a CLI-style level name onto a verbosity; unknown names select Error.
LogVerbosity parse_log_verbosity(std::string_view name);

// Severity of a CF_LOG tag. "error", "warn"/"warning" and "info" name their level; component
// tags such as "parser", "cache", "timeline" or "track" are debug output.
LogVerbosity severity_for_tag(std::string_view tag);

// True when a message with `tag` passes the current verbosity.
bool log_enabled(std::string_view tag);

// Writes one line to stderr. Error lines also name the source location.
void log_write(std::string_view tag, const std::string &msg, const char *file, int line,
               const char *func);

}  // namespace cueforge

#define CF_LOG(tag, message)                                                \
    do {                                                                    \
        if (cueforge::log_enabled(tag)) {                                   \
            std::ostringstream _cf_log_ss;                                  \
            _cf_log_ss << message;                                          \
            cueforge::log_write(tag, _cf_log_ss.str(), __FILE__, __LINE__,  \
                                __func__);                                  \
        }                                                                   \
    } while (0)
