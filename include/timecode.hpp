//
//  timecode.hpp
//  CueForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cueforge {

// Every cue boundary is produced by this conversion, plain and styled alike, so that equal
// timestamps always yield bit-identical doubles.
inline double ms_to_seconds(int64_t ms) { return static_cast<double>(ms) / 1000.0; }

// Parse `HH:MM:SS,mmm` (or `.` as fraction separator) into seconds. Fraction digits are
// decimal, so `,5` means 500ms. Returns nullopt on anything else.
std::optional<double> parse_timecode(std::string_view text);

// Format seconds as `HH:MM:SS,mmm`, rounding to the nearest millisecond. Negative and NaN
// values clamp to zero, huge and infinite ones to a fixed maximum.
std::string format_timecode(double seconds);

// All `HH:MM:SS,mmm` timecodes contained in a line, in order of appearance. Unlike
// parse_timecode() the comma and at least one fraction digit are required.
std::vector<double> find_timecodes(std::string_view line);

// Accepts either plain seconds ("12.5") or a timecode; used by the CLI.
std::optional<double> parse_time_argument(std::string_view text);

}  // namespace cueforge
