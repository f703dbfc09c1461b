//
//  cue.hpp
//  CueForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace cueforge {

/// @ingroup api
/// Right-open time interval in seconds; a cue is active for `start <= t < end`.
struct TimeInterval {
    double start = 0.0;
    double end = 0.0;

    bool contains(double t) const { return start <= t && t < end; }
    bool operator==(const TimeInterval &other) const = default;
};

/// @ingroup api
/// Per-word styling as found in the styled (JSON) subtitle format.
struct WordStyle {
    std::string text;                         ///< UTF-8 word text (parser appends a space)
    std::string font;                         ///< Font name handed to the rasterizer
    double size = 0.0;                        ///< Font size in points
    std::string color;                        ///< Fill colour (name or #rrggbb)
    std::optional<std::string> stroke_color;  ///< Outline colour, none when unset
    double stroke_width = 1.0;                ///< Outline width
    std::string bg_color = "transparent";     ///< Background colour

    bool operator==(const WordStyle &other) const = default;
};

struct PlainText {
    std::string text;
    bool operator==(const PlainText &other) const = default;
};

struct StyledWords {
    std::vector<WordStyle> words;
    bool operator==(const StyledWords &other) const = default;
};

using CueContent = std::variant<PlainText, StyledWords>;

/// @ingroup api
/// A subtitle entry. Equality and hashing are structural and use exact comparison of the
/// interval bounds, so bounds must come from the same conversion (see timecode.hpp).
struct Cue {
    TimeInterval interval;
    CueContent content;

    bool operator==(const Cue &other) const = default;
};

// Textual form of a cue's content; styled content concatenates the word texts.
std::string content_text(const CueContent &content);

struct CueHash {
    size_t operator()(const Cue &cue) const;
};

// Word styles keyed by the plain cue the styled parser emitted for the same line.
using StyleTable = std::unordered_map<Cue, std::vector<WordStyle>, CueHash>;

}  // namespace cueforge
