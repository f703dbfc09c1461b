//
//  subtitle_parser.hpp
//  CueForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <istream>
#include <string>
#include <vector>

#include "cue.hpp"
#include "status.hpp"

namespace cueforge {

/// @ingroup api
/// Output of the subtitle parsers. On failure `status.ok` is false and `cues` is empty.
struct ParseResult {
    Status status;
    std::vector<Cue> cues;
    // Styled input only: word styles for every cue in `cues`.
    StyleTable styles;
};

/**
 * @brief Parse plain timestamped subtitles (SRT-like).
 *
 * A line carrying two timecodes opens a block; following non-blank lines are its text; a blank
 * line (or end of input) closes it. Index lines before the timecodes are ignored.
 *
 * @param encoding "" / utf-8 / ascii read bytes as-is, latin-1 / iso-8859-1 are transcoded.
 */
ParseResult parse_srt(const std::string &path, const std::string &encoding = {});
ParseResult parse_srt(std::istream &in);

/**
 * @brief Parse styled subtitles: a JSON array of lines with `startTimestamp`/`endTimestamp`
 * in milliseconds and a `words` list.
 *
 * Each word's text gets a trailing space; the cue text is the concatenation of those texts.
 * `styles` maps every emitted cue to its words.
 */
ParseResult parse_styled_json(const std::string &path, const std::string &encoding = {});
ParseResult parse_styled_json(std::istream &in);

// Read a file and convert it to UTF-8 according to `encoding`. A UTF-8 BOM is dropped.
Status read_text_file(const std::string &path, const std::string &encoding, std::string &out);

}  // namespace cueforge
