//
//  srt_parser.cpp
//  CueForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <cctype>
#include <optional>
#include <sstream>

#include "logging.hpp"
#include "subtitle_parser.hpp"
#include "timecode.hpp"

namespace cueforge {

namespace {

bool is_blank(const std::string &line) {
    for (char c : line) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

// Block counters ("1", "42") that precede the timecode line.
bool is_index_line(const std::string &line) {
    bool digits = false;
    for (char c : line) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits = true;
        } else if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return digits;
}

std::string strip_newlines(const std::string &s) {
    size_t b = s.find_first_not_of('\n');
    if (b == std::string::npos) {
        return {};
    }
    size_t e = s.find_last_not_of('\n');
    return s.substr(b, e - b + 1);
}

ParseResult fail(size_t line_no, const std::string &what) {
    ParseResult res;
    std::ostringstream oss;
    oss << "line " << line_no << ": " << what;
    res.status = make_status(false, oss.str());
    CF_LOG("error", "srt: " << res.status.message);
    return res;
}

}  // namespace

ParseResult parse_srt(std::istream &in) {
    ParseResult res;
    std::optional<TimeInterval> current;
    std::string text;
    size_t line_no = 0;

    auto flush = [&]() {
        if (current) {
            res.cues.push_back(Cue{*current, PlainText{strip_newlines(text)}});
        }
        current.reset();
        text.clear();
    };

    std::string line;
    while (std::getline(in, line)) {
        ++line_no;
        if (line_no == 1 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
            line.erase(0, 3);
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        const auto times = find_timecodes(line);
        if (!times.empty()) {
            if (times.size() != 2) {
                return fail(line_no, "expected a start and an end timecode, found " +
                                         std::to_string(times.size()));
            }
            // A new timecode line without a separating blank line closes the previous block.
            flush();
            current = TimeInterval{times[0], times[1]};
        } else if (is_blank(line)) {
            flush();
        } else if (current) {
            text += line;
            text += '\n';
        } else if (!is_index_line(line)) {
            return fail(line_no, "text outside of a timed block");
        }
    }
    if (in.bad()) {
        return fail(line_no, "read error");
    }
    flush();

    if (res.cues.empty()) {
        res.status = make_status(false, "no subtitle blocks found");
        CF_LOG("error", "srt: " << res.status.message);
        return res;
    }
    CF_LOG("parser", "srt: parsed " << res.cues.size() << " cues from " << line_no << " lines");
    res.status = make_status(true);
    return res;
}

ParseResult parse_srt(const std::string &path, const std::string &encoding) {
    std::string content;
    auto st = read_text_file(path, encoding, content);
    if (!st.ok) {
        ParseResult res;
        res.status = st;
        return res;
    }
    std::istringstream in(content);
    auto res = parse_srt(in);
    if (!res.status.ok) {
        res.status.message = path + ": " + res.status.message;
    }
    return res;
}

}  // namespace cueforge
