//
//  timecode.cpp
//  CueForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "timecode.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <regex>
#include <stdexcept>

namespace cueforge {

namespace {

// Three colon-separated integer fields followed by a fraction. Fields may be empty, matching
// the loose timestamps real-world SRT files contain ("0:1:2,5").
const std::regex &timecode_regex() {
    static const std::regex re("([0-9]*):([0-9]*):([0-9]*)[,.]([0-9]*)");
    return re;
}

// Timecodes inside subtitle lines need the comma and at least one fraction digit, so cue text
// such as "Meet at 10:30:00." is not mistaken for a time line.
const std::regex &line_timecode_regex() {
    static const std::regex re("([0-9]*):([0-9]*):([0-9]*),([0-9]+)");
    return re;
}

// Largest value format_timecode() rounds; keeps llround() inside the long long range.
constexpr double kMaxFormatSeconds = 9.0e12;

int64_t field_value(const std::string &digits) {
    int64_t v = 0;
    for (char c : digits) {
        v = v * 10 + (c - '0');
    }
    return v;
}

// Decimal fraction digits to milliseconds: "5" -> 500, "05" -> 50, "0501" -> 50 (rounded).
int64_t fraction_ms(const std::string &digits) {
    if (digits.empty()) {
        return 0;
    }
    double frac = 0.0;
    double scale = 0.1;
    for (char c : digits) {
        frac += (c - '0') * scale;
        scale /= 10.0;
    }
    return static_cast<int64_t>(std::llround(frac * 1000.0));
}

std::optional<int64_t> match_to_ms(const std::smatch &m) {
    const std::string h = m[1].str();
    const std::string mi = m[2].str();
    const std::string s = m[3].str();
    if (h.empty() && mi.empty() && s.empty()) {
        return std::nullopt;
    }
    // Guard against absurd field widths overflowing int64.
    if (h.size() > 9 || mi.size() > 9 || s.size() > 9) {
        return std::nullopt;
    }
    return field_value(h) * 3600000 + field_value(mi) * 60000 + field_value(s) * 1000 +
           fraction_ms(m[4].str());
}

}  // namespace

std::optional<double> parse_timecode(std::string_view text) {
    std::string s(text);
    // Trim surrounding whitespace.
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    s = s.substr(b, e - b);

    std::smatch m;
    if (!std::regex_match(s, m, timecode_regex())) {
        return std::nullopt;
    }
    auto ms = match_to_ms(m);
    if (!ms) {
        return std::nullopt;
    }
    return ms_to_seconds(*ms);
}

std::string format_timecode(double seconds) {
    if (!(seconds > 0.0)) {
        seconds = 0.0;
    } else if (seconds > kMaxFormatSeconds) {
        seconds = kMaxFormatSeconds;
    }
    const int64_t total_ms = static_cast<int64_t>(std::llround(seconds * 1000.0));
    const int64_t ms = total_ms % 1000;
    const int64_t total_s = total_ms / 1000;
    const int64_t s = total_s % 60;
    const int64_t m = (total_s / 60) % 60;
    const int64_t h = total_s / 3600;
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld,%03lld", static_cast<long long>(h),
                  static_cast<long long>(m), static_cast<long long>(s),
                  static_cast<long long>(ms));
    return buf;
}

std::vector<double> find_timecodes(std::string_view line) {
    std::vector<double> out;
    const std::string s(line);
    for (auto it = std::sregex_iterator(s.begin(), s.end(), line_timecode_regex());
         it != std::sregex_iterator(); ++it) {
        if (auto ms = match_to_ms(*it)) {
            out.push_back(ms_to_seconds(*ms));
        }
    }
    return out;
}

std::optional<double> parse_time_argument(std::string_view text) {
    if (auto tc = parse_timecode(text)) {
        return tc;
    }
    const std::string s(text);
    if (s.empty()) {
        return std::nullopt;
    }
    try {
        size_t used = 0;
        double v = std::stod(s, &used);
        if (used != s.size() || !std::isfinite(v)) {
            return std::nullopt;
        }
        return v;
    } catch (const std::exception &) {
        return std::nullopt;
    }
}

}  // namespace cueforge
