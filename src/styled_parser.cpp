//
//  styled_parser.cpp
//  CueForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <nlohmann/json.hpp>
#include <sstream>

#include "logging.hpp"
#include "subtitle_parser.hpp"

using json = nlohmann::json;

namespace cueforge {

namespace {

ParseResult fail(const std::string &what) {
    ParseResult res;
    res.status = make_status(false, what);
    CF_LOG("error", "styled: " << what);
    return res;
}

std::string at_line(size_t index, const std::string &what) {
    return "line " + std::to_string(index) + ": " + what;
}

// Milliseconds to seconds; matches ms_to_seconds() for integral input.
double timestamp_seconds(const json &v) { return v.get<double>() / 1000.0; }

bool parse_word(const json &w, WordStyle &out, std::string &error) {
    if (!w.is_object()) {
        error = "word is not an object";
        return false;
    }
    if (!w.contains("text") || !w["text"].is_string()) {
        error = "word without a text string";
        return false;
    }
    out.text = w["text"].get<std::string>();
    out.font = w.value("font", std::string("Georgia-Bold"));
    out.size = w.value("size", 24.0);
    out.color = w.value("color", std::string("white"));
    if (w.contains("stroke_color") && w["stroke_color"].is_string()) {
        out.stroke_color = w["stroke_color"].get<std::string>();
    }
    out.stroke_width = w.value("stroke_width", 1.0);
    out.bg_color = w.value("bg_color", std::string("transparent"));
    return true;
}

}  // namespace

ParseResult parse_styled_json(std::istream &in) {
    json j;
    try {
        // Strict parse: trailing content after the top-level value is an error.
        j = json::parse(in);
    } catch (const json::parse_error &e) {
        return fail(std::string("JSON parse error: ") + e.what());
    }
    if (!j.is_array()) {
        return fail("expected a JSON array of lines");
    }

    ParseResult res;
    try {
        for (size_t i = 0; i < j.size(); ++i) {
            const auto &line = j[i];
            if (!line.is_object()) {
                return fail(at_line(i, "not an object"));
            }
            if (!line.contains("startTimestamp") || !line["startTimestamp"].is_number() ||
                !line.contains("endTimestamp") || !line["endTimestamp"].is_number()) {
                return fail(at_line(i, "missing numeric startTimestamp/endTimestamp"));
            }
            if (!line.contains("words") || !line["words"].is_array() || line["words"].empty()) {
                return fail(at_line(i, "missing or empty words list"));
            }

            TimeInterval interval{timestamp_seconds(line["startTimestamp"]),
                                  timestamp_seconds(line["endTimestamp"])};
            std::vector<WordStyle> words;
            words.reserve(line["words"].size());
            std::string line_text;
            for (const auto &w : line["words"]) {
                WordStyle style;
                std::string error;
                if (!parse_word(w, style, error)) {
                    return fail(at_line(i, error));
                }
                // The stored word keeps the separator so the renderer spaces words itself.
                style.text += " ";
                line_text += style.text;
                words.push_back(std::move(style));
            }

            Cue cue{interval, PlainText{line_text}};
            res.cues.push_back(cue);
            // Identical lines share one entry; their words accumulate in order.
            auto &slot = res.styles[cue];
            slot.insert(slot.end(), words.begin(), words.end());
        }
    } catch (const json::exception &e) {
        return fail(std::string("JSON type error: ") + e.what());
    }

    if (res.cues.empty()) {
        return fail("no subtitle lines found");
    }
    CF_LOG("parser", "styled: parsed " << res.cues.size() << " cues, " << res.styles.size()
                                       << " style entries");
    res.status = make_status(true);
    return res;
}

ParseResult parse_styled_json(const std::string &path, const std::string &encoding) {
    std::string content;
    auto st = read_text_file(path, encoding, content);
    if (!st.ok) {
        ParseResult res;
        res.status = st;
        return res;
    }
    std::istringstream in(content);
    auto res = parse_styled_json(in);
    if (!res.status.ok) {
        res.status.message = path + ": " + res.status.message;
    }
    return res;
}

}  // namespace cueforge
