// Unit coverage for the styled (JSON) parser: timestamps, word spacing, style defaults, the
// cue-to-style table and malformed documents.
#include <iostream>
#include <sstream>
#include <string>

#include "cue_timeline.hpp"
#include "logging.hpp"
#include "subtitle_parser.hpp"
#include "timecode.hpp"

#ifndef TESTDATA_DIR
#error "TESTDATA_DIR must be defined"
#endif

using namespace cueforge;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[styled_parser_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

ParseResult parse_string(const std::string &text) {
    std::istringstream in(text);
    return parse_styled_json(in);
}

bool test_fixture() {
    auto res = parse_styled_json(std::string(TESTDATA_DIR) + "/styled.json");
    bool ok = check(res.status.ok, "fixture parses: " + res.status.message);
    ok &= check(res.cues.size() == 2 && res.styles.size() == 2, "two lines, two style entries");
    if (res.cues.size() != 2) {
        return false;
    }
    const Cue &first = res.cues[0];
    ok &= check(first.interval == TimeInterval{0.0, 1.5}, "milliseconds converted to seconds");
    ok &= check(first.content == CueContent{PlainText{"Hello there "}},
                "cue text joins words with trailing spaces");

    auto it = res.styles.find(first);
    ok &= check(it != res.styles.end(), "style entry keyed by the emitted cue");
    if (it != res.styles.end() && it->second.size() == 2) {
        const auto &w0 = it->second[0];
        const auto &w1 = it->second[1];
        ok &= check(w0.text == "Hello " && w1.text == "there ", "word texts gain a space");
        ok &= check(w0.font == "Georgia-Bold" && w0.size == 24 && w0.color == "white",
                    "word style fields");
        ok &= check(!w0.stroke_color && w0.stroke_width == 1.0 && w0.bg_color == "transparent",
                    "optional style fields default");
        ok &= check(w1.stroke_color == "black" && w1.stroke_width == 2 && w1.size == 30 &&
                        w1.color == "#ffcc00",
                    "explicit stroke settings");
    } else {
        ok &= check(false, "first line has two words");
    }
    auto second = res.styles.find(res.cues[1]);
    ok &= check(second != res.styles.end() && second->second[0].bg_color == "black",
                "background colour read");
    return ok;
}

bool test_boundaries_match_plain_conversion() {
    auto res = parse_string(R"([{"startTimestamp": 3723004, "endTimestamp": 3724000,
                                 "words": [{"text": "x"}]}])");
    bool ok = check(res.status.ok, "single line parses");
    if (res.cues.size() == 1) {
        ok &= check(res.cues[0].interval.start == parse_timecode("01:02:03,004"),
                    "same seconds as the plain timecode conversion");
        ok &= check(CueTimeline(res.cues).to_text() ==
                        "01:02:03,004 - 01:02:04,000\nx ",
                    "styled cues export like plain ones");
        auto it = res.styles.find(res.cues[0]);
        ok &= check(it != res.styles.end() && it->second[0].font == "Georgia-Bold" &&
                        it->second[0].size == 24 && it->second[0].color == "white",
                    "missing font/size/color fall back to defaults");
    }
    return ok;
}

bool test_duplicate_lines_share_entry() {
    auto res = parse_string(R"([
        {"startTimestamp": 0, "endTimestamp": 1000, "words": [{"text": "same", "font": "A"}]},
        {"startTimestamp": 0, "endTimestamp": 1000, "words": [{"text": "same", "font": "B"}]}
    ])");
    bool ok = check(res.status.ok && res.cues.size() == 2, "both lines kept as cues");
    ok &= check(res.styles.size() == 1, "identical cues share one style entry");
    if (res.styles.size() == 1) {
        const auto &words = res.styles.begin()->second;
        ok &= check(words.size() == 2 && words[0].font == "A" && words[1].font == "B",
                    "words accumulate in order");
    }
    return ok;
}

bool test_malformed() {
    bool ok = check(!parse_string("{not json").status.ok, "syntax error rejected");
    ok &= check(!parse_string(R"({"lines": []})").status.ok, "top-level object rejected");
    ok &= check(!parse_string("[]").status.ok, "empty list has no cues");
    const std::string line = R"({"startTimestamp": 0, "endTimestamp": 1, "words": [{"text": "a"}]})";
    ok &= check(parse_string("[" + line + "]  \n").status.ok, "trailing whitespace accepted");
    ok &= check(!parse_string("[" + line + "] garbage").status.ok, "trailing garbage rejected");
    ok &= check(!parse_string("[" + line + "][" + line + "]").status.ok,
                "second top-level value rejected");
    ok &= check(!parse_string(R"([{"endTimestamp": 1, "words": [{"text": "a"}]}])").status.ok,
                "missing start rejected");
    ok &= check(!parse_string(R"([{"startTimestamp": "0", "endTimestamp": 1,
                                    "words": [{"text": "a"}]}])")
                     .status.ok,
                "string timestamp rejected");
    ok &= check(!parse_string(R"([{"startTimestamp": 0, "endTimestamp": 1, "words": []}])")
                     .status.ok,
                "empty words rejected");
    ok &= check(!parse_string(R"([{"startTimestamp": 0, "endTimestamp": 1,
                                    "words": [{"font": "A"}]}])")
                     .status.ok,
                "word without text rejected");
    auto typed = parse_string(R"([{"startTimestamp": 0, "endTimestamp": 1,
                                    "words": [{"text": "a", "size": "big"}]}])");
    ok &= check(!typed.status.ok && typed.cues.empty() && typed.styles.empty(),
                "mistyped style field rejected with nothing emitted");
    auto missing = parse_styled_json("/nonexistent/cueforge.json");
    ok &= check(!missing.status.ok, "missing file reported");
    return ok;
}

}  // namespace

int main() {
    set_log_verbosity(LogVerbosity::Error);
    bool ok = true;
    ok &= test_fixture();
    ok &= test_boundaries_match_plain_conversion();
    ok &= test_duplicate_lines_share_entry();
    ok &= test_malformed();
    return ok ? 0 : 1;
}
