// Unit coverage for the plain subtitle parser: block structure, tolerance for missing trailing
// blank lines, malformed input and the export round trip.
#include <iostream>
#include <sstream>
#include <string>

#include "cue_timeline.hpp"
#include "logging.hpp"
#include "subtitle_parser.hpp"
#include "test_utils.hpp"

#ifndef TESTDATA_DIR
#error "TESTDATA_DIR must be defined"
#endif

using namespace cueforge;
using test_utils::plain_cue;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[srt_parser_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

ParseResult parse_string(const std::string &text) {
    std::istringstream in(text);
    return parse_srt(in);
}

bool test_fixture() {
    auto res = parse_srt(std::string(TESTDATA_DIR) + "/sample.srt");
    bool ok = check(res.status.ok, "fixture parses: " + res.status.message);
    ok &= check(res.cues.size() == 3, "three blocks");
    if (res.cues.size() == 3) {
        ok &= check(res.cues[0] == plain_cue(1.0, 2.5, "Hello world"), "first block");
        ok &= check(res.cues[1] == plain_cue(3.0, 5.25, "foo\nsecond line"),
                    "multi-line text joined with newline");
        ok &= check(res.cues[2] == plain_cue(6.0, 8.0, "hello again"),
                    "last block without trailing blank line");
    }
    ok &= check(res.styles.empty(), "plain parser has no style table");
    return ok;
}

bool test_line_endings_and_blanks() {
    auto res = parse_string(
        "\n\n1\r\n00:00:00,500 --> 00:00:01,000\r\nCRLF text\r\n\r\n\r\n"
        "2\r\n00:00:02,000 --> 00:00:03,000\r\nnext\r\n\r\n");
    bool ok = check(res.status.ok, "CRLF input parses");
    ok &= check(res.cues.size() == 2, "extra blank lines ignored");
    if (res.cues.size() == 2) {
        ok &= check(res.cues[0] == plain_cue(0.5, 1.0, "CRLF text"), "carriage returns dropped");
    }

    auto no_blank = parse_string(
        "00:00:00,000 --> 00:00:01,000\nfirst\n00:00:01,000 --> 00:00:02,000\nsecond");
    ok &= check(no_blank.status.ok && no_blank.cues.size() == 2,
                "timecode line closes the previous block");

    auto clock_text = parse_string(
        "1\n00:00:00,000 --> 00:00:01,000\nMeet at 10:30:00.\n\n"
        "2\n00:00:01,000 --> 00:00:02,000\nratio 4:3:2.\n");
    ok &= check(clock_text.status.ok && clock_text.cues.size() == 2,
                "clock-like cue text is not a time line: " + clock_text.status.message);
    if (clock_text.cues.size() == 2) {
        ok &= check(clock_text.cues[0] == plain_cue(0, 1, "Meet at 10:30:00.") &&
                        clock_text.cues[1] == plain_cue(1, 2, "ratio 4:3:2."),
                    "clock-like text kept as cue text");
    }

    auto empty_text = parse_string("00:00:00,000 --> 00:00:01,000\n\n");
    ok &= check(empty_text.status.ok && empty_text.cues.size() == 1 &&
                    empty_text.cues[0] == plain_cue(0, 1, ""),
                "block without text keeps an empty cue");
    return ok;
}

bool test_malformed() {
    auto single = parse_string("1\n00:00:01,000\nlonely\n\n");
    bool ok = check(!single.status.ok && single.cues.empty(), "single timecode rejected");
    ok &= check(single.status.message.find("line 2") != std::string::npos,
                "error names the line: " + single.status.message);

    auto stray = parse_string("1\nno timestamps here\n\n");
    ok &= check(!stray.status.ok, "text without timecodes rejected");

    auto nothing = parse_string("");
    ok &= check(!nothing.status.ok, "empty input has no cues");

    auto missing = parse_srt("/nonexistent/cueforge.srt");
    ok &= check(!missing.status.ok && !missing.status.message.empty(), "missing file reported");

    auto bad_enc = parse_srt(std::string(TESTDATA_DIR) + "/sample.srt", "klingon-8");
    ok &= check(!bad_enc.status.ok &&
                    bad_enc.status.message.find("unsupported encoding") != std::string::npos,
                "unknown encoding rejected");
    return ok;
}

bool test_encodings() {
    // "café" in latin-1, with a BOM-free file.
    std::string latin1 = "00:00:00,000 --> 00:00:01,000\ncaf\xE9\n";
    auto path = test_utils::write_temp_text(latin1, "cueforge_latin1.srt");
    auto res = parse_srt(path.string(), "latin-1");
    bool ok = check(res.status.ok && res.cues.size() == 1, "latin-1 parses");
    if (res.cues.size() == 1) {
        ok &= check(content_text(res.cues[0].content) == "caf\xC3\xA9", "latin-1 transcoded");
    }

    std::string bom = "\xEF\xBB\xBF" "1\n00:00:00,000 --> 00:00:01,000\nbom\n";
    auto bom_path = test_utils::write_temp_text(bom, "cueforge_bom.srt");
    auto bom_res = parse_srt(bom_path.string(), "utf-8");
    ok &= check(bom_res.status.ok && bom_res.cues.size() == 1, "UTF-8 BOM stripped");

    auto bom_stream = parse_string(bom);
    ok &= check(bom_stream.status.ok && bom_stream.cues.size() == 1,
                "UTF-8 BOM stripped from streams: " + bom_stream.status.message);
    if (bom_stream.cues.size() == 1) {
        ok &= check(bom_stream.cues[0] == plain_cue(0, 1, "bom"), "BOM stream cue");
    }
    return ok;
}

bool test_round_trip() {
    auto res = parse_srt(std::string(TESTDATA_DIR) + "/sample.srt");
    if (!check(res.status.ok, "fixture parses for round trip")) {
        return false;
    }
    CueTimeline tl(res.cues);
    const std::string exported = tl.to_text();
    auto again = parse_string(exported);
    bool ok = check(again.status.ok, "exported text parses back");
    ok &= check(again.cues == res.cues, "same cues after export and re-parse");

    auto out = std::filesystem::temp_directory_path() / "cueforge_roundtrip.srt";
    auto st = tl.write_srt(out.string());
    ok &= check(st.ok, "write_srt succeeds");
    auto from_file = parse_srt(out.string());
    ok &= check(from_file.status.ok && from_file.cues == res.cues, "written file re-parses");

    auto bad = tl.write_srt("/nonexistent/dir/out.srt");
    ok &= check(!bad.ok && !bad.message.empty(), "unwritable path reported");
    return ok;
}

}  // namespace

int main() {
    set_log_verbosity(LogVerbosity::Error);
    bool ok = true;
    ok &= test_fixture();
    ok &= test_line_endings_and_blanks();
    ok &= test_malformed();
    ok &= test_encodings();
    ok &= test_round_trip();
    return ok ? 0 : 1;
}
