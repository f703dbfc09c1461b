//
//  main.cpp
//  CueForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <iostream>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "cue_timeline.hpp"
#include "cueforge_version.hpp"
#include "logging.hpp"
#include "subtitle_parser.hpp"
#include "timecode.hpp"
#include <nlohmann/json.hpp>

namespace {

nlohmann::json word_json(const cueforge::WordStyle &w) {
    nlohmann::json j;
    j["text"] = w.text;
    j["font"] = w.font;
    j["size"] = w.size;
    j["color"] = w.color;
    if (w.stroke_color) {
        j["stroke_color"] = *w.stroke_color;
    }
    j["stroke_width"] = w.stroke_width;
    j["bg_color"] = w.bg_color;
    return j;
}

void emit_json(const std::vector<cueforge::Cue> &cues, const cueforge::StyleTable &styles) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto &cue : cues) {
        nlohmann::json c;
        c["start"] = cue.interval.start;
        c["end"] = cue.interval.end;
        c["text"] = cueforge::content_text(cue.content);
        auto it = styles.find(cue);
        if (it != styles.end()) {
            nlohmann::json words = nlohmann::json::array();
            for (const auto &w : it->second) {
                words.push_back(word_json(w));
            }
            c["words"] = words;
        }
        out.push_back(c);
    }
    std::cout << out.dump(2) << "\n";
}

std::optional<double> parse_bound(const std::string &arg) {
    if (arg == "-") {
        return std::nullopt;
    }
    return cueforge::parse_time_argument(arg);
}

void print_usage() {
    std::cerr << "CueForge " << CUEFORGE_VERSION_DISPLAY << "\n"
              << "Copyright (c) 2025 Till Toenshoff\n\n"
              << "usage:\n"
              << "  cueforge <input.srt|input.json> [--styled] [--encoding ENC] "
              << "[--match REGEX] [--range START END] [--output FILE] [--json] "
              << "[--log-level warn|info|debug]\n"
              << "Options:\n"
              << "  --styled            Input is the styled JSON format.\n"
              << "  --encoding ENC      Input encoding (utf-8, latin-1; default utf-8).\n"
              << "  --match REGEX       Keep only cues whose text matches REGEX.\n"
              << "  --range START END   Keep cues overlapping [START, END), clamped. Times are\n"
              << "                      seconds or HH:MM:SS,mmm; '-' leaves a side open.\n"
              << "  --output FILE       Write the plain subtitle text to FILE instead of stdout.\n"
              << "  --json              Print cues as JSON instead of subtitle text.\n"
              << "  --log-level LEVEL   Set logging verbosity (default: info).\n";
}

}  // namespace

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "CueForge " << CUEFORGE_VERSION_DISPLAY << "\n";
        return 0;
    }

    std::vector<std::string> positional;
    bool styled = false;
    bool as_json = false;
    bool ranged = false;
    std::string encoding;
    std::string pattern;
    std::string output_path;
    std::optional<double> range_start;
    std::optional<double> range_end;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--styled") {
            styled = true;
        } else if (arg == "--json") {
            as_json = true;
        } else if (arg == "--log-level" && i + 1 < argc) {
            cueforge::set_log_verbosity(cueforge::parse_log_verbosity(argv[i + 1]));
            ++i;
        } else if (arg == "--encoding" && i + 1 < argc) {
            encoding = argv[++i];
        } else if (arg == "--match" && i + 1 < argc) {
            pattern = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            output_path = argv[++i];
        } else if (arg == "--range" && i + 2 < argc) {
            const std::string a = argv[i + 1];
            const std::string b = argv[i + 2];
            range_start = parse_bound(a);
            range_end = parse_bound(b);
            if ((a != "-" && !range_start) || (b != "-" && !range_end)) {
                std::cerr << "Invalid --range bounds: " << a << " " << b << "\n";
                return 2;
            }
            ranged = true;
            i += 2;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            positional.emplace_back(std::move(arg));
        }
    }

    if (positional.size() != 1) {
        print_usage();
        return 2;
    }

    const std::string input_path = positional[0];
    auto parsed = styled ? cueforge::parse_styled_json(input_path, encoding)
                         : cueforge::parse_srt(input_path, encoding);
    if (!parsed.status.ok) {
        CF_LOG("error", "cueforge: failed to parse subtitles: " << parsed.status.message);
        return 1;
    }

    std::optional<cueforge::CueTimeline> timeline(cueforge::CueTimeline(std::move(parsed.cues)));
    if (!pattern.empty()) {
        try {
            timeline = timeline->match_expr(pattern);
        } catch (const std::regex_error &e) {
            std::cerr << "Invalid --match expression: " << e.what() << "\n";
            return 2;
        }
        if (!timeline) {
            CF_LOG("warn", "cueforge: no cue matches '" << pattern << "'");
            return 1;
        }
    }

    std::vector<cueforge::Cue> cues = ranged ? timeline->sub_range(range_start, range_end)
                                             : timeline->cues();
    if (cues.empty()) {
        CF_LOG("warn", "cueforge: no cue overlaps the requested range");
        return 1;
    }

    if (as_json) {
        emit_json(cues, parsed.styles);
        return 0;
    }

    const cueforge::CueTimeline result(std::move(cues));
    if (output_path.empty()) {
        std::cout << result.to_text() << "\n";
        return 0;
    }
    auto status = result.write_srt(output_path);
    if (!status.ok) {
        CF_LOG("error", "cueforge: failed to write subtitles: " << status.message);
        return 1;
    }
    std::cout << "Wrote: " << output_path << "\n";
    return 0;
}
