//
//  cue_timeline.cpp
//  CueForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "cue_timeline.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <limits>
#include <regex>
#include <stdexcept>
#include <system_error>

#include "logging.hpp"
#include "render_cache.hpp"
#include "timecode.hpp"

namespace cueforge {

CueTimeline::CueTimeline(std::vector<Cue> cues) : cues_(std::move(cues)) {
    if (cues_.empty()) {
        throw std::invalid_argument("a cue timeline needs at least one cue");
    }
    duration_ = cues_.front().interval.end;
    for (size_t i = 0; i < cues_.size(); ++i) {
        const auto &iv = cues_[i].interval;
        duration_ = std::max(duration_, iv.end);
        if (!(iv.start < iv.end)) {
            CF_LOG("warn", "cue #" << i << " has start " << iv.start << "s >= end " << iv.end
                                   << "s and will never be shown");
        }
    }
    CF_LOG("timeline", "timeline with " << cues_.size() << " cues, duration=" << duration_ << "s");
}

const Cue *CueTimeline::resolve_first(double t,
                                      const std::function<bool(const Cue &)> &prefer) const {
    const Cue *first = nullptr;
    for (const auto &cue : cues_) {
        if (!cue.interval.contains(t)) {
            continue;
        }
        if (!prefer) {
            return &cue;
        }
        if (prefer(cue)) {
            return &cue;
        }
        if (!first) {
            first = &cue;
        }
    }
    return first;
}

const Cue *CueTimeline::resolve_active(double t) const { return resolve_first(t, nullptr); }

const Cue *CueTimeline::resolve_active(double t, const RenderCache &cache) const {
    return resolve_first(t, [&cache](const Cue &cue) { return cache.contains(cue); });
}

std::vector<Cue> CueTimeline::sub_range(std::optional<double> start,
                                        std::optional<double> end) const {
    const double lo = start.value_or(-std::numeric_limits<double>::infinity());
    const double hi = end.value_or(std::numeric_limits<double>::infinity());
    std::vector<Cue> out;
    for (const auto &cue : cues_) {
        const double t1 = cue.interval.start;
        const double t2 = cue.interval.end;
        const bool overlaps = (lo <= t1 && t1 < hi) || (lo < t2 && t2 <= hi);
        if (!overlaps) {
            continue;
        }
        Cue clamped = cue;
        if (start) {
            clamped.interval.start = std::max(t1, *start);
        }
        if (end) {
            clamped.interval.end = std::min(t2, *end);
        }
        out.push_back(std::move(clamped));
    }
    return out;
}

std::optional<CueTimeline> CueTimeline::filter(
    const std::function<bool(const CueContent &)> &predicate) const {
    std::vector<Cue> kept;
    std::copy_if(cues_.begin(), cues_.end(), std::back_inserter(kept),
                 [&predicate](const Cue &cue) { return predicate(cue.content); });
    if (kept.empty()) {
        return std::nullopt;
    }
    return CueTimeline(std::move(kept));
}

std::optional<CueTimeline> CueTimeline::match_expr(const std::string &pattern) const {
    const std::regex re(pattern, std::regex::ECMAScript);
    return filter([&re](const CueContent &content) {
        const std::string text = content_text(content);
        return std::regex_search(text, re);
    });
}

std::string CueTimeline::to_text() const {
    std::string out;
    for (size_t i = 0; i < cues_.size(); ++i) {
        if (i != 0) {
            out += "\n\n";
        }
        const auto &cue = cues_[i];
        out += format_timecode(cue.interval.start);
        out += " - ";
        out += format_timecode(cue.interval.end);
        out += "\n";
        out += content_text(cue.content);
    }
    return out;
}

Status CueTimeline::write_srt(const std::string &path) const {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        std::string msg = "open failed for " + path + " (" +
                          std::generic_category().message(errno) + ")";
        CF_LOG("error", msg);
        return make_status(false, msg);
    }
    const std::string text = to_text();
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!out.good()) {
        std::string msg = "write failed for " + path;
        CF_LOG("error", msg);
        return make_status(false, msg);
    }
    return make_status(true);
}

}  // namespace cueforge
