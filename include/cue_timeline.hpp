//
//  cue_timeline.hpp
//  CueForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "cue.hpp"
#include "status.hpp"

namespace cueforge {

class RenderCache;

/// @ingroup api
/// Ordered, immutable list of cues. Derived timelines (filter, match_expr) are new instances.
class CueTimeline {
   public:
    using const_iterator = std::vector<Cue>::const_iterator;

    /// Throws std::invalid_argument when `cues` is empty.
    explicit CueTimeline(std::vector<Cue> cues);

    /// Latest end time over all cues.
    double duration() const { return duration_; }
    /// Timelines always start at 0.
    double start() const { return 0.0; }

    size_t size() const { return cues_.size(); }
    const Cue &operator[](size_t index) const { return cues_[index]; }
    const_iterator begin() const { return cues_.begin(); }
    const_iterator end() const { return cues_.end(); }
    const std::vector<Cue> &cues() const { return cues_; }

    /**
     * @brief First cue (in timeline order) whose right-open interval contains `t`.
     *
     * With a cache, cues already rendered there win over unrendered ones covering `t`; among
     * several rendered candidates the first in timeline order is chosen.
     * Returns nullptr when nothing covers `t`.
     */
    const Cue *resolve_active(double t) const;
    const Cue *resolve_active(double t, const RenderCache &cache) const;

    /**
     * @brief Cues overlapping `[start, end)`, with intervals clamped to that range.
     *
     * A cue (t1, t2) overlaps when `start <= t1 < end` or `start < t2 <= end`. An unset bound
     * is unbounded on that side and does not clamp.
     */
    std::vector<Cue> sub_range(std::optional<double> start, std::optional<double> end) const;

    /// Cues whose content satisfies `predicate`, in order; nullopt when none match.
    std::optional<CueTimeline> filter(
        const std::function<bool(const CueContent &)> &predicate) const;

    /// Cues whose text contains a match of the ECMAScript regex `pattern`.
    /// Throws std::regex_error on an invalid pattern.
    std::optional<CueTimeline> match_expr(const std::string &pattern) const;

    /// `HH:MM:SS,mmm - HH:MM:SS,mmm\ntext` blocks joined by a blank line.
    std::string to_text() const;

    /// Write to_text() to `path`.
    Status write_srt(const std::string &path) const;

   private:
    const Cue *resolve_first(double t, const std::function<bool(const Cue &)> &prefer) const;

    std::vector<Cue> cues_;
    double duration_ = 0.0;
};

}  // namespace cueforge
