//
//  subtitle_track.hpp
//  CueForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <memory>
#include <stdexcept>
#include <string>

#include "artifact.hpp"
#include "cue_timeline.hpp"
#include "render_cache.hpp"
#include "status.hpp"

namespace cueforge {

/// @defgroup api CueForge Public API
/// Public, supported C++ interfaces for time-based subtitle rendering.
/// @{

/// Session-wide settings, fixed when the track is built.
struct TrackOptions {
    bool styled = false;  ///< Render cues from the style table instead of their plain text.
};

/// A styled track resolved a cue that has no entry in its style table. This breaks the
/// parser's guarantee that cues and styles are produced together and is not recoverable.
class StyleLookupError : public std::logic_error {
   public:
    using std::logic_error::logic_error;
};

/**
 * @brief Subtitle track: timeline, render cache and renderer bound into one session.
 *
 * Frames are rendered only when a query first needs them and reused afterwards. Repeated
 * queries hitting the same cue return the same cached artifact.
 */
class SubtitleTrack {
   public:
    /**
     * @param timeline Cues to show.
     * @param renderer Rasterization callback. Probed once with the text "T" to decide whether
     *        the session exposes masks; exceptions from that probe propagate.
     * @param options Session settings; `styled` requires `styles` to cover every cue.
     * @param styles Style table from parse_styled_json(); ignored unless `options.styled`.
     */
    SubtitleTrack(CueTimeline timeline, Renderer renderer, TrackOptions options = {},
                  StyleTable styles = {});

    SubtitleTrack(const SubtitleTrack &) = delete;
    SubtitleTrack &operator=(const SubtitleTrack &) = delete;

    const CueTimeline &timeline() const { return timeline_; }
    const RenderCache &cache() const { return cache_; }
    bool styled() const { return options_.styled; }
    double duration() const { return timeline_.duration(); }

    /// Whether the renderer's artifacts carry masks; fixed for the session.
    bool has_mask() const { return has_mask_; }

    /// Active cue at `t`, preferring cues that are already rendered; nullptr when none.
    const Cue *active_cue(double t) const;

    /// Rendered (or cached) artifact for the cue active at `t`; nullptr when none.
    /// Renderer exceptions propagate and leave the cue uncached.
    ArtifactPtr artifact_at(double t) const;

    /// Frame of the active cue at `t`, or blank_frame() when no cue is active.
    Frame frame_at(double t) const;

    /// Mask of the active cue at `t`, or blank_mask() when no cue is active.
    /// Throws std::logic_error when has_mask() is false.
    Frame mask_at(double t) const;

    /// 1x1 black RGB frame.
    static Frame blank_frame() { return Frame::blank(1, 1, 3); }
    /// 1x1 fully transparent mask.
    static Frame blank_mask() { return Frame::blank(1, 1, 1); }

   private:
    ArtifactPtr render(const Cue &cue) const;

    CueTimeline timeline_;
    Renderer renderer_;
    TrackOptions options_;
    StyleTable styles_;
    mutable RenderCache cache_;
    bool has_mask_ = false;
};

/// Result of open_subtitle_track(); `track` is null unless `status.ok`.
struct TrackResult {
    Status status;
    std::unique_ptr<SubtitleTrack> track;
};

/// Parse `path` (plain or, with `options.styled`, styled JSON) and build a track from it.
TrackResult open_subtitle_track(const std::string &path, Renderer renderer,
                                TrackOptions options = {}, const std::string &encoding = {});

/// Return the CueForge library version string.
std::string version_string();

/// @}

}  // namespace cueforge
