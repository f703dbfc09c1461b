//
//  subtitle_track.cpp
//  CueForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//
#include "subtitle_track.hpp"
#include "cueforge_version.hpp"

#include <utility>

#include "logging.hpp"
#include "subtitle_parser.hpp"

namespace cueforge {

std::string version_string() { return CUEFORGE_VERSION_DISPLAY; }

SubtitleTrack::SubtitleTrack(CueTimeline timeline, Renderer renderer, TrackOptions options,
                             StyleTable styles)
    : timeline_(std::move(timeline)),
      renderer_(std::move(renderer)),
      options_(options),
      styles_(std::move(styles)) {
    if (!renderer_) {
        throw std::invalid_argument("subtitle track needs a renderer");
    }
    if (!options_.styled && !styles_.empty()) {
        CF_LOG("warn", "style table with " << styles_.size()
                                           << " entries ignored; track is not styled");
    }
    // Mask support is a property of the renderer's output type, so one sample decides it.
    ArtifactPtr probe = renderer_(PlainText{"T"});
    has_mask_ = probe && probe->has_mask();
    CF_LOG("track", "track ready: cues=" << timeline_.size() << " duration=" << duration()
                                         << "s styled=" << options_.styled
                                         << " mask=" << has_mask_);
}

const Cue *SubtitleTrack::active_cue(double t) const {
    return timeline_.resolve_active(t, cache_);
}

ArtifactPtr SubtitleTrack::render(const Cue &cue) const {
    if (!options_.styled) {
        return cache_.get_or_render(cue, renderer_);
    }
    auto it = styles_.find(cue);
    if (it == styles_.end()) {
        CF_LOG("error", "no style entry for cue [" << cue.interval.start << ", "
                                                   << cue.interval.end << ") \""
                                                   << content_text(cue.content) << "\"");
        throw StyleLookupError("styled cue missing from style table");
    }
    const StyledWords words{it->second};
    return cache_.get_or_render(
        cue, [this, &words](const CueContent &) { return renderer_(CueContent{words}); });
}

ArtifactPtr SubtitleTrack::artifact_at(double t) const {
    const Cue *cue = active_cue(t);
    if (!cue) {
        return nullptr;
    }
    return render(*cue);
}

Frame SubtitleTrack::frame_at(double t) const {
    auto artifact = artifact_at(t);
    return artifact ? artifact->frame_at(t) : blank_frame();
}

Frame SubtitleTrack::mask_at(double t) const {
    if (!has_mask_) {
        throw std::logic_error("subtitle track renderer produces no masks");
    }
    auto artifact = artifact_at(t);
    return artifact ? artifact->mask_at(t) : blank_mask();
}

TrackResult open_subtitle_track(const std::string &path, Renderer renderer, TrackOptions options,
                                const std::string &encoding) {
    TrackResult out;
    ParseResult parsed =
        options.styled ? parse_styled_json(path, encoding) : parse_srt(path, encoding);
    if (!parsed.status.ok) {
        out.status = parsed.status;
        return out;
    }
    out.track = std::make_unique<SubtitleTrack>(CueTimeline(std::move(parsed.cues)),
                                                std::move(renderer), options,
                                                std::move(parsed.styles));
    out.status = make_status(true);
    return out;
}

}  // namespace cueforge
