//
//  render_cache.cpp
//  CueForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "render_cache.hpp"

#include <chrono>
#include <stdexcept>

#include "logging.hpp"

namespace cueforge {

ArtifactPtr RenderCache::get_or_render(const Cue &cue, const Renderer &renderer) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(cue);
    if (it != entries_.end()) {
        return it->second;
    }
    const auto t0 = std::chrono::steady_clock::now();
    ArtifactPtr artifact = renderer(cue.content);
    if (!artifact) {
        CF_LOG("error", "renderer returned no artifact for cue at " << cue.interval.start << "s");
        throw std::runtime_error("renderer returned a null artifact");
    }
    const auto render_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                               std::chrono::steady_clock::now() - t0)
                               .count();
    CF_LOG("cache", "rendered cue [" << cue.interval.start << ", " << cue.interval.end << ") in "
                                     << render_ms << "ms, entries=" << entries_.size() + 1);
    entries_.emplace(cue, artifact);
    return artifact;
}

bool RenderCache::contains(const Cue &cue) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(cue) != 0;
}

ArtifactPtr RenderCache::find(const Cue &cue) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(cue);
    return it == entries_.end() ? nullptr : it->second;
}

size_t RenderCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace cueforge
