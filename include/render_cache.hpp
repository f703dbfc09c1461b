//
//  render_cache.hpp
//  CueForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <mutex>
#include <unordered_map>

#include "artifact.hpp"
#include "cue.hpp"

namespace cueforge {

/**
 * @brief Append-only memo table from cue to rendered artifact.
 *
 * Each cue is rendered at most once per cache. Entries are never evicted or replaced, so a
 * returned ArtifactPtr stays valid and identical for every later lookup of the same cue.
 * All operations are safe to call from multiple threads; the check/render/store sequence in
 * get_or_render() runs under one lock.
 */
class RenderCache {
   public:
    RenderCache() = default;
    RenderCache(const RenderCache &) = delete;
    RenderCache &operator=(const RenderCache &) = delete;

    /**
     * @brief Return the cached artifact for `cue`, rendering it first on a miss.
     *
     * On a miss `renderer(cue.content)` is invoked exactly once. Exceptions thrown by the
     * renderer propagate to the caller and nothing is stored, so a later call retries. A null
     * result is reported as std::runtime_error.
     */
    ArtifactPtr get_or_render(const Cue &cue, const Renderer &renderer);

    bool contains(const Cue &cue) const;

    // Cached artifact or nullptr; never renders.
    ArtifactPtr find(const Cue &cue) const;

    size_t size() const;

   private:
    mutable std::mutex mutex_;
    std::unordered_map<Cue, ArtifactPtr, CueHash> entries_;
};

}  // namespace cueforge
