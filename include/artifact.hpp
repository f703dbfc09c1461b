//
//  artifact.hpp
//  CueForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "cue.hpp"

namespace cueforge {

/**
 * @brief Interleaved 8-bit pixel buffer.
 *
 * Colour frames carry 3 channels (RGB); masks carry a single alpha channel.
 */
struct Frame {
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t channels = 0;
    std::vector<uint8_t> pixels;  ///< row-major, `width * height * channels` bytes

    static Frame blank(uint32_t width, uint32_t height, uint32_t channels) {
        return Frame{width, height, channels,
                     std::vector<uint8_t>(size_t(width) * height * channels, 0)};
    }

    bool operator==(const Frame &other) const = default;
};

/**
 * @brief Rendered representation of a cue, queried by time.
 *
 * Implementations come from the rasterization engine; the core only stores and forwards them.
 */
class Artifact {
   public:
    virtual ~Artifact() = default;

    virtual uint32_t width() const = 0;
    virtual uint32_t height() const = 0;

    // RGB frame at time t.
    virtual Frame frame_at(double t) const = 0;

    // True when mask_at() yields an alpha channel.
    virtual bool has_mask() const { return false; }

    // Alpha mask at time t; only meaningful when has_mask() is true.
    virtual Frame mask_at(double t) const;
};

using ArtifactPtr = std::shared_ptr<const Artifact>;

// Rasterization callback: cue content in, rendered artifact out. May throw.
using Renderer = std::function<ArtifactPtr(const CueContent &)>;

// Rasterizes a single word with its style.
using WordRenderer = std::function<ArtifactPtr(const WordStyle &)>;

/**
 * @brief Words laid out left to right, all anchored to a shared top edge.
 *
 * Width is the sum of the word widths, height the first word's height. Word pixels falling
 * below that height are clipped.
 */
class CompositeArtifact : public Artifact {
   public:
    explicit CompositeArtifact(std::vector<ArtifactPtr> words);

    uint32_t width() const override { return width_; }
    uint32_t height() const override { return height_; }
    Frame frame_at(double t) const override;
    bool has_mask() const override { return has_mask_; }
    Frame mask_at(double t) const override;

    // Horizontal origin of each word, in placement order.
    const std::vector<uint32_t> &offsets() const { return offsets_; }
    size_t word_count() const { return words_.size(); }

   private:
    Frame compose(double t, bool mask) const;

    std::vector<ArtifactPtr> words_;
    std::vector<uint32_t> offsets_;
    uint32_t width_ = 0;
    uint32_t height_ = 0;
    bool has_mask_ = false;
};

// Style applied to plain-text cues by make_styled_renderer().
WordStyle default_word_style(const std::string &text);

// Builds a Renderer on top of a per-word rasterizer: plain text is rendered with the default
// style, styled words are rendered one by one and composed into a CompositeArtifact.
Renderer make_styled_renderer(WordRenderer word_renderer);

}  // namespace cueforge
