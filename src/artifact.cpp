//
//  artifact.cpp
//  CueForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "artifact.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <utility>

#include "logging.hpp"

namespace cueforge {

Frame Artifact::mask_at(double) const {
    throw std::logic_error("artifact has no mask channel");
}

CompositeArtifact::CompositeArtifact(std::vector<ArtifactPtr> words) : words_(std::move(words)) {
    if (words_.empty()) {
        throw std::invalid_argument("composite needs at least one word");
    }
    offsets_.reserve(words_.size());
    has_mask_ = true;
    for (const auto &w : words_) {
        if (!w) {
            throw std::invalid_argument("composite word artifact is null");
        }
        offsets_.push_back(width_);
        width_ += w->width();
        has_mask_ = has_mask_ && w->has_mask();
    }
    height_ = words_.front()->height();
    CF_LOG("render", "composite of " << words_.size() << " words: " << width_ << "x" << height_);
}

Frame CompositeArtifact::frame_at(double t) const { return compose(t, false); }

Frame CompositeArtifact::mask_at(double t) const {
    if (!has_mask_) {
        return Artifact::mask_at(t);
    }
    return compose(t, true);
}

Frame CompositeArtifact::compose(double t, bool mask) const {
    const uint32_t channels = mask ? 1 : 3;
    Frame out = Frame::blank(width_, height_, channels);
    for (size_t i = 0; i < words_.size(); ++i) {
        const Frame src = mask ? words_[i]->mask_at(t) : words_[i]->frame_at(t);
        if (src.channels != channels) {
            throw std::runtime_error("word artifact channel count mismatch");
        }
        if (src.pixels.size() < size_t(src.width) * src.height * channels) {
            throw std::runtime_error("word artifact pixel buffer too small");
        }
        const uint32_t x0 = offsets_[i];
        const uint32_t copy_w = std::min(src.width, width_ - x0);
        const uint32_t copy_h = std::min(src.height, height_);
        const size_t row_bytes = size_t(copy_w) * channels;
        for (uint32_t y = 0; y < copy_h; ++y) {
            const uint8_t *from = src.pixels.data() + size_t(y) * src.width * channels;
            uint8_t *to = out.pixels.data() + (size_t(y) * width_ + x0) * channels;
            std::memcpy(to, from, row_bytes);
        }
    }
    return out;
}

WordStyle default_word_style(const std::string &text) {
    WordStyle s;
    s.text = text;
    s.font = "Georgia-Bold";
    s.size = 24;
    s.color = "white";
    s.stroke_color = "black";
    s.stroke_width = 0.5;
    return s;
}

Renderer make_styled_renderer(WordRenderer word_renderer) {
    return [word_renderer = std::move(word_renderer)](const CueContent &content) -> ArtifactPtr {
        if (const auto *plain = std::get_if<PlainText>(&content)) {
            return word_renderer(default_word_style(plain->text));
        }
        const auto &words = std::get<StyledWords>(content).words;
        if (words.empty()) {
            throw std::invalid_argument("styled cue has no words");
        }
        std::vector<ArtifactPtr> rendered;
        rendered.reserve(words.size());
        for (const auto &w : words) {
            rendered.push_back(word_renderer(w));
        }
        return std::make_shared<CompositeArtifact>(std::move(rendered));
    };
}

}  // namespace cueforge
