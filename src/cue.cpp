//
//  cue.cpp
//  CueForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "cue.hpp"

namespace cueforge {

namespace {

inline void hash_combine(size_t &seed, size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

size_t hash_word(const WordStyle &w) {
    size_t seed = std::hash<std::string>{}(w.text);
    hash_combine(seed, std::hash<std::string>{}(w.font));
    hash_combine(seed, std::hash<double>{}(w.size));
    hash_combine(seed, std::hash<std::string>{}(w.color));
    hash_combine(seed, w.stroke_color ? std::hash<std::string>{}(*w.stroke_color) : 0);
    hash_combine(seed, std::hash<double>{}(w.stroke_width));
    hash_combine(seed, std::hash<std::string>{}(w.bg_color));
    return seed;
}

}  // namespace

std::string content_text(const CueContent &content) {
    if (const auto *plain = std::get_if<PlainText>(&content)) {
        return plain->text;
    }
    std::string out;
    for (const auto &w : std::get<StyledWords>(content).words) {
        out += w.text;
    }
    return out;
}

size_t CueHash::operator()(const Cue &cue) const {
    size_t seed = std::hash<double>{}(cue.interval.start);
    hash_combine(seed, std::hash<double>{}(cue.interval.end));
    hash_combine(seed, cue.content.index());
    if (const auto *plain = std::get_if<PlainText>(&cue.content)) {
        hash_combine(seed, std::hash<std::string>{}(plain->text));
    } else {
        for (const auto &w : std::get<StyledWords>(cue.content).words) {
            hash_combine(seed, hash_word(w));
        }
    }
    return seed;
}

}  // namespace cueforge
