//
//  status.hpp
//  CueForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <utility>

namespace cueforge {

/**
 * @brief Result object with success flag and optional error message.
 *
 * When `ok == true`, `message` is empty. On failure, `message` contains a short description of
 * what went wrong (e.g., failure to open a file or a malformed cue block).
 */
struct Status {
    bool ok{false};
    std::string message;
};

inline Status make_status(bool ok, std::string msg = {}) { return Status{ok, std::move(msg)}; }

}  // namespace cueforge
