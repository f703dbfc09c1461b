//
//  text_file.cpp
//  CueForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <system_error>

#include "logging.hpp"
#include "subtitle_parser.hpp"

namespace cueforge {

namespace {

std::string lowercase(std::string s) {
    for (auto &c : s) {
        c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

std::string latin1_to_utf8(const std::string &in) {
    std::string out;
    out.reserve(in.size() + in.size() / 8);
    for (unsigned char b : in) {
        if (b < 0x80) {
            out.push_back(static_cast<char>(b));
        } else {
            out.push_back(static_cast<char>(0xC0 | (b >> 6)));
            out.push_back(static_cast<char>(0x80 | (b & 0x3F)));
        }
    }
    return out;
}

}  // namespace

Status read_text_file(const std::string &path, const std::string &encoding, std::string &out) {
    const std::string enc = lowercase(encoding);
    const bool passthrough = enc.empty() || enc == "utf-8" || enc == "utf8" || enc == "ascii" ||
                             enc == "us-ascii";
    const bool latin1 = enc == "latin-1" || enc == "latin1" || enc == "iso-8859-1" ||
                        enc == "iso8859-1";
    if (!passthrough && !latin1) {
        std::string msg = "unsupported encoding '" + encoding + "'";
        CF_LOG("error", msg);
        return make_status(false, msg);
    }

    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        std::string msg = "open failed for " + path + " (" +
                          std::generic_category().message(errno) + ")";
        CF_LOG("error", msg);
        return make_status(false, msg);
    }
    std::string bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (f.bad()) {
        std::string msg = "read failed for " + path;
        CF_LOG("error", msg);
        return make_status(false, msg);
    }
    if (passthrough && bytes.size() >= 3 && static_cast<unsigned char>(bytes[0]) == 0xEF &&
        static_cast<unsigned char>(bytes[1]) == 0xBB && static_cast<unsigned char>(bytes[2]) == 0xBF) {
        bytes.erase(0, 3);
    }
    out = latin1 ? latin1_to_utf8(bytes) : std::move(bytes);
    CF_LOG("parser", "read " << out.size() << " bytes from " << path
                             << " (encoding=" << (enc.empty() ? "utf-8" : enc) << ")");
    return make_status(true);
}

}  // namespace cueforge
