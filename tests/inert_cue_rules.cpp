// Validates that cues which can never be shown (start >= end) are kept but reported.
#include <iostream>
#include <optional>
#include <sstream>
#include <vector>

#include "cue_timeline.hpp"
#include "logging.hpp"
#include "test_utils.hpp"

using namespace cueforge;
using test_utils::capture_stderr;
using test_utils::plain_cue;

int main() {
    // 1) An inverted cue should emit a warning at construction.
    set_log_verbosity(LogVerbosity::Warn);
    std::vector<Cue> cues{plain_cue(0, 2, "ok"), plain_cue(5, 3, "inverted")};
    std::optional<CueTimeline> tl;
    auto log_text = capture_stderr([&]() { tl.emplace(cues); });
    if (log_text.find("will never be shown") == std::string::npos) {
        std::cerr << "expected warning for inverted cue, got: " << log_text << "\n";
        return 1;
    }

    // 2) The cue stays in the timeline and counts towards the duration, but never matches.
    if (tl->size() != 2 || tl->duration() != 3.0 || tl->resolve_active(4) != nullptr) {
        std::cerr << "unexpected timeline; size=" << tl->size() << " duration=" << tl->duration()
                  << "\n";
        return 1;
    }

    // 3) Well-formed cues stay silent at warn level.
    auto quiet = capture_stderr([]() { CueTimeline ok_tl({plain_cue(0, 1, "fine")}); });
    if (!quiet.empty()) {
        std::cerr << "unexpected log output: " << quiet << "\n";
        return 1;
    }

    std::cout << "inert_cue_rules OK\n";
    return 0;
}
