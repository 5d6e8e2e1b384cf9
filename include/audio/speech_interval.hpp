#pragma once

#include <vector>

namespace convo {
namespace audio {

// One contiguous span of detected speech, in seconds from the start of the
// recording.
struct SpeechInterval {
    double start = 0.0;
    double end = 0.0;

    SpeechInterval() = default;
    SpeechInterval(double startSec, double endSec) : start(startSec), end(endSec) {}

    double duration() const { return end - start; }

    bool operator==(const SpeechInterval& other) const {
        return start == other.start && end == other.end;
    }
    bool operator!=(const SpeechInterval& other) const { return !(*this == other); }
};

using SpeechIntervals = std::vector<SpeechInterval>;

} // namespace audio
} // namespace convo
