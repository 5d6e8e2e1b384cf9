#pragma once

#include "audio/speech_interval.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace convo {
namespace audio {

// Segmentation parameters shared by every strategy
struct SegmenterConfig {
    int frameMs = 30;                 // Analysis frame size (energy strategy)
    std::optional<double> threshold;  // RMS threshold; empty means derive from the signal
    int minSpeechMs = 200;            // Shorter segments are dropped
    int minSilenceMs = 300;           // Shorter gaps are bridged

    bool isValid() const {
        return frameMs > 0 && minSpeechMs >= 0 && minSilenceMs >= 0 &&
               (!threshold || *threshold >= 0.0);
    }
};

/**
 * Converts one channel of normalized audio into speech intervals.
 *
 * Every implementation returns intervals sorted by start, pairwise
 * non-overlapping, each lasting at least config.minSpeechMs. Empty, too short
 * or silent input yields an empty list. A negative sample rate or an invalid
 * config throws std::invalid_argument.
 */
class SpeechSegmenter {
public:
    virtual ~SpeechSegmenter() = default;

    virtual SpeechIntervals detectSpeech(const std::vector<float>& signal, int sampleRate,
                                         const SegmenterConfig& config) const = 0;

    virtual std::string name() const = 0;
};

// Merge spans separated by less than minSilenceSec, then drop spans shorter
// than minSpeechSec. Input must be sorted by start.
SpeechIntervals mergeAndFilterSpans(const SpeechIntervals& spans, double minSilenceSec,
                                    double minSpeechSec);

// "energy" or "silero"; the latter loads the model at modelPath and throws
// ModelLoadingException when that fails.
std::unique_ptr<SpeechSegmenter> createSegmenter(const std::string& strategy,
                                                 const std::string& modelPath = "");

} // namespace audio
} // namespace convo
