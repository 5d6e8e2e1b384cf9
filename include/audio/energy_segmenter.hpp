#pragma once

#include "audio/speech_segmenter.hpp"

#include <cstddef>
#include <vector>

namespace convo {
namespace audio {

// Half-open run of frames [start, end)
struct FrameRun {
    size_t start;
    size_t end;

    bool operator==(const FrameRun& other) const {
        return start == other.start && end == other.end;
    }
};

/**
 * Energy-threshold segmentation: fixed, non-overlapping frames are classified
 * by RMS energy, speech runs closer than the minimum silence are joined, and
 * runs shorter than the minimum speech duration are dropped.
 */
class EnergySegmenter : public SpeechSegmenter {
public:
    EnergySegmenter() = default;

    SpeechIntervals detectSpeech(const std::vector<float>& signal, int sampleRate,
                                 const SegmenterConfig& config) const override;

    std::string name() const override { return "energy"; }

    // RMS of each complete frame; trailing samples that do not fill a frame
    // are ignored.
    static std::vector<double> computeFrameRms(const std::vector<float>& signal,
                                               size_t frameSamples);

    // Noise floor at the 30th percentile, peak at the 95th; the threshold sits
    // 40% of the way from floor to peak.
    static double autoThreshold(const std::vector<double>& frameRms);

    // Linear-interpolated percentile, pct in [0, 100]
    static double percentile(std::vector<double> values, double pct);

    static std::vector<FrameRun> framesToRuns(const std::vector<bool>& isSpeech,
                                              size_t minSilenceFrames,
                                              size_t minSpeechFrames);

private:
    static constexpr double kNoiseFloorPercentile = 30.0;
    static constexpr double kPeakPercentile = 95.0;
    static constexpr double kThresholdFraction = 0.4;
};

} // namespace audio
} // namespace convo
