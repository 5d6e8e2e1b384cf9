#include "audio/energy_segmenter.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace convo {
namespace audio {

SpeechIntervals EnergySegmenter::detectSpeech(const std::vector<float>& signal, int sampleRate,
                                              const SegmenterConfig& config) const {
    if (sampleRate < 0) {
        throw std::invalid_argument("Sample rate must not be negative: " +
                                    std::to_string(sampleRate));
    }
    if (!config.isValid()) {
        throw std::invalid_argument("Invalid segmenter configuration");
    }

    const size_t frameSamples =
        static_cast<size_t>(static_cast<long long>(sampleRate) * config.frameMs / 1000);
    if (frameSamples == 0) {
        return {};
    }

    std::vector<double> rms = computeFrameRms(signal, frameSamples);
    if (rms.empty()) {
        return {};
    }

    const double threshold = config.threshold ? *config.threshold : autoThreshold(rms);

    std::vector<bool> isSpeech(rms.size());
    for (size_t i = 0; i < rms.size(); ++i) {
        isSpeech[i] = rms[i] > threshold;
    }

    const size_t minSilenceFrames = static_cast<size_t>(config.minSilenceMs / config.frameMs);
    const size_t minSpeechFrames = static_cast<size_t>(config.minSpeechMs / config.frameMs);

    std::vector<FrameRun> runs = framesToRuns(isSpeech, minSilenceFrames, minSpeechFrames);

    SpeechIntervals intervals;
    intervals.reserve(runs.size());
    for (const auto& run : runs) {
        intervals.emplace_back(static_cast<double>(run.start) * config.frameMs / 1000.0,
                               static_cast<double>(run.end) * config.frameMs / 1000.0);
    }

    utils::Logger::debug("Energy VAD: " + std::to_string(rms.size()) + " frames, threshold " +
                         std::to_string(threshold) + ", " + std::to_string(intervals.size()) +
                         " segments");
    return intervals;
}

std::vector<double> EnergySegmenter::computeFrameRms(const std::vector<float>& signal,
                                                     size_t frameSamples) {
    if (frameSamples == 0) {
        return {};
    }

    const size_t frameCount = signal.size() / frameSamples;
    std::vector<double> rms;
    rms.reserve(frameCount);

    for (size_t frame = 0; frame < frameCount; ++frame) {
        double energy = 0.0;
        const size_t offset = frame * frameSamples;
        for (size_t i = 0; i < frameSamples; ++i) {
            const double sample = signal[offset + i];
            energy += sample * sample;
        }
        rms.push_back(std::sqrt(energy / static_cast<double>(frameSamples)));
    }
    return rms;
}

double EnergySegmenter::autoThreshold(const std::vector<double>& frameRms) {
    if (frameRms.empty()) {
        return 0.0;
    }

    const double noiseFloor = percentile(frameRms, kNoiseFloorPercentile);
    const double peak = percentile(frameRms, kPeakPercentile);

    // Near-silent or constant-level signal
    if (peak <= noiseFloor) {
        return noiseFloor;
    }
    return noiseFloor + kThresholdFraction * (peak - noiseFloor);
}

double EnergySegmenter::percentile(std::vector<double> values, double pct) {
    if (values.empty()) {
        return 0.0;
    }

    std::sort(values.begin(), values.end());

    const double rank = std::clamp(pct, 0.0, 100.0) / 100.0 * static_cast<double>(values.size() - 1);
    const size_t lower = static_cast<size_t>(std::floor(rank));
    const size_t upper = static_cast<size_t>(std::ceil(rank));
    const double fraction = rank - static_cast<double>(lower);

    return values[lower] + (values[upper] - values[lower]) * fraction;
}

std::vector<FrameRun> EnergySegmenter::framesToRuns(const std::vector<bool>& isSpeech,
                                                    size_t minSilenceFrames,
                                                    size_t minSpeechFrames) {
    std::vector<FrameRun> runs;
    bool inRun = false;
    size_t start = 0;

    for (size_t i = 0; i < isSpeech.size(); ++i) {
        if (isSpeech[i] && !inRun) {
            start = i;
            inRun = true;
        } else if (!isSpeech[i] && inRun) {
            runs.push_back({start, i});
            inRun = false;
        }
    }
    if (inRun) {
        runs.push_back({start, isSpeech.size()});
    }

    if (runs.empty()) {
        return runs;
    }

    std::vector<FrameRun> merged;
    merged.push_back(runs.front());
    for (size_t i = 1; i < runs.size(); ++i) {
        if (runs[i].start - merged.back().end < minSilenceFrames) {
            merged.back().end = runs[i].end;
        } else {
            merged.push_back(runs[i]);
        }
    }

    std::vector<FrameRun> kept;
    for (const auto& run : merged) {
        if (run.end - run.start >= minSpeechFrames) {
            kept.push_back(run);
        }
    }
    return kept;
}

} // namespace audio
} // namespace convo
