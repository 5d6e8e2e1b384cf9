#include "audio/speech_segmenter.hpp"
#include "audio/energy_segmenter.hpp"
#include "audio/silero_segmenter.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <stdexcept>

namespace convo {
namespace audio {

SpeechIntervals mergeAndFilterSpans(const SpeechIntervals& spans, double minSilenceSec,
                                    double minSpeechSec) {
    if (spans.empty()) {
        return {};
    }

    SpeechIntervals merged;
    merged.reserve(spans.size());
    merged.push_back(spans.front());

    for (size_t i = 1; i < spans.size(); ++i) {
        SpeechInterval& previous = merged.back();
        if (spans[i].start - previous.end < minSilenceSec) {
            previous.end = std::max(previous.end, spans[i].end);
        } else {
            merged.push_back(spans[i]);
        }
    }

    SpeechIntervals kept;
    kept.reserve(merged.size());
    for (const auto& span : merged) {
        if (span.duration() >= minSpeechSec) {
            kept.push_back(span);
        }
    }
    return kept;
}

std::unique_ptr<SpeechSegmenter> createSegmenter(const std::string& strategy,
                                                 const std::string& modelPath) {
    if (strategy == "energy") {
        return std::make_unique<EnergySegmenter>();
    }
    if (strategy == "silero") {
        utils::Logger::info("Loading Silero VAD model from: " + modelPath);
        return std::make_unique<SileroSegmenter>(SileroModel::load(modelPath));
    }
    throw std::invalid_argument("Unknown segmentation strategy: " + strategy);
}

} // namespace audio
} // namespace convo
