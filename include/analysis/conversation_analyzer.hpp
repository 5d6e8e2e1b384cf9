#pragma once

#include "analysis/conversation_types.hpp"
#include "audio/speech_segmenter.hpp"

#include <memory>
#include <string>
#include <vector>

namespace convo {
namespace analysis {

/**
 * Aggregates turns, response times, interruptions, overlap and silence of a
 * two-speaker recording into one ConversationStats record.
 *
 * Throws std::invalid_argument for a negative duration or identical labels;
 * empty interval lists are valid and produce zero statistics.
 */
ConversationStats computeStats(const audio::SpeechIntervals& intervalsA,
                               const audio::SpeechIntervals& intervalsB, double durationSec,
                               const std::string& labelA = "Speaker A",
                               const std::string& labelB = "Speaker B");

struct ChannelSegments {
    audio::SpeechIntervals speakerA;
    audio::SpeechIntervals speakerB;
};

/**
 * Runs one segmenter over both channels of a recording and aggregates the
 * result. Holds no per-call state, so one instance may serve concurrent calls.
 */
class ConversationAnalyzer {
public:
    ConversationAnalyzer(std::shared_ptr<const audio::SpeechSegmenter> segmenter,
                         const audio::SegmenterConfig& config, const std::string& labelA,
                         const std::string& labelB);

    // Channel A is the left signal, channel B the right one.
    ChannelSegments segmentChannels(const std::vector<float>& left,
                                    const std::vector<float>& right, int sampleRate) const;

    ConversationStats analyze(const std::vector<float>& left, const std::vector<float>& right,
                              int sampleRate) const;

    const audio::SegmenterConfig& getConfig() const { return config_; }
    const std::string& getLabelA() const { return labelA_; }
    const std::string& getLabelB() const { return labelB_; }

private:
    std::shared_ptr<const audio::SpeechSegmenter> segmenter_;
    audio::SegmenterConfig config_;
    std::string labelA_;
    std::string labelB_;
};

} // namespace analysis
} // namespace convo
