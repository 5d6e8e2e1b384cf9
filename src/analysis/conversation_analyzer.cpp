#include "analysis/conversation_analyzer.hpp"
#include "analysis/interruption_detector.hpp"
#include "analysis/timing_analyzer.hpp"
#include "analysis/turn_builder.hpp"
#include "utils/logging.hpp"

#include <stdexcept>

namespace convo {
namespace analysis {

namespace {

double percentOf(double part, double durationSec) {
    return durationSec > 0.0 ? part / durationSec * 100.0 : 0.0;
}

SpeakerStats speakerSummary(const std::string& label, const audio::SpeechIntervals& intervals,
                            const std::vector<Turn>& turns, double durationSec) {
    SpeakerStats stats;
    stats.label = label;
    for (const auto& interval : intervals) {
        stats.totalTalkTime += interval.duration();
    }
    stats.talkTimePct = percentOf(stats.totalTalkTime, durationSec);

    for (const auto& turn : turns) {
        if (turn.speaker == label) {
            stats.turnDurations.push_back(turn.duration());
        }
    }
    stats.numTurns = stats.turnDurations.size();
    return stats;
}

} // namespace

ConversationStats computeStats(const audio::SpeechIntervals& intervalsA,
                               const audio::SpeechIntervals& intervalsB, double durationSec,
                               const std::string& labelA, const std::string& labelB) {
    if (durationSec < 0.0) {
        throw std::invalid_argument("Recording duration must not be negative");
    }
    if (labelA == labelB) {
        throw std::invalid_argument("Speaker labels must differ, both are '" + labelA + "'");
    }

    ConversationStats stats;
    stats.durationSec = durationSec;
    stats.turns = buildTurns(intervalsA, intervalsB, labelA, labelB);

    stats.speakerA = speakerSummary(labelA, intervalsA, stats.turns, durationSec);
    stats.speakerB = speakerSummary(labelB, intervalsB, stats.turns, durationSec);

    ResponseTimes responses = computeResponseTimes(stats.turns, labelA, labelB);
    stats.speakerA.responseTimes = std::move(responses.speakerA);
    stats.speakerB.responseTimes = std::move(responses.speakerB);

    stats.interruptions = detectInterruptions(intervalsA, intervalsB, labelA, labelB);
    for (const auto& interruption : stats.interruptions) {
        SpeakerStats& interrupter =
            interruption.interrupter == labelA ? stats.speakerA : stats.speakerB;
        SpeakerStats& interrupted =
            interruption.interrupter == labelA ? stats.speakerB : stats.speakerA;

        interrupter.interruptionsMade++;
        interrupted.timesInterrupted++;
        interrupted.yieldingLatencies.push_back(interruption.yieldingLatency);
    }

    stats.totalOverlapSec = computeOverlap(intervalsA, intervalsB);
    stats.overlapPct = percentOf(stats.totalOverlapSec, durationSec);

    const SilenceSummary silence = computeSilence(intervalsA, intervalsB, durationSec);
    stats.totalSilenceSec = silence.total;
    stats.silencePct = percentOf(silence.total, durationSec);
    stats.numPauses = silence.count;
    stats.avgPauseDuration = silence.average;
    stats.longestPause = silence.longest;

    return stats;
}

ConversationAnalyzer::ConversationAnalyzer(std::shared_ptr<const audio::SpeechSegmenter> segmenter,
                                           const audio::SegmenterConfig& config,
                                           const std::string& labelA, const std::string& labelB)
    : segmenter_(std::move(segmenter)), config_(config), labelA_(labelA), labelB_(labelB) {
    if (!segmenter_) {
        throw std::invalid_argument("ConversationAnalyzer requires a segmenter");
    }
    if (!config_.isValid()) {
        throw std::invalid_argument("Invalid segmenter configuration");
    }
    if (labelA_ == labelB_) {
        throw std::invalid_argument("Speaker labels must differ, both are '" + labelA_ + "'");
    }
}

ChannelSegments ConversationAnalyzer::segmentChannels(const std::vector<float>& left,
                                                      const std::vector<float>& right,
                                                      int sampleRate) const {
    if (left.size() != right.size()) {
        throw std::invalid_argument("Channel lengths differ: " + std::to_string(left.size()) +
                                    " vs " + std::to_string(right.size()));
    }

    ChannelSegments segments;
    segments.speakerA = segmenter_->detectSpeech(left, sampleRate, config_);
    segments.speakerB = segmenter_->detectSpeech(right, sampleRate, config_);

    utils::Logger::debug(labelA_ + ": " + std::to_string(segments.speakerA.size()) +
                         " speech segments (" + segmenter_->name() + ")");
    utils::Logger::debug(labelB_ + ": " + std::to_string(segments.speakerB.size()) +
                         " speech segments (" + segmenter_->name() + ")");
    return segments;
}

ConversationStats ConversationAnalyzer::analyze(const std::vector<float>& left,
                                                const std::vector<float>& right,
                                                int sampleRate) const {
    ChannelSegments segments = segmentChannels(left, right, sampleRate);
    const double durationSec =
        sampleRate > 0 ? static_cast<double>(left.size()) / sampleRate : 0.0;
    return computeStats(segments.speakerA, segments.speakerB, durationSec, labelA_, labelB_);
}

} // namespace analysis
} // namespace convo
