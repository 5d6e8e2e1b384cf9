#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace convo {
namespace analysis {

// A maximal span of one speaker's activity after merging that speaker's
// consecutive intervals.
struct Turn {
    std::string speaker;
    double start = 0.0;
    double end = 0.0;

    double duration() const { return end - start; }
};

// One speaker starting while the other is still mid-interval
struct Interruption {
    std::string interrupter;
    std::string interrupted;
    double startTime = 0.0;
    double yieldingLatency = 0.0; // interrupted interval end - startTime
};

// Descriptive statistics of a sample set; all zero when the set is empty.
struct DistributionSummary {
    size_t count = 0;
    double mean = 0.0;
    double median = 0.0;
    double stddev = 0.0; // population
    double min = 0.0;
    double max = 0.0;

    static DistributionSummary summarize(const std::vector<double>& samples);
};

struct SpeakerStats {
    std::string label;
    double totalTalkTime = 0.0;
    double talkTimePct = 0.0;
    size_t numTurns = 0;
    std::vector<double> turnDurations;
    std::vector<double> responseTimes;
    size_t interruptionsMade = 0;
    size_t timesInterrupted = 0;
    std::vector<double> yieldingLatencies; // latencies when this speaker was interrupted

    DistributionSummary turnDurationStats() const {
        return DistributionSummary::summarize(turnDurations);
    }
    DistributionSummary responseTimeStats() const {
        return DistributionSummary::summarize(responseTimes);
    }
    DistributionSummary yieldingLatencyStats() const {
        return DistributionSummary::summarize(yieldingLatencies);
    }
};

struct SilenceSummary {
    double total = 0.0;
    size_t count = 0;
    double average = 0.0;
    double longest = 0.0;
};

struct ConversationStats {
    double durationSec = 0.0;
    SpeakerStats speakerA;
    SpeakerStats speakerB;
    std::vector<Turn> turns;
    std::vector<Interruption> interruptions;
    double totalOverlapSec = 0.0;
    double overlapPct = 0.0;
    double totalSilenceSec = 0.0;
    double silencePct = 0.0;
    size_t numPauses = 0;
    double avgPauseDuration = 0.0;
    double longestPause = 0.0;
};

} // namespace analysis
} // namespace convo
