#include "analysis/timing_analyzer.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace convo {
namespace analysis {

ResponseTimes computeResponseTimes(const std::vector<Turn>& turns, const std::string& labelA,
                                   const std::string& labelB) {
    ResponseTimes times;
    for (size_t i = 1; i < turns.size(); ++i) {
        const Turn& previous = turns[i - 1];
        const Turn& current = turns[i];
        if (previous.speaker == current.speaker) {
            continue;
        }

        const double gap = current.start - previous.end;
        if (gap <= 0.0) {
            continue;
        }

        if (current.speaker == labelA) {
            times.speakerA.push_back(gap);
        } else if (current.speaker == labelB) {
            times.speakerB.push_back(gap);
        }
    }
    return times;
}

double computeOverlap(const audio::SpeechIntervals& intervalsA,
                      const audio::SpeechIntervals& intervalsB) {
    double total = 0.0;
    for (const auto& a : intervalsA) {
        for (const auto& b : intervalsB) {
            const double overlapStart = std::max(a.start, b.start);
            const double overlapEnd = std::min(a.end, b.end);
            if (overlapEnd > overlapStart) {
                total += overlapEnd - overlapStart;
            }
        }
    }
    return total;
}

audio::SpeechIntervals mergeTimeline(const audio::SpeechIntervals& intervalsA,
                                     const audio::SpeechIntervals& intervalsB) {
    audio::SpeechIntervals all;
    all.reserve(intervalsA.size() + intervalsB.size());
    all.insert(all.end(), intervalsA.begin(), intervalsA.end());
    all.insert(all.end(), intervalsB.begin(), intervalsB.end());

    std::sort(all.begin(), all.end(),
              [](const audio::SpeechInterval& lhs, const audio::SpeechInterval& rhs) {
                  return lhs.start < rhs.start || (lhs.start == rhs.start && lhs.end < rhs.end);
              });

    audio::SpeechIntervals merged;
    for (const auto& interval : all) {
        if (!merged.empty() && interval.start <= merged.back().end) {
            merged.back().end = std::max(merged.back().end, interval.end);
        } else {
            merged.push_back(interval);
        }
    }
    return merged;
}

SilenceSummary computeSilence(const audio::SpeechIntervals& intervalsA,
                              const audio::SpeechIntervals& intervalsB, double durationSec) {
    if (durationSec < 0.0) {
        throw std::invalid_argument("Recording duration must not be negative");
    }

    SilenceSummary summary;
    const audio::SpeechIntervals merged = mergeTimeline(intervalsA, intervalsB);

    if (merged.empty()) {
        summary.total = durationSec;
        summary.count = durationSec > 0.0 ? 1 : 0;
        summary.average = durationSec;
        summary.longest = durationSec;
        return summary;
    }

    std::vector<double> pauses;
    if (merged.front().start > 0.0) {
        pauses.push_back(merged.front().start);
    }
    for (size_t i = 1; i < merged.size(); ++i) {
        const double gap = merged[i].start - merged[i - 1].end;
        if (gap > 0.0) {
            pauses.push_back(gap);
        }
    }
    if (merged.back().end < durationSec) {
        pauses.push_back(durationSec - merged.back().end);
    }

    if (pauses.empty()) {
        return summary;
    }

    summary.total = std::accumulate(pauses.begin(), pauses.end(), 0.0);
    summary.count = pauses.size();
    summary.average = summary.total / static_cast<double>(pauses.size());
    summary.longest = *std::max_element(pauses.begin(), pauses.end());
    return summary;
}

} // namespace analysis
} // namespace convo
