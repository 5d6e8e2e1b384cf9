#pragma once

#include "analysis/conversation_types.hpp"
#include "audio/speech_interval.hpp"

#include <string>
#include <vector>

namespace convo {
namespace analysis {

struct ResponseTimes {
    std::vector<double> speakerA;
    std::vector<double> speakerB;
};

/**
 * Positive gaps between adjacent turns of different speakers, credited to the
 * speaker who starts the later turn. A zero or negative gap is an overlap
 * boundary and contributes no sample.
 */
ResponseTimes computeResponseTimes(const std::vector<Turn>& turns, const std::string& labelA,
                                   const std::string& labelB);

// Total time both speakers are active, summed over every interval pair.
double computeOverlap(const audio::SpeechIntervals& intervalsA,
                      const audio::SpeechIntervals& intervalsB);

/**
 * Pauses are the gaps in the union of both speakers' activity, including the
 * leading and trailing gaps up to durationSec. With no activity at all the
 * whole recording is one pause. A negative duration throws
 * std::invalid_argument.
 */
SilenceSummary computeSilence(const audio::SpeechIntervals& intervalsA,
                              const audio::SpeechIntervals& intervalsB, double durationSec);

// Union of both speakers' activity as sorted, disjoint intervals
audio::SpeechIntervals mergeTimeline(const audio::SpeechIntervals& intervalsA,
                                     const audio::SpeechIntervals& intervalsB);

} // namespace analysis
} // namespace convo
