#pragma once

#include "analysis/conversation_types.hpp"
#include "audio/speech_interval.hpp"

#include <string>
#include <vector>

namespace convo {
namespace analysis {

/**
 * Pools both speakers' intervals in start order (ties keep A before B and
 * the input order within a speaker) and folds them into turns: an interval
 * from the open turn's speaker extends it, any other speaker opens a new one.
 * Turns of different speakers may overlap in time.
 */
std::vector<Turn> buildTurns(const audio::SpeechIntervals& intervalsA,
                             const audio::SpeechIntervals& intervalsB,
                             const std::string& labelA, const std::string& labelB);

} // namespace analysis
} // namespace convo
