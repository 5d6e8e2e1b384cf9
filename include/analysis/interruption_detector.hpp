#pragma once

#include "analysis/conversation_types.hpp"
#include "audio/speech_interval.hpp"

#include <string>
#include <vector>

namespace convo {
namespace analysis {

// Interruptions of `interrupted` by `interrupter`, one per interrupter interval
// at most, in interrupter interval order.
std::vector<Interruption> findInterruptions(const audio::SpeechIntervals& interrupterIntervals,
                                            const audio::SpeechIntervals& interruptedIntervals,
                                            const std::string& interrupterLabel,
                                            const std::string& interruptedLabel);

/**
 * An interval of X interrupts an interval of Y when Y.start < X.start < Y.end.
 * Both directions are scanned (B interrupting A first) and the combined list
 * is stably sorted by start time.
 */
std::vector<Interruption> detectInterruptions(const audio::SpeechIntervals& intervalsA,
                                              const audio::SpeechIntervals& intervalsB,
                                              const std::string& labelA,
                                              const std::string& labelB);

} // namespace analysis
} // namespace convo
