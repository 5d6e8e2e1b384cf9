#include "analysis/interruption_detector.hpp"

#include <algorithm>

namespace convo {
namespace analysis {

std::vector<Interruption> findInterruptions(const audio::SpeechIntervals& interrupterIntervals,
                                            const audio::SpeechIntervals& interruptedIntervals,
                                            const std::string& interrupterLabel,
                                            const std::string& interruptedLabel) {
    std::vector<Interruption> found;
    for (const auto& attempt : interrupterIntervals) {
        for (const auto& ongoing : interruptedIntervals) {
            if (attempt.start > ongoing.start && attempt.start < ongoing.end) {
                found.push_back(Interruption{interrupterLabel, interruptedLabel, attempt.start,
                                             ongoing.end - attempt.start});
                break;
            }
        }
    }
    return found;
}

std::vector<Interruption> detectInterruptions(const audio::SpeechIntervals& intervalsA,
                                              const audio::SpeechIntervals& intervalsB,
                                              const std::string& labelA,
                                              const std::string& labelB) {
    std::vector<Interruption> interruptions = findInterruptions(intervalsB, intervalsA, labelB, labelA);
    std::vector<Interruption> byA = findInterruptions(intervalsA, intervalsB, labelA, labelB);
    interruptions.insert(interruptions.end(), byA.begin(), byA.end());

    std::stable_sort(interruptions.begin(), interruptions.end(),
                     [](const Interruption& lhs, const Interruption& rhs) {
                         return lhs.startTime < rhs.startTime;
                     });
    return interruptions;
}

} // namespace analysis
} // namespace convo
