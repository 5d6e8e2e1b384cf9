#include "analysis/turn_builder.hpp"

#include <algorithm>

namespace convo {
namespace analysis {

namespace {

struct TaggedInterval {
    double start;
    double end;
    const std::string* speaker;
};

} // namespace

std::vector<Turn> buildTurns(const audio::SpeechIntervals& intervalsA,
                             const audio::SpeechIntervals& intervalsB,
                             const std::string& labelA, const std::string& labelB) {
    std::vector<TaggedInterval> events;
    events.reserve(intervalsA.size() + intervalsB.size());
    for (const auto& interval : intervalsA) {
        events.push_back({interval.start, interval.end, &labelA});
    }
    for (const auto& interval : intervalsB) {
        events.push_back({interval.start, interval.end, &labelB});
    }

    std::stable_sort(events.begin(), events.end(),
                     [](const TaggedInterval& lhs, const TaggedInterval& rhs) {
                         return lhs.start < rhs.start;
                     });

    std::vector<Turn> turns;
    for (const auto& event : events) {
        if (!turns.empty() && turns.back().speaker == *event.speaker) {
            turns.back().end = std::max(turns.back().end, event.end);
        } else {
            turns.push_back(Turn{*event.speaker, event.start, event.end});
        }
    }
    return turns;
}

} // namespace analysis
} // namespace convo
