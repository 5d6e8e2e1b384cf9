#pragma once

#include "analysis/conversation_types.hpp"
#include "utils/json_utils.hpp"

#include <string>
#include <vector>

namespace convo {
namespace analysis {

// A speaker change with a positive gap, keyed at the end of the previous turn.
struct ResponseEntry {
    double at = 0.0;
    std::string from;
    std::string to;
    double gap = 0.0;
};

class StatsReport {
public:
    static utils::JsonValue toJson(const ConversationStats& stats);
    static std::string toJsonString(const ConversationStats& stats, int indent = 2);

    // Metric table with one column per speaker, followed by the
    // conversation-wide overlap, silence and pause rows.
    static std::string formatSummary(const ConversationStats& stats);

    // One line per turn: speaker, start, end (m:ss.ss) and duration
    static std::string formatTurns(const ConversationStats& stats);

    static std::vector<ResponseEntry> responseEntries(const ConversationStats& stats);

    // At / A -> B / B -> A table, one row per responseEntries() item
    static std::string formatResponseTimes(const ConversationStats& stats);

    // Writes toJsonString() to path; throws std::runtime_error on I/O failure.
    static void writeJson(const ConversationStats& stats, const std::string& path);

    static std::string formatClock(double seconds);

private:
    static utils::JsonValue distributionJson(const DistributionSummary& summary);
    static utils::JsonValue speakerJson(const SpeakerStats& speaker);
};

} // namespace analysis
} // namespace convo
