#include "analysis/stats_report.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace convo {
namespace analysis {

namespace {

std::string seconds(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value << "s";
    return oss.str();
}

std::string secondsWithPct(double value, double pct) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value << "s (" << std::setprecision(1) << pct
        << "%)";
    return oss.str();
}

class TableWriter {
public:
    TableWriter(std::ostringstream& out, size_t labelWidth, size_t columnWidth)
        : out_(out), labelWidth_(labelWidth), columnWidth_(columnWidth) {}

    void row(const std::string& label, const std::string& a, const std::string& b) {
        out_ << std::left << std::setw(static_cast<int>(labelWidth_)) << label
             << std::setw(static_cast<int>(columnWidth_)) << a << b << "\n";
    }

    void wide(const std::string& label, const std::string& value) {
        out_ << std::left << std::setw(static_cast<int>(labelWidth_)) << label << value << "\n";
    }

private:
    std::ostringstream& out_;
    size_t labelWidth_;
    size_t columnWidth_;
};

} // namespace

utils::JsonValue StatsReport::distributionJson(const DistributionSummary& summary) {
    utils::JsonValue json = utils::JsonValue::object();
    json.set("count", utils::JsonValue(summary.count));
    json.set("mean", utils::JsonValue(summary.mean));
    json.set("median", utils::JsonValue(summary.median));
    json.set("std", utils::JsonValue(summary.stddev));
    json.set("min", utils::JsonValue(summary.min));
    json.set("max", utils::JsonValue(summary.max));
    return json;
}

utils::JsonValue StatsReport::speakerJson(const SpeakerStats& speaker) {
    utils::JsonValue json = utils::JsonValue::object();
    json.set("label", utils::JsonValue(speaker.label));
    json.set("totalTalkTime", utils::JsonValue(speaker.totalTalkTime));
    json.set("talkTimePct", utils::JsonValue(speaker.talkTimePct));
    json.set("numTurns", utils::JsonValue(speaker.numTurns));
    json.set("turnDuration", distributionJson(speaker.turnDurationStats()));
    json.set("responseTime", distributionJson(speaker.responseTimeStats()));
    json.set("interruptionsMade", utils::JsonValue(speaker.interruptionsMade));
    json.set("timesInterrupted", utils::JsonValue(speaker.timesInterrupted));
    json.set("yieldingLatency", distributionJson(speaker.yieldingLatencyStats()));

    utils::JsonValue responses = utils::JsonValue::array();
    for (double value : speaker.responseTimes) {
        responses.push(utils::JsonValue(value));
    }
    json.set("responseTimes", responses);
    return json;
}

utils::JsonValue StatsReport::toJson(const ConversationStats& stats) {
    utils::JsonValue root = utils::JsonValue::object();
    root.set("durationSec", utils::JsonValue(stats.durationSec));
    root.set("speakerA", speakerJson(stats.speakerA));
    root.set("speakerB", speakerJson(stats.speakerB));

    utils::JsonValue overlap = utils::JsonValue::object();
    overlap.set("totalSec", utils::JsonValue(stats.totalOverlapSec));
    overlap.set("pct", utils::JsonValue(stats.overlapPct));
    root.set("overlap", overlap);

    utils::JsonValue silence = utils::JsonValue::object();
    silence.set("totalSec", utils::JsonValue(stats.totalSilenceSec));
    silence.set("pct", utils::JsonValue(stats.silencePct));
    silence.set("numPauses", utils::JsonValue(stats.numPauses));
    silence.set("avgPauseSec", utils::JsonValue(stats.avgPauseDuration));
    silence.set("longestPauseSec", utils::JsonValue(stats.longestPause));
    root.set("silence", silence);

    utils::JsonValue turns = utils::JsonValue::array();
    for (const auto& turn : stats.turns) {
        utils::JsonValue entry = utils::JsonValue::object();
        entry.set("speaker", utils::JsonValue(turn.speaker));
        entry.set("start", utils::JsonValue(turn.start));
        entry.set("end", utils::JsonValue(turn.end));
        turns.push(entry);
    }
    root.set("turns", turns);

    utils::JsonValue interruptions = utils::JsonValue::array();
    for (const auto& interruption : stats.interruptions) {
        utils::JsonValue entry = utils::JsonValue::object();
        entry.set("interrupter", utils::JsonValue(interruption.interrupter));
        entry.set("interrupted", utils::JsonValue(interruption.interrupted));
        entry.set("startTime", utils::JsonValue(interruption.startTime));
        entry.set("yieldingLatency", utils::JsonValue(interruption.yieldingLatency));
        interruptions.push(entry);
    }
    root.set("interruptions", interruptions);

    utils::JsonValue responses = utils::JsonValue::array();
    for (const auto& response : responseEntries(stats)) {
        utils::JsonValue entry = utils::JsonValue::object();
        entry.set("at", utils::JsonValue(response.at));
        entry.set("from", utils::JsonValue(response.from));
        entry.set("to", utils::JsonValue(response.to));
        entry.set("gap", utils::JsonValue(response.gap));
        responses.push(entry);
    }
    root.set("responses", responses);

    return root;
}

std::string StatsReport::toJsonString(const ConversationStats& stats, int indent) {
    return utils::JsonParser::stringify(toJson(stats), indent);
}

std::string StatsReport::formatSummary(const ConversationStats& stats) {
    const SpeakerStats& a = stats.speakerA;
    const SpeakerStats& b = stats.speakerB;
    const DistributionSummary turnsA = a.turnDurationStats();
    const DistributionSummary turnsB = b.turnDurationStats();
    const DistributionSummary responseA = a.responseTimeStats();
    const DistributionSummary responseB = b.responseTimeStats();
    const DistributionSummary yieldA = a.yieldingLatencyStats();
    const DistributionSummary yieldB = b.yieldingLatencyStats();

    std::ostringstream out;
    TableWriter table(out, 26, 22);

    table.row("Metric", a.label, b.label);
    table.row("Total talk time", secondsWithPct(a.totalTalkTime, a.talkTimePct),
              secondsWithPct(b.totalTalkTime, b.talkTimePct));
    table.row("Number of turns", std::to_string(a.numTurns), std::to_string(b.numTurns));
    table.row("Avg turn duration", seconds(turnsA.mean), seconds(turnsB.mean));
    table.row("Median turn duration", seconds(turnsA.median), seconds(turnsB.median));
    table.row("Min / Max turn", seconds(turnsA.min) + " / " + seconds(turnsA.max),
              seconds(turnsB.min) + " / " + seconds(turnsB.max));
    table.row("Avg response time", seconds(responseA.mean), seconds(responseB.mean));
    table.row("Median response time", seconds(responseA.median), seconds(responseB.median));
    table.row("Std response time", seconds(responseA.stddev), seconds(responseB.stddev));
    table.row("Min / Max response time", seconds(responseA.min) + " / " + seconds(responseA.max),
              seconds(responseB.min) + " / " + seconds(responseB.max));
    table.row("Interruptions made", std::to_string(a.interruptionsMade),
              std::to_string(b.interruptionsMade));
    table.row("Times interrupted", std::to_string(a.timesInterrupted),
              std::to_string(b.timesInterrupted));
    table.row("Avg yielding latency", seconds(yieldA.mean), seconds(yieldB.mean));
    table.row("Median yielding latency", seconds(yieldA.median), seconds(yieldB.median));

    table.wide("Total overlap", secondsWithPct(stats.totalOverlapSec, stats.overlapPct));
    table.wide("Total silence", secondsWithPct(stats.totalSilenceSec, stats.silencePct));
    table.wide("Pauses", std::to_string(stats.numPauses) + " pauses, avg " +
                             seconds(stats.avgPauseDuration) + ", longest " +
                             seconds(stats.longestPause));
    return out.str();
}

std::string StatsReport::formatTurns(const ConversationStats& stats) {
    std::ostringstream out;
    for (const auto& turn : stats.turns) {
        out << std::left << std::setw(16) << turn.speaker << formatClock(turn.start) << " - "
            << formatClock(turn.end) << "  " << seconds(turn.duration()) << "\n";
    }
    return out.str();
}

std::vector<ResponseEntry> StatsReport::responseEntries(const ConversationStats& stats) {
    std::vector<ResponseEntry> entries;
    for (size_t i = 1; i < stats.turns.size(); ++i) {
        const Turn& prev = stats.turns[i - 1];
        const Turn& curr = stats.turns[i];
        if (prev.speaker == curr.speaker) {
            continue;
        }
        const double gap = curr.start - prev.end;
        if (gap <= 0.0) {
            continue;
        }
        entries.push_back(ResponseEntry{prev.end, prev.speaker, curr.speaker, gap});
    }
    return entries;
}

std::string StatsReport::formatResponseTimes(const ConversationStats& stats) {
    const std::string& a = stats.speakerA.label;
    const std::string& b = stats.speakerB.label;

    std::ostringstream out;
    TableWriter table(out, 12, 22);
    table.row("At", a + " -> " + b, b + " -> " + a);
    for (const auto& entry : responseEntries(stats)) {
        char gap[32];
        std::snprintf(gap, sizeof(gap), "%.3fs", entry.gap);
        const bool fromA = entry.from == a;
        table.row(formatClock(entry.at), fromA ? gap : "", fromA ? "" : gap);
    }
    return out.str();
}

void StatsReport::writeJson(const ConversationStats& stats, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open output file: " + path);
    }
    file << toJsonString(stats) << "\n";
    if (!file) {
        throw std::runtime_error("Failed to write output file: " + path);
    }
}

std::string StatsReport::formatClock(double seconds) {
    // Round first so 119.999 becomes 2:00.00 rather than 1:60.00
    const long hundredths = std::lround(std::max(0.0, seconds) * 100.0);
    const long minutes = hundredths / 6000;
    const double rest = static_cast<double>(hundredths % 6000) / 100.0;

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%ld:%05.2f", minutes, rest);
    return buffer;
}

} // namespace analysis
} // namespace convo
