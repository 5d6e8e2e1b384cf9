#pragma once

#include <optional>
#include <string>

namespace convo {
namespace utils {

class JsonValue;

/**
 * Analyzer settings. Defaults match the command line defaults; a JSON file
 * may override any subset of them:
 *
 * {
 *   "vad": { "strategy": "energy", "frameMs": 30, "threshold": "auto",
 *            "minSpeechMs": 200, "minSilenceMs": 300, "modelPath": "..." },
 *   "speakers": { "a": "Human", "b": "Maya" },
 *   "logLevel": "INFO"
 * }
 */
class Config {
public:
    Config();

    // Missing file yields defaults; unreadable or malformed content throws
    // ConfigurationException.
    static Config load(const std::string& configPath);
    static Config fromJson(const std::string& jsonContent, const std::string& source = "inline");

    const std::string& getVadStrategy() const { return vadStrategy_; }
    int getFrameMs() const { return frameMs_; }
    const std::optional<double>& getThreshold() const { return threshold_; }
    int getMinSpeechMs() const { return minSpeechMs_; }
    int getMinSilenceMs() const { return minSilenceMs_; }
    const std::string& getModelPath() const { return modelPath_; }
    const std::string& getSpeakerA() const { return speakerA_; }
    const std::string& getSpeakerB() const { return speakerB_; }
    const std::string& getLogLevel() const { return logLevel_; }

    void setVadStrategy(const std::string& strategy) { vadStrategy_ = strategy; }
    void setFrameMs(int frameMs) { frameMs_ = frameMs; }
    void setThreshold(std::optional<double> threshold) { threshold_ = threshold; }
    void setMinSpeechMs(int ms) { minSpeechMs_ = ms; }
    void setMinSilenceMs(int ms) { minSilenceMs_ = ms; }
    void setModelPath(const std::string& path) { modelPath_ = path; }
    void setSpeakerA(const std::string& label) { speakerA_ = label; }
    void setSpeakerB(const std::string& label) { speakerB_ = label; }
    void setLogLevel(const std::string& level) { logLevel_ = level; }

    // Throws ConfigurationException describing the first invalid field.
    void validate() const;

private:
    void applyJson(const JsonValue& root, const std::string& source);

    std::string vadStrategy_;
    int frameMs_;
    std::optional<double> threshold_;
    int minSpeechMs_;
    int minSilenceMs_;
    std::string modelPath_;
    std::string speakerA_;
    std::string speakerB_;
    std::string logLevel_;
};

} // namespace utils
} // namespace convo
