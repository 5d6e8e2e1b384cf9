#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/json_utils.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

#ifndef CONVO_SILERO_MODEL_PATH
#define CONVO_SILERO_MODEL_PATH "models/silero_vad.onnx"
#endif

namespace convo {
namespace utils {

namespace {

int readMilliseconds(const JsonValue& section, const std::string& key, int fallback) {
    double value = section.getNumber(key, fallback);
    if (value != std::floor(value)) {
        throw std::runtime_error("'" + key + "' must be a whole number of milliseconds");
    }
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw std::runtime_error("'" + key + "' is out of range");
    }
    return static_cast<int>(value);
}

bool isLogLevelName(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return name == "DEBUG" || name == "INFO" || name == "WARN" || name == "WARNING" ||
           name == "ERROR";
}

} // namespace

Config::Config()
    : vadStrategy_("energy"), frameMs_(30), minSpeechMs_(200), minSilenceMs_(300),
      modelPath_(CONVO_SILERO_MODEL_PATH), speakerA_("Human"), speakerB_("Maya"),
      logLevel_("INFO") {
}

Config Config::load(const std::string& configPath) {
    if (!std::filesystem::exists(configPath)) {
        Logger::debug("Configuration file not found, using defaults: " + configPath);
        return Config();
    }

    std::ifstream file(configPath);
    if (!file.is_open()) {
        throw ConfigurationException("Failed to open configuration file", configPath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    Config config = fromJson(buffer.str(), configPath);
    Logger::info("Loaded configuration from: " + configPath);
    return config;
}

Config Config::fromJson(const std::string& jsonContent, const std::string& source) {
    Config config;
    try {
        JsonValue root = JsonParser::parse(jsonContent);
        if (!root.isObject()) {
            throw std::runtime_error("top-level value must be an object");
        }
        config.applyJson(root, source);
    } catch (const ConfigurationException&) {
        throw;
    } catch (const std::exception& e) {
        throw ConfigurationException("Invalid configuration (" + std::string(e.what()) + ")", source);
    }

    config.validate();
    return config;
}

void Config::applyJson(const JsonValue& root, const std::string& source) {
    const JsonValue& vad = root.getProperty("vad");
    if (vad.isObject()) {
        vadStrategy_ = vad.getString("strategy", vadStrategy_);
        frameMs_ = readMilliseconds(vad, "frameMs", frameMs_);
        minSpeechMs_ = readMilliseconds(vad, "minSpeechMs", minSpeechMs_);
        minSilenceMs_ = readMilliseconds(vad, "minSilenceMs", minSilenceMs_);
        modelPath_ = vad.getString("modelPath", modelPath_);

        const JsonValue& threshold = vad.getProperty("threshold");
        if (threshold.isNumber()) {
            threshold_ = threshold.asNumber();
        } else if (threshold.isString() && threshold.asString() == "auto") {
            threshold_.reset();
        } else if (!threshold.isNull()) {
            throw ConfigurationException("'vad.threshold' must be a number or \"auto\"", source);
        }
    } else if (!vad.isNull()) {
        throw ConfigurationException("'vad' must be an object", source);
    }

    const JsonValue& speakers = root.getProperty("speakers");
    if (speakers.isObject()) {
        speakerA_ = speakers.getString("a", speakerA_);
        speakerB_ = speakers.getString("b", speakerB_);
    } else if (!speakers.isNull()) {
        throw ConfigurationException("'speakers' must be an object", source);
    }

    logLevel_ = root.getString("logLevel", logLevel_);
}

void Config::validate() const {
    if (vadStrategy_ != "energy" && vadStrategy_ != "silero") {
        throw ConfigurationException("Unknown VAD strategy '" + vadStrategy_ +
                                     "' (expected \"energy\" or \"silero\")");
    }
    if (frameMs_ <= 0) {
        throw ConfigurationException("Frame size must be positive, got " + std::to_string(frameMs_));
    }
    if (minSpeechMs_ < 0 || minSilenceMs_ < 0) {
        throw ConfigurationException("Minimum speech and silence durations must not be negative");
    }
    if (threshold_ && *threshold_ < 0.0) {
        throw ConfigurationException("Detection threshold must not be negative");
    }
    if (speakerA_.empty() || speakerB_.empty()) {
        throw ConfigurationException("Speaker labels must not be empty");
    }
    if (speakerA_ == speakerB_) {
        throw ConfigurationException("Speaker labels must differ, both are '" + speakerA_ + "'");
    }
    if (!isLogLevelName(logLevel_)) {
        throw ConfigurationException("Unknown log level '" + logLevel_ +
                                     "' (expected DEBUG, INFO, WARN or ERROR)");
    }
}

} // namespace utils
} // namespace convo
