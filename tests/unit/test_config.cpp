#include <gtest/gtest.h>
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "../fixtures/test_data_generator.hpp"

#include <cstdio>
#include <fstream>

using namespace convo::utils;

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        if (!path_.empty()) {
            std::remove(path_.c_str());
        }
    }

    std::string writeConfig(const std::string& content) {
        path_ = fixtures::TestDataGenerator::tempPath("config.json");
        std::ofstream file(path_);
        file << content;
        return path_;
    }

    std::string path_;
};

TEST_F(ConfigTest, DefaultValues) {
    auto config = Config::load("nonexistent.json");
    EXPECT_EQ(config.getVadStrategy(), "energy");
    EXPECT_EQ(config.getFrameMs(), 30);
    EXPECT_FALSE(config.getThreshold().has_value());
    EXPECT_EQ(config.getMinSpeechMs(), 200);
    EXPECT_EQ(config.getMinSilenceMs(), 300);
    EXPECT_EQ(config.getSpeakerA(), "Human");
    EXPECT_EQ(config.getSpeakerB(), "Maya");
    EXPECT_EQ(config.getLogLevel(), "INFO");
    EXPECT_FALSE(config.getModelPath().empty());
    EXPECT_NO_THROW(config.validate());
}

TEST_F(ConfigTest, LoadsOverridesFromFile) {
    auto config = Config::load(writeConfig(R"({
        "vad": { "strategy": "silero", "frameMs": 20, "threshold": 0.02,
                 "minSpeechMs": 250, "minSilenceMs": 400, "modelPath": "/models/vad.onnx" },
        "speakers": { "a": "Caller", "b": "Agent" },
        "logLevel": "DEBUG"
    })"));

    EXPECT_EQ(config.getVadStrategy(), "silero");
    EXPECT_EQ(config.getFrameMs(), 20);
    ASSERT_TRUE(config.getThreshold().has_value());
    EXPECT_DOUBLE_EQ(*config.getThreshold(), 0.02);
    EXPECT_EQ(config.getMinSpeechMs(), 250);
    EXPECT_EQ(config.getMinSilenceMs(), 400);
    EXPECT_EQ(config.getModelPath(), "/models/vad.onnx");
    EXPECT_EQ(config.getSpeakerA(), "Caller");
    EXPECT_EQ(config.getSpeakerB(), "Agent");
    EXPECT_EQ(config.getLogLevel(), "DEBUG");
}

TEST_F(ConfigTest, PartialDocumentKeepsDefaults) {
    auto config = Config::fromJson(R"({"speakers": {"b": "Bot"}, "vad": {"threshold": "auto"}})");

    EXPECT_EQ(config.getSpeakerA(), "Human");
    EXPECT_EQ(config.getSpeakerB(), "Bot");
    EXPECT_FALSE(config.getThreshold().has_value());
    EXPECT_EQ(config.getFrameMs(), 30);
}

TEST_F(ConfigTest, MalformedContentThrows) {
    EXPECT_THROW(Config::fromJson("{ not json"), ConfigurationException);
    EXPECT_THROW(Config::fromJson("[1, 2]"), ConfigurationException);
    EXPECT_THROW(Config::fromJson(R"({"vad": {"frameMs": "thirty"}})"), ConfigurationException);
    EXPECT_THROW(Config::fromJson(R"({"vad": {"frameMs": 12.5}})"), ConfigurationException);
    EXPECT_THROW(Config::fromJson(R"({"vad": {"threshold": true}})"), ConfigurationException);
    EXPECT_THROW(Config::load(writeConfig("{")), ConfigurationException);
}

TEST_F(ConfigTest, ValidationRejectsInconsistentSettings) {
    EXPECT_THROW(Config::fromJson(R"({"vad": {"strategy": "webrtc"}})"), ConfigurationException);
    EXPECT_THROW(Config::fromJson(R"({"vad": {"frameMs": 0}})"), ConfigurationException);
    EXPECT_THROW(Config::fromJson(R"({"speakers": {"a": "Maya"}})"), ConfigurationException);

    Config config;
    config.setMinSilenceMs(-1);
    EXPECT_THROW(config.validate(), ConfigurationException);

    config = Config();
    config.setThreshold(-0.1);
    EXPECT_THROW(config.validate(), ConfigurationException);

    config = Config();
    config.setSpeakerA("");
    EXPECT_THROW(config.validate(), ConfigurationException);
}

TEST_F(ConfigTest, MillisecondsOutsideIntRangeAreRejected) {
    EXPECT_THROW(Config::fromJson(R"({"vad": {"frameMs": 1e12}})"), ConfigurationException);
    EXPECT_THROW(Config::fromJson(R"({"vad": {"minSilenceMs": -1e12}})"), ConfigurationException);

    try {
        Config::fromJson(R"({"vad": {"frameMs": 1e12}})");
        FAIL() << "expected ConfigurationException";
    } catch (const ConfigurationException& e) {
        EXPECT_NE(std::string(e.what()).find("out of range"), std::string::npos);
    }
}

TEST_F(ConfigTest, UnknownLogLevelIsRejected) {
    EXPECT_THROW(Config::fromJson(R"({"logLevel": "bogus"})"), ConfigurationException);
    EXPECT_NO_THROW(Config::fromJson(R"({"logLevel": "warning"})"));

    Config config;
    config.setLogLevel("verbose");
    EXPECT_THROW(config.validate(), ConfigurationException);
    config.setLogLevel("debug");
    EXPECT_NO_THROW(config.validate());
}
