#include <gtest/gtest.h>
#include "audio/energy_segmenter.hpp"
#include "../fixtures/test_data_generator.hpp"

#include <stdexcept>
#include <vector>

using namespace convo::audio;

class EnergySegmenterTest : public ::testing::Test {
protected:
    static constexpr int kSampleRate = 16000;

    std::vector<float> channel(double duration, const fixtures::ActiveSpans& spans) const {
        return generator_.generateChannel(duration, kSampleRate, spans);
    }

    fixtures::TestDataGenerator generator_;
    EnergySegmenter segmenter_;
    SegmenterConfig config_;
};

TEST_F(EnergySegmenterTest, FramesToRunsMergesShortGaps) {
    std::vector<bool> frames = {false, true, true, false, false, true, true, true, false};

    auto runs = EnergySegmenter::framesToRuns(frames, 3, 2);
    ASSERT_EQ(runs.size(), 1u);
    EXPECT_EQ(runs[0], (FrameRun{1, 8}));
}

TEST_F(EnergySegmenterTest, FramesToRunsKeepsGapAtMinimumSilence) {
    std::vector<bool> frames = {false, true, true, false, false, true, true, true, false};

    auto runs = EnergySegmenter::framesToRuns(frames, 2, 2);
    ASSERT_EQ(runs.size(), 2u);
    EXPECT_EQ(runs[0], (FrameRun{1, 3}));
    EXPECT_EQ(runs[1], (FrameRun{5, 8}));
}

TEST_F(EnergySegmenterTest, FramesToRunsDropsShortRuns) {
    std::vector<bool> frames = {false, true, true, false, false, true, true, true, false};

    auto runs = EnergySegmenter::framesToRuns(frames, 2, 3);
    ASSERT_EQ(runs.size(), 1u);
    EXPECT_EQ(runs[0], (FrameRun{5, 8}));
}

TEST_F(EnergySegmenterTest, FramesToRunsEdgeCases) {
    EXPECT_TRUE(EnergySegmenter::framesToRuns({}, 1, 1).empty());
    EXPECT_TRUE(EnergySegmenter::framesToRuns({false, false, false}, 1, 1).empty());

    auto all = EnergySegmenter::framesToRuns({true, true, true, true}, 1, 1);
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0], (FrameRun{0, 4}));

    // Speech running to the last frame closes at the frame count
    auto trailing = EnergySegmenter::framesToRuns({false, true, true}, 1, 1);
    ASSERT_EQ(trailing.size(), 1u);
    EXPECT_EQ(trailing[0], (FrameRun{1, 3}));
}

TEST_F(EnergySegmenterTest, PercentileInterpolatesLinearly) {
    std::vector<double> values = {4.0, 1.0, 3.0, 2.0};

    EXPECT_DOUBLE_EQ(EnergySegmenter::percentile(values, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(EnergySegmenter::percentile(values, 50.0), 2.5);
    EXPECT_DOUBLE_EQ(EnergySegmenter::percentile(values, 100.0), 4.0);
    EXPECT_NEAR(EnergySegmenter::percentile(values, 30.0), 1.9, 1e-12);
    EXPECT_DOUBLE_EQ(EnergySegmenter::percentile({}, 50.0), 0.0);
}

TEST_F(EnergySegmenterTest, AutoThresholdSitsBetweenFloorAndPeak) {
    std::vector<double> rms(100, 0.0);
    for (size_t i = 70; i < 100; ++i) {
        rms[i] = 1.0;
    }
    // Floor (30th percentile) is 0, peak (95th) is 1
    EXPECT_NEAR(EnergySegmenter::autoThreshold(rms), 0.4, 1e-12);

    // Constant level falls back to the floor
    EXPECT_DOUBLE_EQ(EnergySegmenter::autoThreshold(std::vector<double>(10, 0.2)), 0.2);
    EXPECT_DOUBLE_EQ(EnergySegmenter::autoThreshold({}), 0.0);
}

TEST_F(EnergySegmenterTest, FrameRmsIgnoresPartialFrame) {
    std::vector<float> signal(1000, 0.5f);
    auto rms = EnergySegmenter::computeFrameRms(signal, 480);

    ASSERT_EQ(rms.size(), 2u);
    EXPECT_NEAR(rms[0], 0.5, 1e-9);
    EXPECT_NEAR(rms[1], 0.5, 1e-9);
    EXPECT_TRUE(EnergySegmenter::computeFrameRms(signal, 0).empty());
}

TEST_F(EnergySegmenterTest, DetectsSingleToneBurst) {
    auto signal = channel(3.0, {{0.6, 1.5}});

    auto intervals = segmenter_.detectSpeech(signal, kSampleRate, config_);

    ASSERT_EQ(intervals.size(), 1u);
    EXPECT_NEAR(intervals[0].start, 0.6, 1e-9);
    EXPECT_NEAR(intervals[0].end, 1.5, 1e-9);
}

TEST_F(EnergySegmenterTest, BridgesGapShorterThanMinimumSilence) {
    auto signal = channel(3.0, {{0.6, 0.9}, {1.05, 1.5}});

    auto intervals = segmenter_.detectSpeech(signal, kSampleRate, config_);

    ASSERT_EQ(intervals.size(), 1u);
    EXPECT_NEAR(intervals[0].start, 0.6, 1e-9);
    EXPECT_NEAR(intervals[0].end, 1.5, 1e-9);
}

TEST_F(EnergySegmenterTest, SeparatesGapLongerThanMinimumSilence) {
    auto signal = channel(4.0, {{0.6, 1.5}, {2.1, 3.0}});

    auto intervals = segmenter_.detectSpeech(signal, kSampleRate, config_);

    ASSERT_EQ(intervals.size(), 2u);
    EXPECT_NEAR(intervals[0].end, 1.5, 1e-9);
    EXPECT_NEAR(intervals[1].start, 2.1, 1e-9);
    EXPECT_LT(intervals[0].end, intervals[1].start);
}

TEST_F(EnergySegmenterTest, DropsBurstShorterThanMinimumSpeech) {
    auto signal = channel(3.0, {{0.6, 0.72}});

    EXPECT_TRUE(segmenter_.detectSpeech(signal, kSampleRate, config_).empty());
}

TEST_F(EnergySegmenterTest, FixedThresholdAboveSignalFindsNothing) {
    auto signal = channel(3.0, {{0.6, 1.5}});
    config_.threshold = 0.5; // tone RMS is about 0.35

    EXPECT_TRUE(segmenter_.detectSpeech(signal, kSampleRate, config_).empty());

    config_.threshold = 0.1;
    EXPECT_EQ(segmenter_.detectSpeech(signal, kSampleRate, config_).size(), 1u);
}

TEST_F(EnergySegmenterTest, ToneOverWholeSignalIsOneInterval) {
    fixtures::AudioCharacteristics tone;
    tone.frequency = 440.0f;
    auto signal = generator_.generateTone(2.0, kSampleRate, tone);
    config_.threshold = 0.1;

    auto intervals = segmenter_.detectSpeech(signal, kSampleRate, config_);

    // 32000 samples hold 66 complete 480-sample frames
    const size_t frames = signal.size() / 480;
    ASSERT_EQ(frames, 66u);
    ASSERT_EQ(intervals.size(), 1u);
    EXPECT_DOUBLE_EQ(intervals[0].start, 0.0);
    EXPECT_DOUBLE_EQ(intervals[0].end, frames * config_.frameMs / 1000.0);
}

TEST_F(EnergySegmenterTest, ConstantLevelWithAutoThresholdFindsNothing) {
    // Every frame has the same RMS, so the threshold equals it and no frame
    // is strictly louder.
    std::vector<float> signal(2 * kSampleRate, 0.5f);
    auto rms = EnergySegmenter::computeFrameRms(signal, 480);
    ASSERT_FALSE(rms.empty());
    EXPECT_DOUBLE_EQ(EnergySegmenter::autoThreshold(rms), rms.front());

    EXPECT_TRUE(segmenter_.detectSpeech(signal, kSampleRate, config_).empty());

    config_.threshold = 0.25;
    auto intervals = segmenter_.detectSpeech(signal, kSampleRate, config_);
    ASSERT_EQ(intervals.size(), 1u);
    EXPECT_DOUBLE_EQ(intervals[0].start, 0.0);
    EXPECT_DOUBLE_EQ(intervals[0].end, 66 * config_.frameMs / 1000.0);
}

TEST_F(EnergySegmenterTest, SilenceAndShortInputYieldNothing) {
    EXPECT_TRUE(segmenter_.detectSpeech({}, kSampleRate, config_).empty());
    EXPECT_TRUE(segmenter_.detectSpeech(std::vector<float>(100, 0.3f), kSampleRate, config_).empty());
    EXPECT_TRUE(segmenter_.detectSpeech(generator_.generateSilence(2.0, kSampleRate),
                                        kSampleRate, config_).empty());
    EXPECT_TRUE(segmenter_.detectSpeech(channel(1.0, {{0.1, 0.9}}), 0, config_).empty());
}

TEST_F(EnergySegmenterTest, IntervalsAreOrderedAndLongEnough) {
    auto signal = channel(6.0, {{0.3, 0.9}, {1.5, 1.6}, {2.4, 3.6}, {4.5, 5.7}});

    auto intervals = segmenter_.detectSpeech(signal, kSampleRate, config_);

    ASSERT_FALSE(intervals.empty());
    for (size_t i = 0; i < intervals.size(); ++i) {
        EXPECT_GE(intervals[i].duration(), config_.minSpeechMs / 1000.0 - 1e-9);
        if (i > 0) {
            EXPECT_LE(intervals[i - 1].end, intervals[i].start);
        }
    }
}

TEST_F(EnergySegmenterTest, RejectsInvalidArguments) {
    auto signal = channel(1.0, {{0.1, 0.9}});

    EXPECT_THROW(segmenter_.detectSpeech(signal, -16000, config_), std::invalid_argument);

    config_.frameMs = 0;
    EXPECT_THROW(segmenter_.detectSpeech(signal, kSampleRate, config_), std::invalid_argument);
}
