#pragma once

#include "audio/speech_segmenter.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace convo {
namespace audio {

/**
 * A frame-level speech probability model. Implementations must be safe to
 * call concurrently: any recurrent state lives inside a single call.
 */
class SpeechProbabilityModel {
public:
    virtual ~SpeechProbabilityModel() = default;

    virtual int sampleRate() const = 0;
    virtual size_t windowSamples() const = 0;

    // One probability per window; a trailing partial window is zero-padded.
    virtual std::vector<float> windowProbabilities(const std::vector<float>& samples) const = 0;
};

/**
 * Silero VAD (v5) ONNX model. Loaded once, then shared read-only between
 * segmenters and threads.
 */
class SileroModel : public SpeechProbabilityModel {
public:
    static constexpr int kSampleRate = 16000;
    static constexpr size_t kWindowSamples = 512;
    static constexpr size_t kContextSamples = 64;
    static constexpr size_t kStateSize = 2 * 1 * 128;

    // Throws ModelLoadingException if the file is missing or not a valid model.
    static std::shared_ptr<const SileroModel> load(const std::string& modelPath);

    ~SileroModel() override;

    int sampleRate() const override { return kSampleRate; }
    size_t windowSamples() const override { return kWindowSamples; }
    std::vector<float> windowProbabilities(const std::vector<float>& samples) const override;

    const std::string& getModelPath() const { return modelPath_; }

private:
    explicit SileroModel(const std::string& modelPath);

    // ONNX Runtime components (kept out of the header)
    class OnnxSession;
    std::unique_ptr<OnnxSession> onnxSession_;
    std::string modelPath_;
};

// Hysteresis and padding applied when turning window probabilities into spans
struct SileroSpanParams {
    float threshold = 0.5f;
    float negThreshold = 0.35f;
    int minSilenceMs = 100;
    int speechPadMs = 30;
};

/**
 * Learned-model segmentation: resample to the model rate, score each window,
 * turn the probabilities into raw speech spans, then merge short gaps and
 * drop short spans (in that order, in seconds).
 */
class SileroSegmenter : public SpeechSegmenter {
public:
    using SpanParams = SileroSpanParams;

    explicit SileroSegmenter(std::shared_ptr<const SpeechProbabilityModel> model,
                             const SpanParams& params = SpanParams{});

    SpeechIntervals detectSpeech(const std::vector<float>& signal, int sampleRate,
                                 const SegmenterConfig& config) const override;

    std::string name() const override { return "silero"; }

    // Raw spans (seconds) from per-window probabilities over totalSamples
    // samples at modelRate.
    static SpeechIntervals probabilitiesToSpans(const std::vector<float>& probabilities,
                                                size_t windowSamples, size_t totalSamples,
                                                int modelRate, const SpanParams& params);

private:
    std::shared_ptr<const SpeechProbabilityModel> model_;
    SpanParams params_;
};

} // namespace audio
} // namespace convo
