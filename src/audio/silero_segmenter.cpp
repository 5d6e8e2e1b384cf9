#include "audio/silero_segmenter.hpp"
#include "audio/resampler.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include <onnxruntime_cxx_api.h>

#include <algorithm>
#include <array>
#include <filesystem>
#include <stdexcept>

namespace convo {
namespace audio {

/**
 * ONNX Runtime session wrapper for the silero-vad model
 */
class SileroModel::OnnxSession {
public:
    explicit OnnxSession(const std::string& modelPath)
        : env_(ORT_LOGGING_LEVEL_WARNING, "SileroVAD"),
          memoryInfo_(Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault)) {
        Ort::SessionOptions sessionOptions;
        sessionOptions.SetIntraOpNumThreads(1);
        sessionOptions.SetInterOpNumThreads(1);
        sessionOptions.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);

        session_ = std::make_unique<Ort::Session>(env_, modelPath.c_str(), sessionOptions);

        if (session_->GetInputCount() != kInputNames.size() ||
            session_->GetOutputCount() != kOutputNames.size()) {
            throw std::runtime_error("unexpected model signature (" +
                                     std::to_string(session_->GetInputCount()) + " inputs, " +
                                     std::to_string(session_->GetOutputCount()) +
                                     " outputs); a Silero VAD v5 model is required");
        }
    }

    // Runs the model over every window of `samples`, threading the recurrent
    // state and the 64-sample context through consecutive windows.
    std::vector<float> run(const std::vector<float>& samples) {
        const size_t windowCount = (samples.size() + kWindowSamples - 1) / kWindowSamples;
        std::vector<float> probabilities;
        probabilities.reserve(windowCount);

        std::vector<float> state(kStateSize, 0.0f);
        std::vector<float> input(kContextSamples + kWindowSamples, 0.0f);
        std::array<int64_t, 1> sampleRate = {kSampleRate};

        const std::array<int64_t, 2> inputShape = {1, static_cast<int64_t>(input.size())};
        const std::array<int64_t, 3> stateShape = {2, 1, 128};
        const std::array<int64_t, 1> srShape = {1};

        for (size_t window = 0; window < windowCount; ++window) {
            const size_t offset = window * kWindowSamples;
            const size_t available = std::min(kWindowSamples, samples.size() - offset);

            std::fill(input.begin() + kContextSamples, input.end(), 0.0f);
            std::copy(samples.begin() + offset, samples.begin() + offset + available,
                      input.begin() + kContextSamples);

            std::array<Ort::Value, 3> inputs = {
                Ort::Value::CreateTensor<float>(memoryInfo_, input.data(), input.size(),
                                                inputShape.data(), inputShape.size()),
                Ort::Value::CreateTensor<float>(memoryInfo_, state.data(), state.size(),
                                                stateShape.data(), stateShape.size()),
                Ort::Value::CreateTensor<int64_t>(memoryInfo_, sampleRate.data(), sampleRate.size(),
                                                  srShape.data(), srShape.size())};

            auto outputs = session_->Run(Ort::RunOptions{nullptr}, kInputNames.data(), inputs.data(),
                                         inputs.size(), kOutputNames.data(), kOutputNames.size());

            probabilities.push_back(outputs[0].GetTensorData<float>()[0]);

            const float* nextState = outputs[1].GetTensorData<float>();
            std::copy(nextState, nextState + kStateSize, state.begin());

            // The tail of this window becomes the context of the next one
            std::copy(input.end() - kContextSamples, input.end(), input.begin());
        }

        return probabilities;
    }

private:
    static constexpr std::array<const char*, 3> kInputNames = {"input", "state", "sr"};
    static constexpr std::array<const char*, 2> kOutputNames = {"output", "stateN"};

    Ort::Env env_;
    Ort::MemoryInfo memoryInfo_;
    std::unique_ptr<Ort::Session> session_;
};

SileroModel::SileroModel(const std::string& modelPath) : modelPath_(modelPath) {}

SileroModel::~SileroModel() = default;

std::shared_ptr<const SileroModel> SileroModel::load(const std::string& modelPath) {
    if (modelPath.empty() || !std::filesystem::exists(modelPath)) {
        throw utils::ModelLoadingException("Silero VAD model not found", modelPath);
    }

    std::shared_ptr<SileroModel> model(new SileroModel(modelPath));
    try {
        model->onnxSession_ = std::make_unique<OnnxSession>(modelPath);
    } catch (const std::exception& e) {
        throw utils::ModelLoadingException("Failed to load Silero VAD model (" +
                                               std::string(e.what()) + ")",
                                           modelPath);
    }

    utils::Logger::info("Silero VAD model loaded: " + modelPath);
    return model;
}

std::vector<float> SileroModel::windowProbabilities(const std::vector<float>& samples) const {
    if (samples.empty()) {
        return {};
    }
    try {
        return onnxSession_->run(samples);
    } catch (const Ort::Exception& e) {
        throw utils::SegmentationException("Silero VAD inference failed: " + std::string(e.what()),
                                           "SileroModel");
    }
}

SileroSegmenter::SileroSegmenter(std::shared_ptr<const SpeechProbabilityModel> model,
                                 const SpanParams& params)
    : model_(std::move(model)), params_(params) {
    if (!model_) {
        throw std::invalid_argument("SileroSegmenter requires a loaded model");
    }
    if (params_.negThreshold > params_.threshold) {
        throw std::invalid_argument("Negative threshold must not exceed the speech threshold");
    }
}

SpeechIntervals SileroSegmenter::detectSpeech(const std::vector<float>& signal, int sampleRate,
                                              const SegmenterConfig& config) const {
    if (sampleRate < 0) {
        throw std::invalid_argument("Sample rate must not be negative: " +
                                    std::to_string(sampleRate));
    }
    if (!config.isValid()) {
        throw std::invalid_argument("Invalid segmenter configuration");
    }
    if (sampleRate == 0 || signal.empty()) {
        return {};
    }

    const int modelRate = model_->sampleRate();
    std::vector<float> resampled = RationalResampler::resample(signal, sampleRate, modelRate);

    if (resampled.size() < model_->windowSamples()) {
        utils::Logger::debug("Silero VAD: signal shorter than one model window, no speech");
        return {};
    }

    std::vector<float> probabilities = model_->windowProbabilities(resampled);
    SpeechIntervals raw = probabilitiesToSpans(probabilities, model_->windowSamples(),
                                               resampled.size(), modelRate, params_);

    SpeechIntervals intervals = mergeAndFilterSpans(raw, config.minSilenceMs / 1000.0,
                                                    config.minSpeechMs / 1000.0);

    utils::Logger::debug("Silero VAD: " + std::to_string(probabilities.size()) + " windows, " +
                         std::to_string(raw.size()) + " raw spans, " +
                         std::to_string(intervals.size()) + " segments");
    return intervals;
}

SpeechIntervals SileroSegmenter::probabilitiesToSpans(const std::vector<float>& probabilities,
                                                      size_t windowSamples, size_t totalSamples,
                                                      int modelRate, const SpanParams& params) {
    struct SampleSpan {
        size_t start;
        size_t end;
    };

    const size_t minSilenceSamples =
        static_cast<size_t>(static_cast<long long>(modelRate) * params.minSilenceMs / 1000);
    const size_t padSamples =
        static_cast<size_t>(static_cast<long long>(modelRate) * params.speechPadMs / 1000);

    std::vector<SampleSpan> spans;
    bool triggered = false;
    size_t spanStart = 0;
    size_t tentativeEnd = 0;
    bool haveTentativeEnd = false;

    for (size_t i = 0; i < probabilities.size(); ++i) {
        const float probability = probabilities[i];
        const size_t position = windowSamples * i;

        if (probability >= params.threshold) {
            haveTentativeEnd = false;
            if (!triggered) {
                triggered = true;
                spanStart = position;
            }
            continue;
        }

        if (probability < params.negThreshold && triggered) {
            if (!haveTentativeEnd) {
                tentativeEnd = position;
                haveTentativeEnd = true;
            }
            if (position - tentativeEnd >= minSilenceSamples) {
                spans.push_back({spanStart, tentativeEnd});
                triggered = false;
                haveTentativeEnd = false;
            }
        }
    }

    if (triggered && totalSamples > spanStart) {
        spans.push_back({spanStart, totalSamples});
    }

    // Pad each span, splitting the difference when neighbours are too close
    for (size_t i = 0; i < spans.size(); ++i) {
        if (i == 0) {
            spans[i].start = spans[i].start > padSamples ? spans[i].start - padSamples : 0;
        }
        if (i + 1 < spans.size()) {
            const size_t silence = spans[i + 1].start - spans[i].end;
            if (silence < 2 * padSamples) {
                spans[i].end += silence / 2;
                spans[i + 1].start -= silence / 2;
            } else {
                spans[i].end = std::min(totalSamples, spans[i].end + padSamples);
                spans[i + 1].start -= padSamples;
            }
        } else {
            spans[i].end = std::min(totalSamples, spans[i].end + padSamples);
        }
    }

    SpeechIntervals intervals;
    intervals.reserve(spans.size());
    for (const auto& span : spans) {
        if (span.end > span.start) {
            intervals.emplace_back(static_cast<double>(span.start) / modelRate,
                                   static_cast<double>(span.end) / modelRate);
        }
    }
    return intervals;
}

} // namespace audio
} // namespace convo
