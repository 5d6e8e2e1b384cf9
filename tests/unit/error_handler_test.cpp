#include <gtest/gtest.h>
#include "utils/error_handler.hpp"
#include <stdexcept>
#include <system_error>
#include <thread>

using namespace convo::utils;

class ErrorHandlerTest : public ::testing::Test {};

TEST_F(ErrorHandlerTest, ErrorInfoCreation) {
    ErrorInfo error(ErrorCategory::AUDIO_LOADING, ErrorSeverity::ERROR,
                    "Test message", "Test details", "Test context");

    EXPECT_EQ(error.category, ErrorCategory::AUDIO_LOADING);
    EXPECT_EQ(error.severity, ErrorSeverity::ERROR);
    EXPECT_EQ(error.message, "Test message");
    EXPECT_EQ(error.details, "Test details");
    EXPECT_EQ(error.context, "Test context");
    EXPECT_FALSE(error.id.empty());
}

TEST_F(ErrorHandlerTest, ErrorInfoUniqueIds) {
    ErrorInfo error1(ErrorCategory::ANALYSIS, ErrorSeverity::WARNING, "Message 1");
    ErrorInfo error2(ErrorCategory::ANALYSIS, ErrorSeverity::WARNING, "Message 2");

    EXPECT_NE(error1.id, error2.id);
}

TEST_F(ErrorHandlerTest, ConvoExceptionBasic) {
    ErrorInfo error(ErrorCategory::SEGMENTATION, ErrorSeverity::ERROR,
                    "Segmentation failed", "Model not loaded");

    ConvoException exception(error);

    EXPECT_STREQ(exception.what(), "Segmentation failed: Model not loaded");
    EXPECT_EQ(exception.getErrorInfo().category, ErrorCategory::SEGMENTATION);
}

TEST_F(ErrorHandlerTest, SpecificExceptions) {
    AudioLoadingException audio_ex("Not a RIFF/WAVE file", "call.wav");
    EXPECT_EQ(audio_ex.getErrorInfo().category, ErrorCategory::AUDIO_LOADING);
    EXPECT_EQ(audio_ex.getErrorInfo().details, "call.wav");

    SegmentationException seg_ex("Inference failed", "silero");
    EXPECT_EQ(seg_ex.getErrorInfo().category, ErrorCategory::SEGMENTATION);
    EXPECT_EQ(seg_ex.getErrorInfo().context, "silero");

    ModelLoadingException model_ex("Failed to load model", "/path/to/model");
    EXPECT_EQ(model_ex.getErrorInfo().category, ErrorCategory::MODEL_LOADING);
    EXPECT_EQ(model_ex.getErrorInfo().severity, ErrorSeverity::CRITICAL);
    EXPECT_EQ(model_ex.getErrorInfo().details, "/path/to/model");

    ConfigurationException config_ex("Bad frame size", "analyzer.json");
    EXPECT_EQ(config_ex.getErrorInfo().category, ErrorCategory::CONFIGURATION);
    EXPECT_STREQ(config_ex.what(), "Bad frame size: analyzer.json");
}

TEST_F(ErrorHandlerTest, ClassifyKeepsKnownExceptionInfo) {
    ErrorInfo info = ErrorHandler::classify(
        ModelLoadingException("Silero VAD model not found", "vad.onnx"), "segmenter_setup");

    EXPECT_EQ(info.category, ErrorCategory::MODEL_LOADING);
    EXPECT_EQ(info.severity, ErrorSeverity::CRITICAL);
    EXPECT_EQ(info.details, "vad.onnx");
    EXPECT_EQ(info.context, "segmenter_setup");
}

TEST_F(ErrorHandlerTest, ClassifyMapsStandardExceptions) {
    EXPECT_EQ(ErrorHandler::classify(std::invalid_argument("Speaker labels must differ")).category,
              ErrorCategory::ANALYSIS);
    EXPECT_EQ(ErrorHandler::classify(
                  std::system_error(std::make_error_code(std::errc::io_error))).category,
              ErrorCategory::SYSTEM);

    ErrorInfo unknown = ErrorHandler::classify(std::runtime_error("Unexpected"));
    EXPECT_EQ(unknown.category, ErrorCategory::UNKNOWN);
    EXPECT_EQ(unknown.severity, ErrorSeverity::ERROR);
    EXPECT_EQ(unknown.message, "Unexpected");
}

TEST_F(ErrorHandlerTest, ClassifyPicksUpCurrentContext) {
    ErrorContext ctx("loading_audio");

    EXPECT_EQ(ErrorHandler::classify(std::runtime_error("boom")).context, "loading_audio");
    EXPECT_EQ(ErrorHandler::classify(AudioLoadingException("bad header", "call.wav")).context,
              "loading_audio");
    EXPECT_EQ(ErrorHandler::classify(std::runtime_error("boom"), "explicit").context, "explicit");
}

TEST_F(ErrorHandlerTest, ReportingDoesNotThrow) {
    const auto& handler = ErrorHandler::getInstance();

    EXPECT_NO_THROW(handler.reportError(
        ErrorInfo(ErrorCategory::AUDIO_LOADING, ErrorSeverity::WARNING, "Truncated data chunk")));
    EXPECT_NO_THROW(handler.reportError(ConfigurationException("Unknown option", "--bogus")));
}

TEST(ErrorContextTest, NestedContexts) {
    EXPECT_TRUE(ErrorContext::getCurrentContext().empty());
    {
        ErrorContext ctx1("outer_context");
        EXPECT_EQ(ErrorContext::getCurrentContext(), "outer_context");

        {
            ErrorContext ctx2("inner_context");
            EXPECT_EQ(ErrorContext::getCurrentContext(), "inner_context");
        }

        EXPECT_EQ(ErrorContext::getCurrentContext(), "outer_context");
    }

    EXPECT_TRUE(ErrorContext::getCurrentContext().empty());
}

TEST(ErrorContextTest, ThreadLocalStorage) {
    std::string main_context;
    std::string thread_context;

    {
        ErrorContext ctx("main_context");
        main_context = ErrorContext::getCurrentContext();

        std::thread t([&]() {
            // Thread should start with empty context
            EXPECT_TRUE(ErrorContext::getCurrentContext().empty());

            ErrorContext thread_ctx("thread_context");
            thread_context = ErrorContext::getCurrentContext();
        });

        t.join();
    }

    EXPECT_EQ(main_context, "main_context");
    EXPECT_EQ(thread_context, "thread_context");
}
