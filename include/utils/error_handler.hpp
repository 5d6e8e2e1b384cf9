#pragma once

#include <string>
#include <exception>
#include <chrono>

namespace convo {
namespace utils {

/**
 * Error severity levels
 */
enum class ErrorSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

/**
 * Error categories, one per stage of the analysis
 */
enum class ErrorCategory {
    AUDIO_LOADING,
    SEGMENTATION,
    MODEL_LOADING,
    ANALYSIS,
    CONFIGURATION,
    SYSTEM,
    UNKNOWN
};

std::string categoryName(ErrorCategory category);
std::string severityName(ErrorSeverity severity);

/**
 * Structured error information
 */
struct ErrorInfo {
    std::string id;
    ErrorCategory category;
    ErrorSeverity severity;
    std::string message;
    std::string details;
    std::string context;
    std::chrono::steady_clock::time_point timestamp;

    ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
              const std::string& det = "", const std::string& ctx = "");
};

/**
 * Base exception carrying an ErrorInfo
 */
class ConvoException : public std::exception {
public:
    explicit ConvoException(const ErrorInfo& error_info);
    const char* what() const noexcept override;
    const ErrorInfo& getErrorInfo() const { return error_info_; }

private:
    ErrorInfo error_info_;
    mutable std::string what_message_;
};

// Raised by the WAV loader for unreadable, unsupported or non-stereo input.
class AudioLoadingException : public ConvoException {
public:
    AudioLoadingException(const std::string& message, const std::string& path = "");
};

class SegmentationException : public ConvoException {
public:
    SegmentationException(const std::string& message, const std::string& context = "");
};

class ModelLoadingException : public ConvoException {
public:
    ModelLoadingException(const std::string& message, const std::string& model_path = "");
};

class ConfigurationException : public ConvoException {
public:
    ConfigurationException(const std::string& message, const std::string& source = "");
};

/**
 * Process-wide error sink used by the command line front end. The analysis
 * engine itself only throws; it never reports here.
 */
class ErrorHandler {
public:
    static ErrorHandler& getInstance();

    void reportError(const ErrorInfo& error) const;
    void reportError(const std::exception& e, const std::string& context = "") const;

    // Maps any exception onto an ErrorInfo. Known exceptions keep their own
    // category; an empty context falls back to the active ErrorContext.
    static ErrorInfo classify(const std::exception& e, const std::string& context = "");

private:
    ErrorHandler() = default;
    ~ErrorHandler() = default;
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    void logError(const ErrorInfo& error) const;
};

/**
 * RAII error context manager
 */
class ErrorContext {
public:
    explicit ErrorContext(const std::string& context);
    ~ErrorContext();

    static std::string getCurrentContext();

private:
    std::string previous_context_;

    static thread_local std::string current_context_;
};

} // namespace utils
} // namespace convo
