#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace convo {
namespace utils {

thread_local std::string ErrorContext::current_context_;

std::string categoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::AUDIO_LOADING: return "AudioLoading";
        case ErrorCategory::SEGMENTATION: return "Segmentation";
        case ErrorCategory::MODEL_LOADING: return "ModelLoading";
        case ErrorCategory::ANALYSIS: return "Analysis";
        case ErrorCategory::CONFIGURATION: return "Configuration";
        case ErrorCategory::SYSTEM: return "System";
        case ErrorCategory::UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

std::string severityName(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::INFO: return "INFO";
        case ErrorSeverity::WARNING: return "WARN";
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
    }
    return "ERROR";
}

ErrorInfo::ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
                     const std::string& det, const std::string& ctx)
    : category(cat), severity(sev), message(msg), details(det), context(ctx),
      timestamp(std::chrono::steady_clock::now()) {

    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << "err_";
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    id = ss.str();
}

ConvoException::ConvoException(const ErrorInfo& error_info)
    : error_info_(error_info) {
}

const char* ConvoException::what() const noexcept {
    if (what_message_.empty()) {
        what_message_ = error_info_.message;
        if (!error_info_.details.empty()) {
            what_message_ += ": " + error_info_.details;
        }
    }
    return what_message_.c_str();
}

AudioLoadingException::AudioLoadingException(const std::string& message, const std::string& path)
    : ConvoException(ErrorInfo(ErrorCategory::AUDIO_LOADING, ErrorSeverity::ERROR,
                               message, path, "AudioLoading")) {
}

SegmentationException::SegmentationException(const std::string& message, const std::string& context)
    : ConvoException(ErrorInfo(ErrorCategory::SEGMENTATION, ErrorSeverity::ERROR,
                               message, "", context.empty() ? "Segmentation" : context)) {
}

ModelLoadingException::ModelLoadingException(const std::string& message, const std::string& model_path)
    : ConvoException(ErrorInfo(ErrorCategory::MODEL_LOADING, ErrorSeverity::CRITICAL,
                               message, model_path, "ModelLoading")) {
}

ConfigurationException::ConfigurationException(const std::string& message, const std::string& source)
    : ConvoException(ErrorInfo(ErrorCategory::CONFIGURATION, ErrorSeverity::ERROR,
                               message, source, "Configuration")) {
}

ErrorHandler& ErrorHandler::getInstance() {
    static ErrorHandler instance;
    return instance;
}

void ErrorHandler::reportError(const ErrorInfo& error) const {
    logError(error);
}

void ErrorHandler::reportError(const std::exception& e, const std::string& context) const {
    logError(classify(e, context));
}

ErrorInfo ErrorHandler::classify(const std::exception& e, const std::string& context) {
    const std::string ctx = context.empty() ? ErrorContext::getCurrentContext() : context;

    if (auto known = dynamic_cast<const ConvoException*>(&e)) {
        ErrorInfo info = known->getErrorInfo();
        if (!ctx.empty()) {
            info.context = ctx;
        }
        return info;
    }

    ErrorCategory category = ErrorCategory::UNKNOWN;
    if (dynamic_cast<const std::invalid_argument*>(&e)) {
        category = ErrorCategory::ANALYSIS;
    } else if (dynamic_cast<const std::system_error*>(&e)) {
        category = ErrorCategory::SYSTEM;
    }

    return ErrorInfo(category, ErrorSeverity::ERROR, e.what(), "", ctx);
}

void ErrorHandler::logError(const ErrorInfo& error) const {
    std::stringstream log_message;
    log_message << "[" << error.id << "] " << categoryName(error.category)
                << " - " << error.message;

    if (!error.details.empty()) {
        log_message << " | Details: " << error.details;
    }
    if (!error.context.empty()) {
        log_message << " | Context: " << error.context;
    }

    switch (error.severity) {
        case ErrorSeverity::INFO:
            Logger::info(log_message.str());
            break;
        case ErrorSeverity::WARNING:
            Logger::warn(log_message.str());
            break;
        case ErrorSeverity::ERROR:
        case ErrorSeverity::CRITICAL:
            Logger::error(log_message.str());
            break;
    }
}

ErrorContext::ErrorContext(const std::string& context)
    : previous_context_(current_context_) {
    current_context_ = context;
}

ErrorContext::~ErrorContext() {
    current_context_ = previous_context_;
}

std::string ErrorContext::getCurrentContext() {
    return current_context_;
}

} // namespace utils
} // namespace convo
