#pragma once

#include <stdexcept>
#include <string>

namespace photo_finish {

enum class Severity {
    Fatal,
    Recoverable
};

class PhotoFinishError : public std::runtime_error {
public:
    explicit PhotoFinishError(const std::string& message,
                              Severity severity = Severity::Fatal)
        : std::runtime_error(message), severity_(severity), full_message_(message) {}

    Severity severity() const { return severity_; }
    bool is_fatal() const { return severity_ == Severity::Fatal; }

    const std::string& stage() const { return stage_; }
    const std::string& image_id() const { return image_id_; }

    // Attach the failing stage and image so callers can retry or skip.
    void set_context(const std::string& stage, const std::string& image_id) {
        stage_ = stage;
        image_id_ = image_id;
        full_message_ = "[" + stage_ + "] " + image_id_ + ": " + std::runtime_error::what();
    }

    const char* what() const noexcept override { return full_message_.c_str(); }

private:
    Severity severity_;
    std::string stage_;
    std::string image_id_;
    std::string full_message_;
};

class ConfigError : public PhotoFinishError {
public:
    explicit ConfigError(const std::string& message)
        : PhotoFinishError("Config error: " + message) {}
};

class ValidationError : public PhotoFinishError {
public:
    explicit ValidationError(const std::string& message)
        : PhotoFinishError("Validation error: " + message) {}
};

class IOError : public PhotoFinishError {
public:
    explicit IOError(const std::string& message)
        : PhotoFinishError("I/O error: " + message) {}
};

class EmptySubjectError : public PhotoFinishError {
public:
    explicit EmptySubjectError(const std::string& message)
        : PhotoFinishError("Empty subject: " + message) {}
};

class InsufficientSubjectError : public PhotoFinishError {
public:
    explicit InsufficientSubjectError(const std::string& message)
        : PhotoFinishError("Insufficient subject: " + message) {}
};

class DimensionMismatchError : public PhotoFinishError {
public:
    explicit DimensionMismatchError(const std::string& message)
        : PhotoFinishError("Dimension mismatch: " + message) {}
};

// Recovered locally by the tone predictor; never aborts a run.
class ModelUnavailableError : public PhotoFinishError {
public:
    explicit ModelUnavailableError(const std::string& message)
        : PhotoFinishError("Model unavailable: " + message, Severity::Recoverable) {}
};

class StopRequested : public PhotoFinishError {
public:
    StopRequested() : PhotoFinishError("Stop requested by caller") {}
};

} // namespace photo_finish
