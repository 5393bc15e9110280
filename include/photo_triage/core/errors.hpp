#pragma once

#include <stdexcept>
#include <string>

namespace photo_triage {

class PhotoTriageError : public std::runtime_error {
public:
    explicit PhotoTriageError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public PhotoTriageError {
public:
    explicit ConfigError(const std::string& message)
        : PhotoTriageError("Config error: " + message) {}
};

class ValidationError : public ConfigError {
public:
    explicit ValidationError(const std::string& message)
        : ConfigError("validation: " + message) {}
};

class IOError : public PhotoTriageError {
public:
    explicit IOError(const std::string& message)
        : PhotoTriageError("I/O error: " + message) {}
};

class DecodeError : public PhotoTriageError {
public:
    explicit DecodeError(const std::string& message)
        : PhotoTriageError("Decode error: " + message) {}
};

class CacheIOError : public IOError {
public:
    explicit CacheIOError(const std::string& message)
        : IOError("cache: " + message) {}
};

class ModelError : public PhotoTriageError {
public:
    explicit ModelError(const std::string& message)
        : PhotoTriageError("Model error: " + message) {}
};

class EscalationError : public PhotoTriageError {
public:
    explicit EscalationError(const std::string& message)
        : PhotoTriageError("Escalation error: " + message) {}

    virtual const char* kind() const noexcept { return "EscalationError"; }
};

class EscalationTimeout : public EscalationError {
public:
    explicit EscalationTimeout(const std::string& message)
        : EscalationError("timeout: " + message) {}

    const char* kind() const noexcept override { return "EscalationTimeout"; }
};

class EscalationUnavailable : public EscalationError {
public:
    explicit EscalationUnavailable(const std::string& message)
        : EscalationError("service unavailable: " + message) {}

    const char* kind() const noexcept override { return "EscalationUnavailable"; }
};

class EscalationMalformedResponse : public EscalationError {
public:
    explicit EscalationMalformedResponse(const std::string& message)
        : EscalationError("malformed response: " + message) {}

    const char* kind() const noexcept override { return "EscalationMalformedResponse"; }
};

class PipelineError : public PhotoTriageError {
public:
    explicit PipelineError(const std::string& message)
        : PhotoTriageError("Pipeline error: " + message) {}
};

} // namespace photo_triage
