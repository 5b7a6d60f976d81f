/**
 * VOXRELAY - Realtime Voice Gateway
 * Pipeline Errors - Failure taxonomy shared by the orchestration layer
 *
 * - ValidationError: empty/malformed input (never retried, never trips the breaker)
 * - TransientBackendError: timeout, connection failure, 5xx (retried, counted)
 * - PermanentBackendError: explicit rejection such as quota (not retried, counted)
 * - BreakerOpenError: short-circuited call (not retried, not counted)
 * - CacheStoreError: backing store failure (degraded to a cache miss)
 */

#ifndef VOXRELAY_PIPELINE_ERRORS_HPP
#define VOXRELAY_PIPELINE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <string_view>

namespace voxrelay::pipeline {

/**
 * Base class for all orchestration-layer failures
 */
class PipelineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ValidationError : public PipelineError {
public:
    using PipelineError::PipelineError;
};

/**
 * Failure category of a backend call
 */
enum class BackendFailure {
    transient,
    permanent
};

inline std::string_view to_string(BackendFailure failure) {
    switch (failure) {
        case BackendFailure::transient: return "transient";
        case BackendFailure::permanent: return "permanent";
        default: return "unknown";
    }
}

/**
 * Failure reported by an external backend (synthesis or transcription)
 */
class BackendError : public PipelineError {
public:
    BackendError(BackendFailure category, const std::string& message)
        : PipelineError(message)
        , category_(category) {}

    BackendFailure category() const noexcept { return category_; }

private:
    BackendFailure category_;
};

class TransientBackendError : public BackendError {
public:
    explicit TransientBackendError(const std::string& message)
        : BackendError(BackendFailure::transient, message) {}
};

class PermanentBackendError : public BackendError {
public:
    explicit PermanentBackendError(const std::string& message)
        : BackendError(BackendFailure::permanent, message) {}
};

class BreakerOpenError : public PipelineError {
public:
    using PipelineError::PipelineError;
};

class CacheStoreError : public PipelineError {
public:
    using PipelineError::PipelineError;
};

} // namespace voxrelay::pipeline

#endif // VOXRELAY_PIPELINE_ERRORS_HPP
