#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace ff {

enum class ErrorKind : uint8_t {
    DATA_UNAVAILABLE,
    INSUFFICIENT_DATA,
    MALFORMED_RECORD,
    ARTIFACT_UNAVAILABLE,
    SCHEMA_MISMATCH,
    INVALID_CONFIG,
    STORAGE
};

const char* errorKindName(ErrorKind kind);

class PipelineError : public std::runtime_error {
    ErrorKind kind_;
    std::string stage_;
public:
    PipelineError(ErrorKind kind, std::string stage, const std::string& message)
        : std::runtime_error(message), kind_(kind), stage_(std::move(stage)) {}

    ErrorKind kind() const { return kind_; }
    const std::string& stage() const { return stage_; }

    // Only external I/O failures are worth retrying.
    bool retryable() const { return kind_ == ErrorKind::STORAGE; }
};

class DataUnavailableError : public PipelineError {
public:
    DataUnavailableError(std::string stage, const std::string& message)
        : PipelineError(ErrorKind::DATA_UNAVAILABLE, std::move(stage), message) {}
};

class InsufficientDataError : public PipelineError {
public:
    InsufficientDataError(std::string stage, const std::string& message)
        : PipelineError(ErrorKind::INSUFFICIENT_DATA, std::move(stage), message) {}
};

class ArtifactUnavailableError : public PipelineError {
public:
    ArtifactUnavailableError(std::string stage, const std::string& message)
        : PipelineError(ErrorKind::ARTIFACT_UNAVAILABLE, std::move(stage), message) {}
};

class SchemaMismatchError : public PipelineError {
public:
    SchemaMismatchError(std::string stage, const std::string& message)
        : PipelineError(ErrorKind::SCHEMA_MISMATCH, std::move(stage), message) {}
};

class InvalidConfigError : public PipelineError {
public:
    InvalidConfigError(std::string stage, const std::string& message)
        : PipelineError(ErrorKind::INVALID_CONFIG, std::move(stage), message) {}
};

class StorageError : public PipelineError {
public:
    StorageError(std::string stage, const std::string& message)
        : PipelineError(ErrorKind::STORAGE, std::move(stage), message) {}
};

} // namespace ff
