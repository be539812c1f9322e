/**
 * @file PipelineError.hpp
 * @brief Error kinds and the exception used across collaborator boundaries.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace docingest::domain {

/**
 * @enum ErrorKind
 * @brief Categories of pipeline failures reported to callers.
 */
enum class ErrorKind {
    UnsupportedFormat,
    FileNotFound,
    EmptyFile,
    EngineMissing,
    EngineFailure,
    CompositeFailure,
    NetworkError,
    Timeout,
    HttpError,
    ParseError,
    PersistFailure,
    InvalidRequest
};

inline std::string ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnsupportedFormat: return "UnsupportedFormat";
        case ErrorKind::FileNotFound: return "FileNotFound";
        case ErrorKind::EmptyFile: return "EmptyFile";
        case ErrorKind::EngineMissing: return "EngineMissing";
        case ErrorKind::EngineFailure: return "EngineFailure";
        case ErrorKind::CompositeFailure: return "CompositeFailure";
        case ErrorKind::NetworkError: return "NetworkError";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::HttpError: return "HTTPError";
        case ErrorKind::ParseError: return "ParseError";
        case ErrorKind::PersistFailure: return "PersistFailure";
        case ErrorKind::InvalidRequest: return "InvalidRequest";
    }
    return "EngineFailure";
}

/**
 * @class PipelineError
 * @brief Exception thrown by adapters (fetcher, uploader, sink, catalog) with a typed kind.
 */
class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

} // namespace docingest::domain
