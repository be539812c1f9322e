/**
 * @file ExtractionOutcome.hpp
 * @brief Terminal values produced by the extraction pipeline.
 */

#pragma once
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "domain/PipelineError.hpp"

namespace docingest::domain {

/**
 * @struct ExtractionResult
 * @brief Successfully extracted text. An empty text is valid and distinct from failure.
 */
struct ExtractionResult {
    std::string text;
    std::string strategyUsed;
    std::vector<std::string> warnings;
};

/** @brief Signals that the resolved format has no extraction chain. */
struct UnsupportedFormat {
    std::string resolvedTag;
};

struct ExtractionFailure {
    ErrorKind kind;
    std::string message;
};

/**
 * @class ExtractionOutcome
 * @brief Sum type {Success | Unsupported | Failure} returned to callers.
 */
class ExtractionOutcome {
public:
    static ExtractionOutcome Success(ExtractionResult result) {
        return ExtractionOutcome(std::move(result));
    }

    static ExtractionOutcome Unsupported(const std::string& resolvedTag) {
        return ExtractionOutcome(UnsupportedFormat{resolvedTag});
    }

    static ExtractionOutcome Failure(ErrorKind kind, const std::string& message) {
        return ExtractionOutcome(ExtractionFailure{kind, message});
    }

    bool isSuccess() const { return std::holds_alternative<ExtractionResult>(m_value); }
    bool isUnsupported() const { return std::holds_alternative<UnsupportedFormat>(m_value); }
    bool isFailure() const { return std::holds_alternative<ExtractionFailure>(m_value); }

    const ExtractionResult& result() const { return std::get<ExtractionResult>(m_value); }
    ExtractionResult& result() { return std::get<ExtractionResult>(m_value); }
    const UnsupportedFormat& unsupported() const { return std::get<UnsupportedFormat>(m_value); }
    const ExtractionFailure& failure() const { return std::get<ExtractionFailure>(m_value); }

    /** @brief One-line description for logs and action responses. */
    std::string describe() const {
        if (isSuccess()) {
            return "extracted " + std::to_string(result().text.size()) + " chars via " + result().strategyUsed;
        }
        if (isUnsupported()) {
            return "unsupported format '" + unsupported().resolvedTag + "'";
        }
        return ErrorKindToString(failure().kind) + ": " + failure().message;
    }

private:
    using Value = std::variant<ExtractionResult, UnsupportedFormat, ExtractionFailure>;

    explicit ExtractionOutcome(Value value) : m_value(std::move(value)) {}

    Value m_value;
};

} // namespace docingest::domain
