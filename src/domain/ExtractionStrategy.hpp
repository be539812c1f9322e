/**
 * @file ExtractionStrategy.hpp
 * @brief Interface for a single text extraction attempt.
 */

#pragma once
#include <string>
#include <utility>
#include <vector>
#include "domain/PipelineError.hpp"

namespace docingest::domain {

/**
 * @struct StrategyResult
 * @brief Result of one extraction attempt: text on success, a typed cause otherwise.
 */
struct StrategyResult {
    bool success = false;
    std::string text;
    ErrorKind errorKind = ErrorKind::EngineFailure;
    std::string error;
    std::vector<std::string> warnings;

    static StrategyResult Ok(std::string text) {
        StrategyResult r;
        r.success = true;
        r.text = std::move(text);
        return r;
    }

    static StrategyResult Fail(ErrorKind kind, std::string message) {
        StrategyResult r;
        r.success = false;
        r.errorKind = kind;
        r.error = std::move(message);
        return r;
    }
};

/**
 * @class ExtractionStrategy
 * @brief Abstract extractor for one file type. Implementations only read the input file.
 */
class ExtractionStrategy {
public:
    virtual ~ExtractionStrategy() = default;

    /** @brief Stable identifier reported as ExtractionResult::strategyUsed. */
    virtual std::string name() const = 0;

    /**
     * @brief Extracts text from a local file.
     * @param localPath Existing, non-empty file.
     */
    virtual StrategyResult extract(const std::string& localPath) = 0;
};

} // namespace docingest::domain
