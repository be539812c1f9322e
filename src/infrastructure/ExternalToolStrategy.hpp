/**
 * @file ExternalToolStrategy.hpp
 * @brief Extraction strategy backed by a command-line converter (catdoc, antiword, xls2csv).
 */

#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "domain/ExtractionStrategy.hpp"

namespace docingest::infrastructure {

/**
 * @class ExternalToolStrategy
 * @brief Runs a converter that prints the document text on stdout.
 *
 * The argument list is the tool's options; the input path is appended last.
 * A missing tool is reported as EngineMissing, a non-zero exit or timeout as EngineFailure.
 */
class ExternalToolStrategy : public domain::ExtractionStrategy {
public:
    using OutputFilter = std::function<std::string(const std::string&)>;

    ExternalToolStrategy(std::string strategyName,
                         std::string tool,
                         std::vector<std::string> options,
                         std::chrono::seconds timeout,
                         OutputFilter filter = nullptr);

    std::string name() const override { return m_name; }
    domain::StrategyResult extract(const std::string& localPath) override;

    /** @brief catdoc with UTF-8 output and no line wrapping. */
    static std::shared_ptr<ExternalToolStrategy> Catdoc(std::chrono::seconds timeout);

    /** @brief antiword, UTF-8 mapping. */
    static std::shared_ptr<ExternalToolStrategy> Antiword(std::chrono::seconds timeout);

    /** @brief xls2csv emitting tab-separated, unquoted rows. */
    static std::shared_ptr<ExternalToolStrategy> Xls2Csv(std::chrono::seconds timeout);

    /**
     * @brief Normalises xls2csv output: sheet separators (form feeds) removed,
     * CRLF collapsed, every row terminated by "\n".
     */
    static std::string NormalizeSheetRows(const std::string& raw);

private:
    std::string m_name;
    std::string m_tool;
    std::vector<std::string> m_options;
    std::chrono::seconds m_timeout;
    OutputFilter m_filter;
};

} // namespace docingest::infrastructure
