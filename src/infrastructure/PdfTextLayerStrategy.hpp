/**
 * @file PdfTextLayerStrategy.hpp
 * @brief Embedded text layer of PDF documents (poppler-cpp).
 */

#pragma once
#include "domain/ExtractionStrategy.hpp"

namespace docingest::infrastructure {

/**
 * @class PdfTextLayerStrategy
 * @brief Concatenates the text of every page, each followed by "\n".
 *
 * Scanned documents yield only newlines; the chain's quality gate decides
 * whether OCR runs next.
 */
class PdfTextLayerStrategy : public domain::ExtractionStrategy {
public:
    std::string name() const override { return "pdf-text"; }
    domain::StrategyResult extract(const std::string& localPath) override;
};

} // namespace docingest::infrastructure
