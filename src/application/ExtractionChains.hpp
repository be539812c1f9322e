/**
 * @file ExtractionChains.hpp
 * @brief Per-format strategy chains and their advance policies.
 */

#pragma once
#include <map>
#include <memory>
#include "application/StrategyChain.hpp"
#include "domain/DocumentFormat.hpp"

namespace docingest::application {

/**
 * @struct StandardStrategies
 * @brief Concrete extractors wired into the standard chains. Null members leave the step out.
 */
struct StandardStrategies {
    std::shared_ptr<domain::ExtractionStrategy> pdfTextLayer;
    std::shared_ptr<domain::ExtractionStrategy> pdfOcr;
    std::shared_ptr<domain::ExtractionStrategy> docx;
    std::shared_ptr<domain::ExtractionStrategy> docPrimary;
    std::shared_ptr<domain::ExtractionStrategy> docFallback;
    std::shared_ptr<domain::ExtractionStrategy> spreadsheet;
    std::shared_ptr<domain::ExtractionStrategy> legacySpreadsheet;
    std::shared_ptr<domain::ExtractionStrategy> imageOcr;
};

class ExtractionChains {
public:
    void set(domain::CanonicalFormat format, StrategyChain chain);

    /** @return nullptr when no chain handles the format. */
    const StrategyChain* find(domain::CanonicalFormat format) const;

    /**
     * @brief Builds the standard chains.
     *
     * pdf: text layer, then OCR when the text layer is shorter than pdfMinTextLength;
     *      OCR failures give empty text. A text layer failure is final.
     * docx: paragraphs only.
     * doc: primary extractor, then fallback on failure.
     * xls/xlsx: workbook reader, then legacy reader on failure.
     * images: OCR only.
     */
    static ExtractionChains Standard(const StandardStrategies& strategies, size_t pdfMinTextLength);

private:
    std::map<domain::CanonicalFormat, StrategyChain> m_chains;
};

} // namespace docingest::application
