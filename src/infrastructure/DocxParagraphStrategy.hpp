/**
 * @file DocxParagraphStrategy.hpp
 * @brief Paragraph text of WordprocessingML (.docx) documents.
 */

#pragma once
#include "domain/ExtractionStrategy.hpp"

namespace docingest::infrastructure {

/**
 * @class DocxParagraphStrategy
 * @brief Reads word/document.xml and joins body paragraphs with "\n".
 *
 * Runs of a paragraph are concatenated; w:tab becomes a tab and w:br/w:cr a line break.
 * Table cell paragraphs are included in document order.
 */
class DocxParagraphStrategy : public domain::ExtractionStrategy {
public:
    std::string name() const override { return "docx"; }
    domain::StrategyResult extract(const std::string& localPath) override;

    /** @brief Extracts paragraph text from a document.xml payload. */
    static std::string ParagraphText(const std::string& documentXml);
};

} // namespace docingest::infrastructure
