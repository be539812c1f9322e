/**
 * @file PdfOcrStrategy.hpp
 * @brief OCR of PDF pages rendered to raster images.
 */

#pragma once
#include <memory>
#include "domain/ExtractionStrategy.hpp"

namespace docingest::infrastructure {

class TesseractEngine;

/**
 * @class PdfOcrStrategy
 * @brief Renders every page at a fixed resolution in grayscale and runs OCR on it.
 * Page texts are joined with "\n".
 */
class PdfOcrStrategy : public domain::ExtractionStrategy {
public:
    PdfOcrStrategy(std::shared_ptr<const TesseractEngine> engine, int dpi);

    std::string name() const override { return "pdf-ocr"; }
    domain::StrategyResult extract(const std::string& localPath) override;

private:
    std::shared_ptr<const TesseractEngine> m_engine;
    int m_dpi;
};

} // namespace docingest::infrastructure
