/**
 * @file ImageOcrStrategy.hpp
 * @brief OCR of raster image files.
 */

#pragma once
#include <memory>
#include "domain/ExtractionStrategy.hpp"

namespace docingest::infrastructure {

class TesseractEngine;

class ImageOcrStrategy : public domain::ExtractionStrategy {
public:
    explicit ImageOcrStrategy(std::shared_ptr<const TesseractEngine> engine);

    std::string name() const override { return "image-ocr"; }
    domain::StrategyResult extract(const std::string& localPath) override;

private:
    std::shared_ptr<const TesseractEngine> m_engine;
};

} // namespace docingest::infrastructure
