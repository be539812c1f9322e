/**
 * @file TesseractEngine.hpp
 * @brief Thin wrapper around the Tesseract OCR API.
 */

#pragma once
#include <chrono>
#include <string>

namespace docingest::infrastructure {

struct OcrOptions {
    std::string language = "eng";
    std::string tessdataPath;   ///< Empty uses the library default / TESSDATA_PREFIX.
    std::chrono::seconds timeout{0};  ///< Deadline per image or page, 0 for none.
};

/**
 * @class TesseractEngine
 * @brief Recognises text in images. A fresh TessBaseAPI is used per call,
 * so one engine may be shared by concurrent extractions.
 *
 * Failures throw domain::PipelineError: EngineMissing when Tesseract or the
 * language data cannot be initialised, EngineFailure when recognition fails or
 * runs past the deadline.
 */
class TesseractEngine {
public:
    explicit TesseractEngine(OcrOptions options);

    /** @brief OCR of an image file readable by Leptonica (png, jpeg, tiff, bmp, gif). */
    std::string recognizeFile(const std::string& imagePath) const;

    /** @brief OCR of an 8-bit grayscale raster. */
    std::string recognizeGray8(const unsigned char* pixels, int width, int height, int bytesPerLine) const;

    const OcrOptions& options() const { return m_options; }

private:
    OcrOptions m_options;
};

} // namespace docingest::infrastructure
