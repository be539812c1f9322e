/**
 * @file TesseractEngine.cpp
 * @brief Implementation of TesseractEngine.
 */

#include "infrastructure/TesseractEngine.hpp"
#include <string>
#include <cstdint>
#include <utility>
#include <leptonica/allheaders.h>
#include <memory>
#include <tesseract/baseapi.h>
#include <tesseract/ocrclass.h>
#include "domain/PipelineError.hpp"

namespace docingest::infrastructure {

using domain::ErrorKind;
using domain::PipelineError;

namespace {

struct TessApiDeleter {
    void operator()(tesseract::TessBaseAPI* api) const {
        api->End();
        delete api;
    }
};

using TessApiPtr = std::unique_ptr<tesseract::TessBaseAPI, TessApiDeleter>;

TessApiPtr OpenApi(const OcrOptions& options) {
    TessApiPtr api(new tesseract::TessBaseAPI());
    const char* dataPath = options.tessdataPath.empty() ? nullptr : options.tessdataPath.c_str();
    if (api->Init(dataPath, options.language.c_str(), tesseract::OEM_DEFAULT) != 0) {
        throw PipelineError(ErrorKind::EngineMissing,
                            "Tesseract could not be initialised for language '" + options.language + "'");
    }
    return api;
}

std::string RecognizeText(tesseract::TessBaseAPI& api, std::chrono::seconds timeout) {
    tesseract::ETEXT_DESC monitor;
    if (timeout.count() > 0) {
        monitor.set_deadline_msecs(static_cast<int32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count()));
    }
    if (api.Recognize(&monitor) != 0) {
        if (monitor.deadline_exceeded()) {
            throw PipelineError(ErrorKind::EngineFailure,
                                "Tesseract timed out after " + std::to_string(timeout.count()) + "s");
        }
        throw PipelineError(ErrorKind::EngineFailure, "Tesseract recognition failed");
    }

    std::unique_ptr<char[]> raw(api.GetUTF8Text());
    if (!raw) {
        throw PipelineError(ErrorKind::EngineFailure, "Tesseract returned no recognition result");
    }
    return std::string(raw.get());
}

} // namespace

TesseractEngine::TesseractEngine(OcrOptions options)
    : m_options(std::move(options)) {}

std::string TesseractEngine::recognizeFile(const std::string& imagePath) const {
    Pix* pix = pixRead(imagePath.c_str());
    if (!pix) {
        throw PipelineError(ErrorKind::EngineFailure, "Leptonica cannot decode image " + imagePath);
    }
    std::unique_ptr<Pix, void (*)(Pix*)> image(pix, [](Pix* p) { pixDestroy(&p); });

    TessApiPtr api = OpenApi(m_options);
    api->SetImage(image.get());
    return RecognizeText(*api, m_options.timeout);
}

std::string TesseractEngine::recognizeGray8(const unsigned char* pixels, int width, int height, int bytesPerLine) const {
    if (!pixels || width <= 0 || height <= 0) {
        throw PipelineError(ErrorKind::EngineFailure, "empty raster passed to OCR");
    }
    TessApiPtr api = OpenApi(m_options);
    api->SetImage(pixels, width, height, 1, bytesPerLine);
    return RecognizeText(*api, m_options.timeout);
}

} // namespace docingest::infrastructure
