/**
 * @file PdfOcrStrategy.cpp
 * @brief Implementation of PdfOcrStrategy.
 */

#include "infrastructure/PdfOcrStrategy.hpp"
#include <iostream>
#include <poppler/cpp/poppler-document.h>
#include <poppler/cpp/poppler-image.h>
#include <poppler/cpp/poppler-page-renderer.h>
#include <poppler/cpp/poppler-page.h>
#include "domain/PipelineError.hpp"
#include "infrastructure/TesseractEngine.hpp"

namespace docingest::infrastructure {

using domain::ErrorKind;
using domain::PipelineError;
using domain::StrategyResult;

PdfOcrStrategy::PdfOcrStrategy(std::shared_ptr<const TesseractEngine> engine, int dpi)
    : m_engine(std::move(engine)), m_dpi(dpi > 0 ? dpi : 300) {}

StrategyResult PdfOcrStrategy::extract(const std::string& localPath) {
    if (!poppler::page_renderer::can_render()) {
        return StrategyResult::Fail(ErrorKind::EngineMissing, "poppler was built without a rendering backend");
    }

    std::unique_ptr<poppler::document> doc(poppler::document::load_from_file(localPath));
    if (!doc || doc->is_locked()) {
        return StrategyResult::Fail(ErrorKind::EngineFailure, "poppler cannot render PDF " + localPath);
    }

    poppler::page_renderer renderer;
    renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
    renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
    renderer.set_image_format(poppler::image::format_gray8);

    const int pageCount = doc->pages();
    std::cout << "[PdfOcr] Rendering " << pageCount << " page(s) of " << localPath << " at " << m_dpi << " dpi" << std::endl;

    std::string text;
    try {
        for (int i = 0; i < pageCount; ++i) {
            std::unique_ptr<poppler::page> page(doc->create_page(i));
            if (!page) {
                return StrategyResult::Fail(ErrorKind::EngineFailure, "page " + std::to_string(i + 1) + " could not be loaded");
            }

            poppler::image raster = renderer.render_page(page.get(), m_dpi, m_dpi);
            if (!raster.is_valid()) {
                return StrategyResult::Fail(ErrorKind::EngineFailure, "page " + std::to_string(i + 1) + " could not be rendered");
            }

            if (i > 0) text += '\n';
            text += m_engine->recognizeGray8(reinterpret_cast<const unsigned char*>(raster.const_data()),
                                             raster.width(), raster.height(), raster.bytes_per_row());
        }
    } catch (const PipelineError& e) {
        return StrategyResult::Fail(e.kind(), e.what());
    }
    return StrategyResult::Ok(std::move(text));
}

} // namespace docingest::infrastructure
