/**
 * @file PdfTextLayerStrategy.cpp
 * @brief Implementation of PdfTextLayerStrategy.
 */

#include "infrastructure/PdfTextLayerStrategy.hpp"
#include <iostream>
#include <memory>
#include <poppler/cpp/poppler-document.h>
#include <poppler/cpp/poppler-page.h>

namespace docingest::infrastructure {

using domain::ErrorKind;
using domain::StrategyResult;

StrategyResult PdfTextLayerStrategy::extract(const std::string& localPath) {
    std::unique_ptr<poppler::document> doc(poppler::document::load_from_file(localPath));
    if (!doc) {
        return StrategyResult::Fail(ErrorKind::EngineFailure, "poppler cannot open PDF " + localPath);
    }
    if (doc->is_locked()) {
        return StrategyResult::Fail(ErrorKind::EngineFailure, "PDF is encrypted: " + localPath);
    }

    const int pageCount = doc->pages();
    std::string text;
    for (int i = 0; i < pageCount; ++i) {
        std::unique_ptr<poppler::page> page(doc->create_page(i));
        if (page) {
            poppler::byte_array utf8 = page->text().to_utf8();
            text.append(utf8.begin(), utf8.end());
        } else {
            std::cerr << "[PdfTextLayer] Page " << (i + 1) << " of " << localPath << " could not be loaded" << std::endl;
        }
        text += '\n';
    }
    return StrategyResult::Ok(std::move(text));
}

} // namespace docingest::infrastructure
