/**
 * @file ExtractionChains.cpp
 * @brief Implementation of ExtractionChains.
 */

#include "application/ExtractionChains.hpp"

namespace docingest::application {

using domain::CanonicalFormat;

void ExtractionChains::set(CanonicalFormat format, StrategyChain chain) {
    m_chains[format] = std::move(chain);
}

const StrategyChain* ExtractionChains::find(CanonicalFormat format) const {
    auto it = m_chains.find(format);
    if (it == m_chains.end() || it->second.empty()) return nullptr;
    return &it->second;
}

ExtractionChains ExtractionChains::Standard(const StandardStrategies& s, size_t pdfMinTextLength) {
    ExtractionChains chains;

    StrategyChain pdf;
    if (s.pdfTextLayer) {
        ChainStep step{s.pdfTextLayer};
        step.minTextLength = pdfMinTextLength;
        step.advanceOnFailure = false;
        pdf.then(step);
    }
    if (s.pdfOcr) {
        ChainStep step{s.pdfOcr};
        step.bestEffort = true;
        pdf.then(step);
    }
    chains.set(CanonicalFormat::Pdf, std::move(pdf));

    StrategyChain docx;
    if (s.docx) docx.then(ChainStep{s.docx});
    chains.set(CanonicalFormat::Docx, std::move(docx));

    StrategyChain doc;
    if (s.docPrimary) doc.then(ChainStep{s.docPrimary});
    if (s.docFallback) doc.then(ChainStep{s.docFallback});
    chains.set(CanonicalFormat::Doc, std::move(doc));

    StrategyChain sheet;
    if (s.spreadsheet) sheet.then(ChainStep{s.spreadsheet});
    if (s.legacySpreadsheet) sheet.then(ChainStep{s.legacySpreadsheet});
    chains.set(CanonicalFormat::Xlsx, sheet);
    chains.set(CanonicalFormat::Xls, std::move(sheet));

    StrategyChain image;
    if (s.imageOcr) image.then(ChainStep{s.imageOcr});
    for (auto format : {CanonicalFormat::Jpeg, CanonicalFormat::Png, CanonicalFormat::Tiff,
                        CanonicalFormat::Bmp, CanonicalFormat::Gif}) {
        chains.set(format, image);
    }

    return chains;
}

} // namespace docingest::application
