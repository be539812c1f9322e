/**
 * @file ImageOcrStrategy.cpp
 * @brief Implementation of ImageOcrStrategy.
 */

#include "infrastructure/ImageOcrStrategy.hpp"
#include "domain/PipelineError.hpp"
#include "infrastructure/TesseractEngine.hpp"

namespace docingest::infrastructure {

using domain::PipelineError;
using domain::StrategyResult;

ImageOcrStrategy::ImageOcrStrategy(std::shared_ptr<const TesseractEngine> engine)
    : m_engine(std::move(engine)) {}

StrategyResult ImageOcrStrategy::extract(const std::string& localPath) {
    try {
        return StrategyResult::Ok(m_engine->recognizeFile(localPath));
    } catch (const PipelineError& e) {
        return StrategyResult::Fail(e.kind(), e.what());
    }
}

} // namespace docingest::infrastructure
