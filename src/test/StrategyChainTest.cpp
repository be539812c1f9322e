#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include "application/ExtractionChains.hpp"
#include "application/StrategyChain.hpp"
#include "infrastructure/TempFiles.hpp"

using namespace docingest;
using domain::ErrorKind;
using domain::StrategyResult;

// Scripted strategy: returns a fixed result (or throws) and counts calls.
class ScriptedStrategy : public domain::ExtractionStrategy {
public:
    ScriptedStrategy(std::string name, StrategyResult result, bool throws = false)
        : m_name(std::move(name)), m_result(std::move(result)), m_throws(throws) {}

    std::string name() const override { return m_name; }

    StrategyResult extract(const std::string&) override {
        ++calls;
        if (m_throws) throw std::runtime_error("library exploded");
        return m_result;
    }

    int calls = 0;

private:
    std::string m_name;
    StrategyResult m_result;
    bool m_throws;
};

std::shared_ptr<ScriptedStrategy> Ok(const std::string& name, const std::string& text) {
    return std::make_shared<ScriptedStrategy>(name, StrategyResult::Ok(text));
}

std::shared_ptr<ScriptedStrategy> Fails(const std::string& name, ErrorKind kind, const std::string& message) {
    return std::make_shared<ScriptedStrategy>(name, StrategyResult::Fail(kind, message));
}

int main() {
    std::cout << "[Test] StrategyChain..." << std::endl;

    const std::string scratch = "test_chain_scratch";
    const std::string input = infrastructure::TempFiles::CreateWithContent(scratch, ".bin", "payload");
    const std::string empty = infrastructure::TempFiles::Create(scratch, ".bin");

    // PDF: a text layer below the threshold hands over to OCR.
    {
        auto textLayer = Ok("pdf-text", "\n\n");
        auto ocr = Ok("pdf-ocr", "scanned words");
        application::StandardStrategies s;
        s.pdfTextLayer = textLayer;
        s.pdfOcr = ocr;
        auto chains = application::ExtractionChains::Standard(s, 5);

        auto outcome = chains.find(domain::CanonicalFormat::Pdf)->run(input);
        assert(outcome.isSuccess());
        assert(outcome.result().strategyUsed == "pdf-ocr");
        assert(outcome.result().text == "scanned words");
        assert(textLayer->calls == 1 && ocr->calls == 1);
        std::cout << "[PASS] Short PDF text layer falls back to OCR" << std::endl;
    }

    // PDF: enough text keeps the text layer and never runs OCR.
    {
        auto textLayer = Ok("pdf-text", "Hello world\n");
        auto ocr = Ok("pdf-ocr", "unused");
        application::StandardStrategies s;
        s.pdfTextLayer = textLayer;
        s.pdfOcr = ocr;
        auto chains = application::ExtractionChains::Standard(s, 5);

        auto outcome = chains.find(domain::CanonicalFormat::Pdf)->run(input);
        assert(outcome.isSuccess());
        assert(outcome.result().strategyUsed == "pdf-text");
        assert(ocr->calls == 0);
        std::cout << "[PASS] Usable PDF text layer is kept" << std::endl;
    }

    // PDF: OCR failure is best effort, empty text with a warning.
    {
        application::StandardStrategies s;
        s.pdfTextLayer = Ok("pdf-text", "");
        s.pdfOcr = Fails("pdf-ocr", ErrorKind::EngineMissing, "tesseract not installed");
        auto chains = application::ExtractionChains::Standard(s, 5);

        auto outcome = chains.find(domain::CanonicalFormat::Pdf)->run(input);
        assert(outcome.isSuccess());
        assert(outcome.result().text.empty());
        assert(outcome.result().strategyUsed == "pdf-ocr");
        assert(!outcome.result().warnings.empty());
        std::cout << "[PASS] OCR failure yields empty text" << std::endl;
    }

    // PDF: a text layer failure is final.
    {
        auto ocr = Ok("pdf-ocr", "unused");
        application::StandardStrategies s;
        s.pdfTextLayer = Fails("pdf-text", ErrorKind::EngineFailure, "broken xref");
        s.pdfOcr = ocr;
        auto chains = application::ExtractionChains::Standard(s, 5);

        auto outcome = chains.find(domain::CanonicalFormat::Pdf)->run(input);
        assert(outcome.isFailure());
        assert(outcome.failure().kind == ErrorKind::EngineFailure);
        assert(outcome.failure().message == "broken xref");
        assert(ocr->calls == 0);
        std::cout << "[PASS] PDF parse failure does not reach OCR" << std::endl;
    }

    // Spreadsheet: both readers fail, both causes reported.
    {
        application::StandardStrategies s;
        s.spreadsheet = Fails("xlsx", ErrorKind::EngineFailure, "not a zip archive");
        s.legacySpreadsheet = Fails("xls2csv", ErrorKind::EngineMissing, "xls2csv is not installed");
        auto chains = application::ExtractionChains::Standard(s, 5);

        auto outcome = chains.find(domain::CanonicalFormat::Xls)->run(input);
        assert(outcome.isFailure());
        assert(outcome.failure().kind == ErrorKind::CompositeFailure);
        const std::string& message = outcome.failure().message;
        assert(message.find("not a zip archive") != std::string::npos);
        assert(message.find("xls2csv is not installed") != std::string::npos);
        std::cout << "[PASS] Composite failure carries every cause: " << message << std::endl;
    }

    // DOC: primary failure falls through to the fallback, with the same chain for xlsx.
    {
        auto primary = Fails("catdoc", ErrorKind::EngineFailure, "catdoc failed");
        auto fallback = Ok("antiword", "legacy text");
        application::StandardStrategies s;
        s.docPrimary = primary;
        s.docFallback = fallback;
        auto chains = application::ExtractionChains::Standard(s, 5);

        auto outcome = chains.find(domain::CanonicalFormat::Doc)->run(input);
        assert(outcome.isSuccess());
        assert(outcome.result().strategyUsed == "antiword");
        assert(outcome.result().text == "legacy text");
        assert(chains.find(domain::CanonicalFormat::Docx) == nullptr);
        std::cout << "[PASS] DOC fallback runs after primary failure" << std::endl;
    }

    // Exceptions from a strategy are contained.
    {
        application::StrategyChain chain;
        chain.then(application::ChainStep{std::make_shared<ScriptedStrategy>("docx", StrategyResult::Ok(""), true)});
        auto outcome = chain.run(input);
        assert(outcome.isFailure());
        assert(outcome.failure().kind == ErrorKind::EngineFailure);
        assert(outcome.failure().message == "library exploded");
        std::cout << "[PASS] Thrown exceptions become EngineFailure" << std::endl;
    }

    // Input checks happen before any strategy runs.
    {
        auto strategy = Ok("docx", "text");
        application::StrategyChain chain;
        chain.then(application::ChainStep{strategy});

        auto missing = chain.run(scratch + "/does_not_exist.docx");
        assert(missing.isFailure() && missing.failure().kind == ErrorKind::FileNotFound);

        auto zero = chain.run(empty);
        assert(zero.isFailure() && zero.failure().kind == ErrorKind::EmptyFile);
        assert(strategy->calls == 0);

        application::StrategyChain none;
        auto noSteps = none.run(input);
        assert(noSteps.isFailure() && noSteps.failure().kind == ErrorKind::EngineMissing);
        std::cout << "[PASS] FileNotFound, EmptyFile and EngineMissing" << std::endl;
    }

    // Same input, same output.
    {
        application::StrategyChain chain;
        chain.then(application::ChainStep{Ok("docx", "stable")});
        auto first = chain.run(input);
        auto second = chain.run(input);
        assert(first.isSuccess() && second.isSuccess());
        assert(first.result().text == second.result().text);
        std::cout << "[PASS] Repeated runs are identical" << std::endl;
    }

    std::filesystem::remove_all(scratch);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
