/**
 * @file DocIngestApp.cpp
 * @brief Implementation of the DocIngestApp class.
 */
#include "app/DocIngestApp.hpp"

#include <chrono>
#include <fstream>
#include <httplib.h>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "application/ExtractionChains.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/DocxParagraphStrategy.hpp"
#include "infrastructure/ExternalToolStrategy.hpp"
#include "infrastructure/FileMetadataStore.hpp"
#include "infrastructure/HttpDocumentFetcher.hpp"
#include "infrastructure/HttpResourceUploader.hpp"
#include "infrastructure/ImageOcrStrategy.hpp"
#include "infrastructure/JsonDocumentCatalog.hpp"
#include "infrastructure/PdfOcrStrategy.hpp"
#include "infrastructure/PdfTextLayerStrategy.hpp"
#include "infrastructure/TesseractEngine.hpp"
#include "infrastructure/XlsxWorkbookStrategy.hpp"

namespace docingest::app {

using json = nlohmann::json;
using application::PersistMode;
using application::PipelineSettings;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;
constexpr int kExitUnsupported = 3;
constexpr const char* kActionPath = "/api/action/process_document";

void PrintUsage() {
    std::cerr << "Usage: docingest [--config <settings.json>] <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  extract <path> [--format F] [--name N] [--output FILE]\n"
              << "      Extract text from a local file and print it.\n"
              << "  process <documentId>\n"
              << "      Extract and store the text of a catalogued document.\n"
              << "  manifest <file> --collection <id>\n"
              << "      Fetch and ingest every document a JSON manifest references.\n"
              << "  serve [--host H] [--port N]\n"
              << "      Expose POST " << kActionPath << " over HTTP.\n";
}

bool TakeOption(std::vector<std::string>& args, const std::string& longName, std::string& outValue) {
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == longName) {
            if (i + 1 >= args.size()) return false;
            outValue = args[i + 1];
            args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
            return true;
        }
        const std::string prefix = longName + "=";
        if (args[i].rfind(prefix, 0) == 0) {
            outValue = args[i].substr(prefix.size());
            args.erase(args.begin() + static_cast<long>(i));
            return true;
        }
    }
    return false;
}

std::optional<int> ParsePort(const std::string& raw) {
    try {
        size_t consumed = 0;
        int port = std::stoi(raw, &consumed);
        if (consumed != raw.size() || port <= 0 || port > 65535) return std::nullopt;
        return port;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

application::StandardStrategies BuildStrategies(const PipelineSettings& settings) {
    const std::chrono::seconds toolTimeout(settings.toolTimeoutSeconds);
    auto ocr = std::make_shared<const infrastructure::TesseractEngine>(
        infrastructure::OcrOptions{settings.ocrLanguage, settings.tessdataPath, toolTimeout});

    application::StandardStrategies strategies;
    strategies.pdfTextLayer = std::make_shared<infrastructure::PdfTextLayerStrategy>();
    strategies.pdfOcr = std::make_shared<infrastructure::PdfOcrStrategy>(ocr, settings.ocrDpi);
    strategies.docx = std::make_shared<infrastructure::DocxParagraphStrategy>();
    strategies.docPrimary = infrastructure::ExternalToolStrategy::Catdoc(toolTimeout);
    strategies.docFallback = infrastructure::ExternalToolStrategy::Antiword(toolTimeout);
    strategies.spreadsheet = std::make_shared<infrastructure::XlsxWorkbookStrategy>();
    strategies.legacySpreadsheet = infrastructure::ExternalToolStrategy::Xls2Csv(toolTimeout);
    strategies.imageOcr = std::make_shared<infrastructure::ImageOcrStrategy>(ocr);
    return strategies;
}

void PrintWarnings(const domain::ExtractionResult& result) {
    for (const auto& warning : result.warnings) {
        std::cerr << "[DocIngest] warning: " << warning << std::endl;
    }
}

} // namespace

bool DocIngestApp::Init(const PipelineSettings& settings) {
    if (auto problem = infrastructure::ConfigLoader::Validate(settings)) {
        std::cerr << "[DocIngest] Configuration error: " << *problem << std::endl;
        return false;
    }

    m_services.settings = settings;
    m_services.sink = std::make_shared<infrastructure::FileMetadataStore>(settings.storeDir);
    m_services.catalog = std::make_shared<infrastructure::JsonDocumentCatalog>(settings.catalogPath);
    m_services.fetcher = std::make_shared<infrastructure::HttpDocumentFetcher>(
        settings.scratchDir, std::chrono::seconds(settings.fetchTimeoutSeconds), settings.manifestDocumentExtension,
        std::chrono::seconds(settings.fetchTotalTimeoutSeconds));

    if (settings.hasUploadTarget()) {
        m_services.uploader = std::make_shared<infrastructure::HttpResourceUploader>(
            settings.uploadEndpoint, settings.apiToken, std::chrono::seconds(settings.uploadTimeoutSeconds));
    }

    m_services.persistence = std::make_shared<application::TextPersistenceService>(
        m_services.sink, m_services.uploader, settings.persistMode, settings.scratchDir);

    m_services.orchestrator = std::make_shared<application::ExtractionOrchestrator>(
        application::ExtractionChains::Standard(BuildStrategies(settings), settings.pdfMinTextLength),
        m_services.fetcher, m_services.persistence, m_services.uploader, settings.maxWorkers);

    m_services.actions = std::make_unique<application::DocumentActionService>(m_services.catalog, m_services.orchestrator);

    std::cout << "[DocIngest] Ready (persist mode: " << application::PersistModeToString(settings.persistMode)
              << ", workers: " << settings.maxWorkers
              << ", uploads: " << (m_services.uploader ? "enabled" : "disabled") << ")" << std::endl;
    return true;
}

int DocIngestApp::Run(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    std::string configPath;
    bool hasConfig = TakeOption(args, "--config", configPath);
    if (hasConfig && configPath.empty()) {
        std::cerr << "[DocIngest] missing value for --config" << std::endl;
        return kExitUsage;
    }

    if (args.empty() || args[0] == "help" || args[0] == "--help" || args[0] == "-h") {
        PrintUsage();
        return args.empty() ? kExitUsage : kExitOk;
    }

    const std::string command = args[0];
    args.erase(args.begin());

    if (command != "extract" && command != "process" && command != "manifest" && command != "serve") {
        std::cerr << "[DocIngest] Unknown command: " << command << std::endl;
        PrintUsage();
        return kExitUsage;
    }

    PipelineSettings settings = infrastructure::ConfigLoader::Load(
        hasConfig ? std::optional<std::string>(configPath) : std::nullopt);
    if (!Init(settings)) {
        return kExitFailure;
    }

    if (command == "extract") return runExtract(args);
    if (command == "process") return runProcess(args);
    if (command == "manifest") return runManifest(args);
    return runServe(args);
}

int DocIngestApp::runExtract(std::vector<std::string>& args) {
    std::string format;
    std::string name;
    std::string outputPath;
    TakeOption(args, "--format", format);
    TakeOption(args, "--name", name);
    TakeOption(args, "--output", outputPath);

    if (args.size() != 1) {
        std::cerr << "usage: docingest extract <path> [--format F] [--name N] [--output FILE]" << std::endl;
        return kExitUsage;
    }

    domain::DocumentRef ref;
    ref.localPath = args[0];
    ref.declaredFormat = format;
    ref.sourceNameOrURL = name.empty() ? args[0] : name;

    domain::ExtractionOutcome outcome = m_services.orchestrator->process(ref);
    if (outcome.isUnsupported()) {
        std::cerr << "[DocIngest] Skipped: " << outcome.describe() << std::endl;
        return kExitUnsupported;
    }
    if (outcome.isFailure()) {
        std::cerr << "[DocIngest] " << outcome.describe() << std::endl;
        return kExitFailure;
    }

    const auto& result = outcome.result();
    PrintWarnings(result);
    if (outputPath.empty()) {
        std::cout << result.text;
        std::cout.flush();
        return kExitOk;
    }

    std::ofstream out(outputPath, std::ios::binary | std::ios::trunc);
    out << result.text;
    out.close();
    if (out.fail()) {
        std::cerr << "[DocIngest] Cannot write " << outputPath << std::endl;
        return kExitFailure;
    }
    std::cout << "[DocIngest] Wrote " << result.text.size() << " chars to " << outputPath << std::endl;
    return kExitOk;
}

int DocIngestApp::runProcess(std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cerr << "usage: docingest process <documentId>" << std::endl;
        return kExitUsage;
    }

    application::ActionResponse response = m_services.actions->processDocument(args[0]);
    (response.success ? std::cout : std::cerr) << "[DocIngest] " << response.message << std::endl;
    return response.success ? kExitOk : kExitFailure;
}

int DocIngestApp::runManifest(std::vector<std::string>& args) {
    std::string collection;
    if (!TakeOption(args, "--collection", collection) || collection.empty() || args.size() != 1) {
        std::cerr << "usage: docingest manifest <file> --collection <id>" << std::endl;
        return kExitUsage;
    }

    domain::ExtractionOutcome outcome = m_services.orchestrator->ingestManifestFile(args[0], collection);
    if (outcome.isFailure()) {
        std::cerr << "[DocIngest] " << outcome.describe() << std::endl;
        return kExitFailure;
    }

    PrintWarnings(outcome.result());
    std::cout << "[DocIngest] Manifest ingested with " << outcome.result().warnings.size()
              << " failed document(s)" << std::endl;
    return kExitOk;
}

int DocIngestApp::runServe(std::vector<std::string>& args) {
    std::string host = "127.0.0.1";
    std::string portRaw = "8080";
    TakeOption(args, "--host", host);
    TakeOption(args, "--port", portRaw);

    auto port = ParsePort(portRaw);
    if (!port || !args.empty()) {
        std::cerr << "usage: docingest serve [--host H] [--port N]" << std::endl;
        return kExitUsage;
    }

    httplib::Server server;
    const application::DocumentActionService& actions = *m_services.actions;

    server.Post(kActionPath, [&actions](const httplib::Request& req, httplib::Response& res) {
        json request;
        try {
            request = json::parse(req.body);
        } catch (const json::parse_error& e) {
            std::cerr << "[Server] Rejected request: " << e.what() << std::endl;
            res.status = 400;
            res.set_content(application::ActionResponse{false, "Request body is not valid JSON."}.toJson().dump(),
                            "application/json");
            return;
        }

        application::ActionResponse response = actions.handle(request);
        res.status = 200;
        res.set_content(response.toJson().dump(), "application/json");
    });

    std::cout << "[Server] Listening on http://" << host << ":" << *port << kActionPath << std::endl;
    if (!server.listen(host, *port)) {
        std::cerr << "[Server] Cannot listen on " << host << ":" << *port << std::endl;
        return kExitFailure;
    }
    return kExitOk;
}

} // namespace docingest::app
