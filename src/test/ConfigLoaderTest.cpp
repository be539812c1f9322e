#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "infrastructure/ConfigLoader.hpp"

using namespace docingest;
using application::PersistMode;
using infrastructure::ConfigLoader;
using json = nlohmann::json;
namespace fs = std::filesystem;

int main() {
    std::cout << "[Test] ConfigLoader..." << std::endl;

    unsetenv("DOCINGEST_API_TOKEN");
    unsetenv("DOCINGEST_UPLOAD_ENDPOINT");
    unsetenv("DOCINGEST_CATALOG");

    // Overlay of valid keys.
    {
        application::PipelineSettings settings = ConfigLoader::Defaults();
        assert(!settings.storeDir.empty());
        assert(settings.fetchTimeoutSeconds == 30);
        assert(settings.manifestDocumentExtension == ".pdf");

        ConfigLoader::ApplyJson(json{
            {"store_dir", "/tmp/docingest-store"},
            {"persist_mode", "upload"},
            {"fetch_timeout_seconds", 10},
            {"max_workers", 8},
            {"pdf_min_text_length", 0},
            {"manifest_document_extension", "docx"},
            {"ocr_language", "deu+eng"}
        }, settings);

        assert(settings.storeDir == "/tmp/docingest-store");
        assert(settings.persistMode == PersistMode::Upload);
        assert(settings.fetchTimeoutSeconds == 10);
        assert(settings.maxWorkers == 8);
        assert(settings.pdfMinTextLength == 0);
        assert(settings.manifestDocumentExtension == ".docx");
        assert(settings.ocrLanguage == "deu+eng");
        std::cout << "[PASS] Settings keys applied" << std::endl;
    }

    // Invalid values keep their previous value.
    {
        application::PipelineSettings settings;
        ConfigLoader::ApplyJson(json{
            {"persist_mode", "sometimes"},
            {"fetch_timeout_seconds", -5},
            {"max_workers", "many"},
            {"store_dir", 12},
            {"manifest_document_extension", ""}
        }, settings);

        assert(settings.persistMode == PersistMode::Embed);
        assert(settings.fetchTimeoutSeconds == 30);
        assert(settings.maxWorkers == 4);
        assert(settings.storeDir.empty());
        assert(settings.manifestDocumentExtension == ".pdf");

        ConfigLoader::ApplyJson(json::array({1, 2}), settings);
        assert(settings.maxWorkers == 4);
        std::cout << "[PASS] Invalid values ignored" << std::endl;
    }

    // Values outside the field's range are rejected, not truncated.
    {
        application::PipelineSettings settings;
        ConfigLoader::ApplyJson(json{
            {"fetch_timeout_seconds", 5000000000LL},
            {"upload_timeout_seconds", 18446744073709551615ULL},
            {"fetch_total_timeout_seconds", 0},
            {"pdf_min_text_length", -1}
        }, settings);

        assert(settings.fetchTimeoutSeconds == 30);
        assert(settings.uploadTimeoutSeconds == 100);
        assert(settings.fetchTotalTimeoutSeconds == 0);
        assert(settings.pdfMinTextLength == 5);

        ConfigLoader::ApplyJson(json{{"fetch_total_timeout_seconds", 600}}, settings);
        assert(settings.fetchTotalTimeoutSeconds == 600);
        std::cout << "[PASS] Out-of-range integers ignored" << std::endl;
    }

    // Environment wins over the file.
    {
        const std::string file = "test_config_settings.json";
        std::ofstream(file) << R"({"api_token": "from-file", "upload_endpoint": "https://hub.example/api/resource_create"})";

        setenv("DOCINGEST_API_TOKEN", "from-env", 1);
        application::PipelineSettings settings = ConfigLoader::Load(file);
        unsetenv("DOCINGEST_API_TOKEN");

        assert(settings.apiToken == "from-env");
        assert(settings.uploadEndpoint == "https://hub.example/api/resource_create");
        assert(settings.hasUploadTarget());
        fs::remove(file);
        std::cout << "[PASS] Environment overrides applied" << std::endl;
    }

    // Malformed or missing files fall back to defaults.
    {
        const std::string file = "test_config_broken.json";
        std::ofstream(file) << "{ not json";
        application::PipelineSettings settings = ConfigLoader::Load(file);
        assert(settings.fetchTimeoutSeconds == 30);
        fs::remove(file);

        application::PipelineSettings missing = ConfigLoader::Load(std::string("does-not-exist.json"));
        assert(missing.persistMode == PersistMode::Embed);
        std::cout << "[PASS] Unreadable settings fall back to defaults" << std::endl;
    }

    // Startup validation.
    {
        application::PipelineSettings settings = ConfigLoader::Defaults();
        assert(!ConfigLoader::Validate(settings).has_value());

        settings.persistMode = PersistMode::Upload;
        auto problem = ConfigLoader::Validate(settings);
        assert(problem.has_value());
        assert(problem->find("upload") != std::string::npos);

        settings.uploadEndpoint = "https://hub.example/api/resource_create";
        settings.apiToken = "secret";
        assert(!ConfigLoader::Validate(settings).has_value());

        settings.storeDir.clear();
        assert(ConfigLoader::Validate(settings).has_value());
        std::cout << "[PASS] Validation" << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
