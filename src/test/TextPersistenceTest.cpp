#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "application/TextPersistenceService.hpp"
#include "domain/PipelineError.hpp"
#include "infrastructure/FileMetadataStore.hpp"

using namespace docingest;
using json = nlohmann::json;
namespace fs = std::filesystem;

class CapturingUploader : public domain::ArtifactUploader {
public:
    std::string upload(const std::string& localPath, const std::string& collectionId,
                       const std::string& displayName, const std::string& mimeType) override {
        std::ifstream in(localPath);
        std::stringstream buffer;
        buffer << in.rdbuf();
        uploadedPath = localPath;
        uploadedContent = buffer.str();
        uploadedCollection = collectionId;
        uploadedName = displayName;
        uploadedMime = mimeType;
        ++calls;
        return "txt-resource-1";
    }

    int calls = 0;
    std::string uploadedPath;
    std::string uploadedContent;
    std::string uploadedCollection;
    std::string uploadedName;
    std::string uploadedMime;
};

domain::ExtractionResult Result(const std::string& text) {
    return domain::ExtractionResult{text, "docx", {}};
}

int main() {
    std::cout << "[Test] TextPersistenceService + FileMetadataStore..." << std::endl;

    const std::string root = "test_persistence_root";
    fs::remove_all(root);
    auto store = std::make_shared<infrastructure::FileMetadataStore>(root);

    // Embed mode keeps unrelated keys and writes the text entry.
    {
        store->updateMetadata("pkg/doc 1", {{"title", "Quarterly report"}});

        application::TextPersistenceService service(store, nullptr, application::PersistMode::Embed, root + "/scratch");
        service.store("pkg/doc 1", "pkg", "report.docx", Result("Hello"));

        auto metadata = store->getMetadata("pkg/doc 1");
        assert(metadata.at("title") == "Quarterly report");
        json data = json::parse(metadata.at("extracted_text_data"));
        assert(data["extracted_text"] == "Hello");
        assert(data["text_length"] == 5);
        assert(data["version"] == "1.0");
        assert(data["strategy"] == "docx");
        assert(!data.contains("text_resource_id"));

        assert(store->pathFor("pkg/doc 1").filename() == "pkg%2Fdoc%201.json");
        std::cout << "[PASS] Embedded text merged into existing metadata" << std::endl;
    }

    // Upload mode sends a .txt artifact and records its id instead of the text.
    {
        auto uploader = std::make_shared<CapturingUploader>();
        application::TextPersistenceService service(store, uploader, application::PersistMode::Upload, root + "/scratch");
        service.store("doc-2", "pkg", "Tender Notice.pdf", Result("Full text body"));

        assert(uploader->calls == 1);
        assert(uploader->uploadedContent == "Full text body");
        assert(uploader->uploadedName == "Tender Notice.txt");
        assert(uploader->uploadedMime == "text/plain");
        assert(uploader->uploadedCollection == "pkg");
        assert(!fs::exists(uploader->uploadedPath));

        json data = json::parse(store->getMetadata("doc-2").at("extracted_text_data"));
        assert(data["text_resource_id"] == "txt-resource-1");
        assert(!data.contains("extracted_text"));
        assert(data["text_length"] == 14);

        // Empty text: nothing to upload, the entry is still written.
        service.store("doc-3", "pkg", "blank.pdf", Result(""));
        assert(uploader->calls == 1);
        json blank = json::parse(store->getMetadata("doc-3").at("extracted_text_data"));
        assert(blank["text_length"] == 0);
        assert(!blank.contains("text_resource_id"));
        std::cout << "[PASS] Upload mode stores a text artifact" << std::endl;
    }

    // Upload mode without an uploader is a persist failure.
    {
        application::TextPersistenceService service(store, nullptr, application::PersistMode::Upload, root + "/scratch");
        bool threw = false;
        try {
            service.store("doc-4", "pkg", "a.pdf", Result("text"));
        } catch (const domain::PipelineError& e) {
            threw = true;
            assert(e.kind() == domain::ErrorKind::PersistFailure);
        }
        assert(threw);
        assert(store->getMetadata("doc-4").empty());
        std::cout << "[PASS] Missing uploader reported as PersistFailure" << std::endl;
    }

    // Concurrent writers for one record leave a valid file behind.
    {
        application::TextPersistenceService service(store, nullptr, application::PersistMode::Embed, root + "/scratch");
        std::vector<std::thread> writers;
        for (int i = 0; i < 16; ++i) {
            writers.emplace_back([&service, i]() {
                service.store("shared", "pkg", "doc.pdf", Result("writer " + std::to_string(i)));
            });
        }
        for (auto& t : writers) t.join();

        json data = json::parse(store->getMetadata("shared").at("extracted_text_data"));
        assert(data["extracted_text"].get<std::string>().rfind("writer ", 0) == 0);

        for (const auto& entry : fs::directory_iterator(root + "/metadata")) {
            assert(entry.path().extension() == ".json");
        }
        std::cout << "[PASS] Serialised writes, no temp files left" << std::endl;
    }

    // A corrupt record is refused rather than overwritten.
    {
        std::ofstream(store->pathFor("corrupt")) << "{ broken";
        bool threw = false;
        try {
            store->getMetadata("corrupt");
        } catch (const domain::PipelineError& e) {
            threw = true;
            assert(e.kind() == domain::ErrorKind::PersistFailure);
        }
        assert(threw);
        std::cout << "[PASS] Corrupt metadata detected" << std::endl;
    }

    assert(application::TextPersistenceService::TextArtifactName("https://x/y/report.final.pdf") == "report.final.txt");
    assert(application::TextPersistenceService::TextArtifactName("") == "document.txt");

    fs::remove_all(root);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
