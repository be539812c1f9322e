#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "domain/PipelineError.hpp"
#include "infrastructure/JsonDocumentCatalog.hpp"

using namespace docingest;
using domain::ErrorKind;
using domain::PipelineError;
using infrastructure::JsonDocumentCatalog;
using json = nlohmann::json;
namespace fs = std::filesystem;

int main() {
    std::cout << "[Test] JsonDocumentCatalog..." << std::endl;

    // Entry validation.
    {
        std::map<std::string, std::string> paths;
        auto records = JsonDocumentCatalog::ParseRegistry(json{{"documents", json::array({
            {{"id", "r1"}, {"package_id", "p1"}, {"format", "PDF"}, {"name", "a.pdf"}, {"path", "files/a.pdf"},
             {"extras", {{"lang", "de"}, {"pages", 3}}}},
            {{"id", "r2"}},
            {{"name", "no-id.pdf"}},
            "junk"
        })}}, paths);

        assert(records.size() == 1);
        assert(records.at("r1").parentId == "p1");
        assert(records.at("r1").sourceNameOrURL() == "a.pdf");
        assert(records.at("r1").extras.at("lang") == "de");
        assert(records.at("r1").extras.at("pages") == "3");
        assert(paths.at("r1") == "files/a.pdf");

        try {
            JsonDocumentCatalog::ParseRegistry(json{{"items", json::array()}}, paths);
            assert(false);
        } catch (const PipelineError& e) {
            assert(e.kind() == ErrorKind::ParseError);
        }
        std::cout << "[PASS] Registry entries validated" << std::endl;
    }

    // Lookup against a registry file, relative paths resolved next to it.
    {
        const fs::path dir = "test_catalog_dir";
        fs::create_directories(dir);
        std::ofstream(dir / "registry.json") << R"({"documents": [
            {"id": "doc-1", "package_id": "pkg", "url": "https://host/offer.pdf", "path": "blobs/offer.pdf"},
            {"id": "doc-2", "package_id": "pkg", "name": "notes.docx"}
        ]})";

        JsonDocumentCatalog catalog(dir / "registry.json");
        auto record = catalog.find("doc-1");
        assert(record);
        assert(record->url == "https://host/offer.pdf");
        assert(catalog.localPath(*record) == (dir / "blobs/offer.pdf").lexically_normal().string());

        assert(!catalog.find("doc-9"));

        auto noFile = catalog.find("doc-2");
        assert(noFile);
        try {
            catalog.localPath(*noFile);
            assert(false);
        } catch (const PipelineError& e) {
            assert(e.kind() == ErrorKind::FileNotFound);
        }

        fs::remove_all(dir);
        try {
            catalog.find("doc-1");
            assert(false);
        } catch (const PipelineError& e) {
            assert(e.kind() == ErrorKind::FileNotFound);
        }
        std::cout << "[PASS] Registry lookups" << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
