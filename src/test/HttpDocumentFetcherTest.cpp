#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>
#include <httplib.h>
#include "domain/PipelineError.hpp"
#include "infrastructure/HttpDocumentFetcher.hpp"
#include "infrastructure/HttpResourceUploader.hpp"
#include "infrastructure/HttpUrl.hpp"

using namespace docingest;
using domain::ErrorKind;
using domain::PipelineError;
using infrastructure::HttpDocumentFetcher;
using infrastructure::HttpResourceUploader;
using infrastructure::HttpUrl;
namespace fs = std::filesystem;

size_t CountFiles(const std::string& dir) {
    size_t count = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file()) ++count;
    }
    return count;
}

std::string ReadAll(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void TestNaming() {
    assert(HttpDocumentFetcher::FilenameFromDisposition("attachment; filename=\"notice 12.pdf\"") == "notice 12.pdf");
    assert(HttpDocumentFetcher::FilenameFromDisposition("attachment; filename=offer.docx; size=10") == "offer.docx");
    assert(HttpDocumentFetcher::FilenameFromDisposition("inline").empty());

    assert(HttpDocumentFetcher::SuggestedName("https://ted.example/docs/a.pdf?lang=de", "", "", ".pdf") == "a.pdf");
    assert(HttpDocumentFetcher::SuggestedName("https://ted.example/download/123", "", "", ".pdf") == "123.pdf");
    assert(HttpDocumentFetcher::SuggestedName("https://ted.example/download/123", "", "application/msword", ".pdf") == "123.doc");
    assert(HttpDocumentFetcher::SuggestedName("https://ted.example", "", "", ".pdf") == "document.pdf");
    assert(HttpDocumentFetcher::SuggestedName("https://ted.example/x", "attachment; filename=\"Plan.XLSX\"", "", ".pdf") == "Plan.XLSX");
    std::cout << "[PASS] Download naming" << std::endl;

    auto url = HttpUrl::Parse("HTTPS://ted.example:8443/path/doc.pdf?a=1#top");
    assert(url);
    assert(url->origin == "https://ted.example:8443");
    assert(url->target == "/path/doc.pdf?a=1");
    assert(HttpUrl::Parse("https://ted.example")->target == "/");
    assert(!HttpUrl::Parse("ftp://ted.example/a.pdf"));
    assert(!HttpUrl::Parse("not a url"));
    std::cout << "[PASS] URL parsing" << std::endl;

    assert(HttpResourceUploader::FormatField("report.TXT") == "txt");
    assert(HttpResourceUploader::FormatField("README") == "bin");
    assert(HttpResourceUploader::ParseCreatedId(R"({"success": true, "result": {"id": "res-9"}})") == "res-9");
    try {
        HttpResourceUploader::ParseCreatedId(R"({"success": false, "error": {"message": "denied"}})");
        assert(false);
    } catch (const PipelineError& e) {
        assert(e.kind() == ErrorKind::PersistFailure);
    }
    try {
        HttpResourceUploader::ParseCreatedId("<html>");
        assert(false);
    } catch (const PipelineError& e) {
        assert(e.kind() == ErrorKind::ParseError);
    }
    std::cout << "[PASS] Upload form helpers" << std::endl;
}

int main() {
    std::cout << "[Test] HTTP fetcher and uploader..." << std::endl;
    TestNaming();

    httplib::Server svr;
    svr.Get("/files/notice", [](const httplib::Request&, httplib::Response& res) {
        res.set_header("Content-Disposition", "attachment; filename=\"notice.pdf\"");
        res.set_content("%PDF-1.4 body", "application/pdf");
    });
    svr.Get("/missing.pdf", [](const httplib::Request&, httplib::Response& res) {
        res.status = 404;
        res.set_content("gone", "text/plain");
    });

    // Four chunks 600 ms apart: every read is quick, the whole transfer is not.
    svr.Get("/slow/tender.pdf", [](const httplib::Request&, httplib::Response& res) {
        res.set_chunked_content_provider("application/pdf", [](size_t offset, httplib::DataSink& sink) {
            const size_t chunkSize = 7;
            size_t index = offset / chunkSize;
            if (index >= 4) {
                sink.done();
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(600));
            std::string chunk = "chunk-" + std::to_string(index);
            sink.write(chunk.data(), chunk.size());
            return true;
        });
    });

    std::string uploadedName;
    std::string uploadedPackage;
    std::string uploadedAuth;
    svr.Post("/api/resource_create", [&](const httplib::Request& req, httplib::Response& res) {
        uploadedAuth = req.get_header_value("Authorization");
        uploadedPackage = req.has_file("package_id") ? req.get_file_value("package_id").content : "";
        uploadedName = req.has_file("upload") ? req.get_file_value("upload").filename : "";
        res.set_content(R"({"success": true, "result": {"id": "created-1"}})", "application/json");
    });

    int port = svr.bind_to_any_port("127.0.0.1");
    assert(port > 0);
    std::thread server([&]() { svr.listen_after_bind(); });
    while (!svr.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    const std::string base = "http://127.0.0.1:" + std::to_string(port);

    const std::string scratch = "test_http_scratch";
    fs::create_directories(scratch);
    HttpDocumentFetcher fetcher(scratch, std::chrono::seconds(5));

    // Successful download lands in scratch under the header name.
    {
        domain::FetchedFile file = fetcher.fetch(base + "/files/notice");
        assert(file.suggestedName() == "notice.pdf");
        assert(fs::path(file.tempPath()).extension() == ".pdf");
        assert(ReadAll(file.tempPath()) == "%PDF-1.4 body");
        assert(CountFiles(scratch) == 1);
    }
    assert(CountFiles(scratch) == 0);
    std::cout << "[PASS] Download stored and released" << std::endl;

    // A slow but steady transfer is kept; only an explicit total cap aborts it.
    {
        HttpDocumentFetcher patient(scratch, std::chrono::seconds(1));
        domain::FetchedFile file = patient.fetch(base + "/slow/tender.pdf");
        assert(ReadAll(file.tempPath()) == "chunk-0chunk-1chunk-2chunk-3");
    }
    assert(CountFiles(scratch) == 0);
    try {
        HttpDocumentFetcher capped(scratch, std::chrono::seconds(1), ".pdf", std::chrono::seconds(1));
        capped.fetch(base + "/slow/tender.pdf");
        assert(false);
    } catch (const PipelineError& e) {
        assert(e.kind() == ErrorKind::Timeout);
    }
    assert(CountFiles(scratch) == 0);
    std::cout << "[PASS] Slow downloads complete within per-read timeouts" << std::endl;

    // Non-2xx status.
    try {
        fetcher.fetch(base + "/missing.pdf");
        assert(false);
    } catch (const PipelineError& e) {
        assert(e.kind() == ErrorKind::HttpError);
        assert(std::string(e.what()).find("404") != std::string::npos);
    }
    assert(CountFiles(scratch) == 0);
    std::cout << "[PASS] HTTP 404 reported, partial file removed" << std::endl;

    // Unreachable host.
    try {
        fetcher.fetch("http://127.0.0.1:1/none.pdf");
        assert(false);
    } catch (const PipelineError& e) {
        assert(e.kind() == ErrorKind::NetworkError || e.kind() == ErrorKind::Timeout);
    }
    std::cout << "[PASS] Connection failure reported" << std::endl;

    // Multipart upload.
    {
        const std::string text = scratch + "/notice.txt";
        std::ofstream(text) << "extracted";
        HttpResourceUploader uploader(base + "/api/resource_create", "token-123", std::chrono::seconds(5));
        std::string id = uploader.upload(text, "pkg-7", "notice.txt", "text/plain");
        assert(id == "created-1");
        assert(uploadedAuth == "token-123");
        assert(uploadedPackage == "pkg-7");
        assert(uploadedName == "notice.txt");
        std::cout << "[PASS] Multipart upload" << std::endl;
    }

    svr.stop();
    server.join();
    fs::remove_all(scratch);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
