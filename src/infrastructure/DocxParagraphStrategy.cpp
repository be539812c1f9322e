/**
 * @file DocxParagraphStrategy.cpp
 * @brief Implementation of DocxParagraphStrategy.
 */

#include "infrastructure/DocxParagraphStrategy.hpp"
#include <cstring>
#include <pugixml.hpp>
#include <stdexcept>
#include <vector>
#include "infrastructure/OoxmlPackage.hpp"

namespace docingest::infrastructure {

using domain::ErrorKind;
using domain::StrategyResult;

namespace {

void AppendRunText(const pugi::xml_node& node, std::string& out) {
    for (pugi::xml_node child : node.children()) {
        const char* tag = child.name();
        if (std::strcmp(tag, "w:t") == 0) {
            out += child.child_value();
        } else if (std::strcmp(tag, "w:tab") == 0) {
            out += '\t';
        } else if (std::strcmp(tag, "w:br") == 0 || std::strcmp(tag, "w:cr") == 0) {
            out += '\n';
        } else if (std::strcmp(tag, "w:p") == 0) {
            // Nested paragraphs (text boxes) are collected on their own.
            continue;
        } else {
            AppendRunText(child, out);
        }
    }
}

void CollectParagraphs(const pugi::xml_node& node, std::vector<std::string>& paragraphs) {
    for (pugi::xml_node child : node.children()) {
        if (std::strcmp(child.name(), "w:p") == 0) {
            std::string text;
            AppendRunText(child, text);
            paragraphs.push_back(std::move(text));
        } else if (std::strcmp(child.name(), "w:sectPr") != 0) {
            CollectParagraphs(child, paragraphs);
        }
    }
}

} // namespace

std::string DocxParagraphStrategy::ParagraphText(const std::string& documentXml) {
    pugi::xml_document doc;
    pugi::xml_parse_result parsed = doc.load_buffer(documentXml.data(), documentXml.size(),
                                                    pugi::parse_default | pugi::parse_ws_pcdata_single);
    if (!parsed) {
        throw std::runtime_error(std::string("malformed document.xml: ") + parsed.description());
    }

    pugi::xml_node body = doc.child("w:document").child("w:body");
    if (!body) {
        throw std::runtime_error("document.xml has no w:body");
    }

    std::vector<std::string> paragraphs;
    CollectParagraphs(body, paragraphs);

    std::string text;
    for (size_t i = 0; i < paragraphs.size(); ++i) {
        if (i > 0) text += '\n';
        text += paragraphs[i];
    }
    return text;
}

StrategyResult DocxParagraphStrategy::extract(const std::string& localPath) {
    try {
        OoxmlPackage package(localPath);
        auto documentXml = package.readPart("word/document.xml");
        if (!documentXml) {
            return StrategyResult::Fail(ErrorKind::EngineFailure, "word/document.xml is missing");
        }
        return StrategyResult::Ok(ParagraphText(*documentXml));
    } catch (const std::exception& e) {
        return StrategyResult::Fail(ErrorKind::EngineFailure, e.what());
    }
}

} // namespace docingest::infrastructure
