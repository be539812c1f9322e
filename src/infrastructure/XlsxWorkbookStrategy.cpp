/**
 * @file XlsxWorkbookStrategy.cpp
 * @brief Implementation of XlsxWorkbookStrategy.
 */

#include "infrastructure/XlsxWorkbookStrategy.hpp"
#include <cctype>
#include <cstring>
#include <map>
#include <pugixml.hpp>
#include <stdexcept>
#include "infrastructure/OoxmlPackage.hpp"

namespace docingest::infrastructure {

using domain::ErrorKind;
using domain::StrategyResult;

namespace {

/// Concatenated w:t text of a rich string item, phonetic runs excluded.
std::string RichText(const pugi::xml_node& item) {
    std::string text;
    for (pugi::xml_node child : item.children()) {
        if (std::strcmp(child.name(), "t") == 0) {
            text += child.child_value();
        } else if (std::strcmp(child.name(), "r") == 0) {
            text += child.child("t").child_value();
        }
    }
    return text;
}

void ParsePart(pugi::xml_document& doc, const std::string& xml, const std::string& partName) {
    pugi::xml_parse_result parsed = doc.load_buffer(xml.data(), xml.size(), pugi::parse_default | pugi::parse_ws_pcdata_single);
    if (!parsed) {
        throw std::runtime_error("malformed " + partName + ": " + parsed.description());
    }
}

std::string ResolveTarget(const std::string& target) {
    if (!target.empty() && target.front() == '/') return target.substr(1);
    if (target.rfind("xl/", 0) == 0) return target;
    return "xl/" + target;
}

} // namespace

size_t XlsxWorkbookStrategy::ColumnIndex(const std::string& cellRef) {
    size_t column = 0;
    for (char c : cellRef) {
        if (!std::isalpha(static_cast<unsigned char>(c))) break;
        column = column * 26 + static_cast<size_t>(std::toupper(static_cast<unsigned char>(c)) - 'A' + 1);
    }
    return column;
}

size_t XlsxWorkbookStrategy::RowIndex(const std::string& cellRef) {
    size_t pos = 0;
    while (pos < cellRef.size() && std::isalpha(static_cast<unsigned char>(cellRef[pos]))) ++pos;
    size_t row = 0;
    for (; pos < cellRef.size() && std::isdigit(static_cast<unsigned char>(cellRef[pos])); ++pos) {
        row = row * 10 + static_cast<size_t>(cellRef[pos] - '0');
    }
    return row;
}

std::vector<std::string> XlsxWorkbookStrategy::LoadSharedStrings(const OoxmlPackage& package) {
    std::vector<std::string> strings;
    auto xml = package.readPart("xl/sharedStrings.xml");
    if (!xml) return strings;

    pugi::xml_document doc;
    ParsePart(doc, *xml, "sharedStrings.xml");
    for (pugi::xml_node item : doc.child("sst").children("si")) {
        strings.push_back(RichText(item));
    }
    return strings;
}

std::vector<std::string> XlsxWorkbookStrategy::SheetParts(const OoxmlPackage& package) {
    std::vector<std::string> parts;

    auto workbookXml = package.readPart("xl/workbook.xml");
    if (!workbookXml) {
        throw std::runtime_error("xl/workbook.xml is missing");
    }

    auto relsXml = package.readPart("xl/_rels/workbook.xml.rels");
    if (relsXml) {
        std::map<std::string, std::string> targets;
        pugi::xml_document rels;
        ParsePart(rels, *relsXml, "workbook.xml.rels");
        for (pugi::xml_node rel : rels.child("Relationships").children("Relationship")) {
            std::string id = rel.attribute("Id").as_string();
            std::string target = rel.attribute("Target").as_string();
            if (!id.empty() && !target.empty()) targets[id] = target;
        }

        pugi::xml_document workbook;
        ParsePart(workbook, *workbookXml, "workbook.xml");
        for (pugi::xml_node sheet : workbook.child("workbook").child("sheets").children("sheet")) {
            auto it = targets.find(sheet.attribute("r:id").as_string());
            if (it != targets.end()) {
                parts.push_back(ResolveTarget(it->second));
            }
        }
    }

    if (parts.empty()) {
        for (int index = 1;; ++index) {
            std::string candidate = "xl/worksheets/sheet" + std::to_string(index) + ".xml";
            if (!package.readPart(candidate)) break;
            parts.push_back(candidate);
        }
    }
    return parts;
}

std::string XlsxWorkbookStrategy::SheetText(const std::string& sheetXml, const std::vector<std::string>& sharedStrings) {
    pugi::xml_document doc;
    ParsePart(doc, sheetXml, "worksheet");

    std::map<size_t, std::map<size_t, std::string>> cells;
    size_t maxRow = 0;
    size_t maxCol = 0;

    size_t rowCursor = 0;
    for (pugi::xml_node row : doc.child("worksheet").child("sheetData").children("row")) {
        size_t rowIndex = row.attribute("r").as_uint(static_cast<unsigned>(rowCursor + 1));
        rowCursor = rowIndex;

        size_t colCursor = 0;
        for (pugi::xml_node cell : row.children("c")) {
            std::string ref = cell.attribute("r").as_string();
            size_t colIndex = ref.empty() ? colCursor + 1 : ColumnIndex(ref);
            if (colIndex == 0) colIndex = colCursor + 1;
            colCursor = colIndex;

            if (rowIndex > maxRow) maxRow = rowIndex;
            if (colIndex > maxCol) maxCol = colIndex;

            std::string type = cell.attribute("t").as_string();
            std::string raw = cell.child("v").child_value();
            std::string value;
            if (type == "s") {
                if (!raw.empty()) {
                    size_t idx = std::stoul(raw);
                    if (idx < sharedStrings.size()) value = sharedStrings[idx];
                }
            } else if (type == "inlineStr") {
                value = RichText(cell.child("is"));
            } else if (type == "b") {
                if (!raw.empty()) value = (raw == "1") ? "True" : "False";
            } else {
                value = raw;
            }

            if (!value.empty()) {
                cells[rowIndex][colIndex] = std::move(value);
            }
        }
    }

    // A sheet without cells contributes nothing.
    std::string out;
    for (size_t r = 1; r <= maxRow; ++r) {
        auto rowIt = cells.find(r);
        for (size_t c = 1; c <= maxCol; ++c) {
            if (c > 1) out += '\t';
            if (rowIt == cells.end()) continue;
            auto cellIt = rowIt->second.find(c);
            if (cellIt != rowIt->second.end()) out += cellIt->second;
        }
        out += '\n';
    }
    return out;
}

StrategyResult XlsxWorkbookStrategy::extract(const std::string& localPath) {
    try {
        OoxmlPackage package(localPath);
        std::vector<std::string> sharedStrings = LoadSharedStrings(package);

        std::string text;
        for (const auto& part : SheetParts(package)) {
            auto sheetXml = package.readPart(part);
            if (!sheetXml) {
                throw std::runtime_error("worksheet part " + part + " is missing");
            }
            text += SheetText(*sheetXml, sharedStrings);
        }
        return StrategyResult::Ok(std::move(text));
    } catch (const std::exception& e) {
        return StrategyResult::Fail(ErrorKind::EngineFailure, e.what());
    }
}

} // namespace docingest::infrastructure
