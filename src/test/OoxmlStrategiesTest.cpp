#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include <zip.h>
#include "infrastructure/DocxParagraphStrategy.hpp"
#include "infrastructure/XlsxWorkbookStrategy.hpp"

using namespace docingest::infrastructure;
namespace fs = std::filesystem;

// Writes a ZIP archive holding the given parts.
void WritePackage(const std::string& path, const std::vector<std::pair<std::string, std::string>>& parts) {
    int error = 0;
    zip_t* archive = zip_open(path.c_str(), ZIP_CREATE | ZIP_TRUNCATE, &error);
    assert(archive != nullptr);
    for (const auto& [name, content] : parts) {
        zip_source_t* source = zip_source_buffer(archive, content.data(), content.size(), 0);
        assert(source != nullptr);
        zip_int64_t index = zip_file_add(archive, name.c_str(), source, ZIP_FL_OVERWRITE);
        assert(index >= 0);
        (void)index;
    }
    int closed = zip_close(archive);
    assert(closed == 0);
    (void)closed;
}

const char* kWorkbook = R"(<?xml version="1.0" encoding="UTF-8"?>
<workbook xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main"
          xmlns:r="http://schemas.openxmlformats.org/officeDocument/2006/relationships">
  <sheets><sheet name="Data" sheetId="1" r:id="rId1"/><sheet name="Flags" sheetId="2" r:id="rId2"/></sheets>
</workbook>)";

const char* kWorkbookRels = R"(<?xml version="1.0" encoding="UTF-8"?>
<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships">
  <Relationship Id="rId1" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet" Target="worksheets/sheet1.xml"/>
  <Relationship Id="rId2" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet" Target="/xl/worksheets/sheet2.xml"/>
</Relationships>)";

const char* kSharedStrings = R"(<?xml version="1.0" encoding="UTF-8"?>
<sst xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main" count="2" uniqueCount="2">
  <si><t>a</t></si>
  <si><r><t>b</t></r></si>
</sst>)";

const char* kSheet1 = R"(<?xml version="1.0" encoding="UTF-8"?>
<worksheet xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main">
  <sheetData>
    <row r="1"><c r="A1" t="s"><v>0</v></c><c r="B1" t="s"><v>1</v></c></row>
    <row r="2"><c r="A2"><v>1</v></c><c r="B2"><v>2</v></c></row>
  </sheetData>
</worksheet>)";

const char* kSheet2 = R"(<?xml version="1.0" encoding="UTF-8"?>
<worksheet xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main">
  <sheetData>
    <row r="1"><c r="A1" t="inlineStr"><is><t>x</t></is></c></row>
    <row r="2"><c r="C2" t="b"><v>1</v></c></row>
  </sheetData>
</worksheet>)";

const char* kDocument = R"(<?xml version="1.0" encoding="UTF-8"?>
<w:document xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main">
  <w:body>
    <w:p><w:r><w:t>Hello</w:t></w:r><w:r><w:t xml:space="preserve"> world</w:t></w:r></w:p>
    <w:p/>
    <w:tbl><w:tr><w:tc><w:p><w:r><w:t>Cell</w:t><w:tab/><w:t>A</w:t></w:r></w:p></w:tc></w:tr></w:tbl>
    <w:p><w:r><w:t>Line</w:t><w:br/><w:t>Break</w:t></w:r></w:p>
    <w:sectPr/>
  </w:body>
</w:document>)";

int main() {
    std::cout << "[Test] OOXML strategies..." << std::endl;

    const std::string dir = "test_ooxml_fixtures";
    fs::create_directories(dir);

    // Single sheet round trip.
    {
        const std::string path = dir + "/simple.xlsx";
        WritePackage(path, {
            {"xl/workbook.xml", R"(<workbook xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main" xmlns:r="http://schemas.openxmlformats.org/officeDocument/2006/relationships"><sheets><sheet name="S" sheetId="1" r:id="rId1"/></sheets></workbook>)"},
            {"xl/_rels/workbook.xml.rels", kWorkbookRels},
            {"xl/sharedStrings.xml", kSharedStrings},
            {"xl/worksheets/sheet1.xml", kSheet1},
        });

        XlsxWorkbookStrategy xlsx;
        auto result = xlsx.extract(path);
        assert(result.success);
        assert(result.text == "a\tb\n1\t2\n");
        std::cout << "[PASS] Workbook cells tab-joined, rows newline-terminated" << std::endl;
    }

    // Several sheets, sparse cells, inline strings and booleans.
    {
        const std::string path = dir + "/multi.xlsx";
        WritePackage(path, {
            {"xl/workbook.xml", kWorkbook},
            {"xl/_rels/workbook.xml.rels", kWorkbookRels},
            {"xl/sharedStrings.xml", kSharedStrings},
            {"xl/worksheets/sheet1.xml", kSheet1},
            {"xl/worksheets/sheet2.xml", kSheet2},
        });

        XlsxWorkbookStrategy xlsx;
        auto result = xlsx.extract(path);
        assert(result.success);
        assert(result.text == "a\tb\n1\t2\nx\t\t\n\t\tTrue\n");
        std::cout << "[PASS] Sheets in workbook order with empty padding" << std::endl;
    }

    // Not a ZIP: the reader fails so the legacy reader can take over.
    {
        const std::string path = dir + "/legacy.xls";
        std::ofstream(path, std::ios::binary) << "\xD0\xCF\x11\xE0 not a zip";
        XlsxWorkbookStrategy xlsx;
        auto result = xlsx.extract(path);
        assert(!result.success);
        assert(result.errorKind == docingest::domain::ErrorKind::EngineFailure);
        assert(!result.error.empty());
        std::cout << "[PASS] Non-OOXML workbook rejected: " << result.error << std::endl;
    }

    // A worksheet with no cells renders as nothing.
    {
        const std::string emptySheet = R"(<worksheet xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main"><sheetData/></worksheet>)";
        assert(XlsxWorkbookStrategy::SheetText(emptySheet, {}).empty());
        assert(XlsxWorkbookStrategy::SheetText(kSheet1, {"a", "b"}) == "a\tb\n1\t2\n");
        std::cout << "[PASS] Empty worksheet yields no rows" << std::endl;
    }

    assert(XlsxWorkbookStrategy::ColumnIndex("A1") == 1);
    assert(XlsxWorkbookStrategy::ColumnIndex("AB12") == 28);
    assert(XlsxWorkbookStrategy::RowIndex("AB12") == 12);

    // Paragraph text.
    {
        const std::string path = dir + "/letter.docx";
        WritePackage(path, {{"word/document.xml", kDocument}});

        DocxParagraphStrategy docx;
        auto result = docx.extract(path);
        assert(result.success);
        assert(result.text == "Hello world\n\nCell\tA\nLine\nBreak");
        std::cout << "[PASS] DOCX paragraphs joined with newlines" << std::endl;
    }

    // A spreadsheet is not a word document.
    {
        DocxParagraphStrategy docx;
        auto result = docx.extract(dir + "/simple.xlsx");
        assert(!result.success);
        std::cout << "[PASS] Missing word/document.xml reported" << std::endl;
    }

    fs::remove_all(dir);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
