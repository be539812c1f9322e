/**
 * @file XlsxWorkbookStrategy.hpp
 * @brief Cell text of SpreadsheetML (.xlsx) workbooks.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/ExtractionStrategy.hpp"

namespace docingest::infrastructure {

class OoxmlPackage;

/**
 * @class XlsxWorkbookStrategy
 * @brief Emits every worksheet in workbook order as tab-separated rows.
 *
 * Each sheet covers rows 1..max and columns 1..max of its used range; an absent
 * cell is an empty string and every row ends with "\n"; a sheet without cells
 * yields no rows. Cached formula results
 * are used, booleans render as True/False.
 */
class XlsxWorkbookStrategy : public domain::ExtractionStrategy {
public:
    std::string name() const override { return "xlsx"; }
    domain::StrategyResult extract(const std::string& localPath) override;

    /** @brief Renders a single worksheet XML given the shared string table. */
    static std::string SheetText(const std::string& sheetXml, const std::vector<std::string>& sharedStrings);

    /** @brief 1-based column index of an A1-style reference ("C7" -> 3), 0 when absent. */
    static size_t ColumnIndex(const std::string& cellRef);

    /** @brief 1-based row index of an A1-style reference ("C7" -> 7), 0 when absent. */
    static size_t RowIndex(const std::string& cellRef);

private:
    static std::vector<std::string> LoadSharedStrings(const OoxmlPackage& package);
    static std::vector<std::string> SheetParts(const OoxmlPackage& package);
};

} // namespace docingest::infrastructure
