#include "fingrid/core/managers/WorksheetCSVHandler.hpp"
#include "fingrid/core/Worksheet.hpp"
#include "fingrid/utils/ModuleLoggers.hpp"
#include "fingrid/utils/NumberUtils.hpp"
#include "fingrid/utils/TextUtils.hpp"
#include <algorithm>
#include <set>

namespace fingrid {
namespace core {

WorksheetCSVHandler::WorksheetCSVHandler(Worksheet& worksheet)
    : worksheet_(worksheet) {
}

Result<CSVParseInfo> WorksheetCSVHandler::loadFromCSV(const std::string& filepath, const CSVOptions& options) {
    CORE_INFO("Loading CSV from file: {} into worksheet {}", filepath, worksheet_.getName());

    auto content = readTextFile(filepath);
    if (!content) {
        CORE_ERROR("Failed to read CSV file {}: {}", filepath, content.error().message);
        return content.error();
    }
    return loadFromCSVString(*content, options);
}

Result<CSVParseInfo> WorksheetCSVHandler::loadFromCSVString(const std::string& csv_content, const CSVOptions& options) {
    CORE_DEBUG("Loading CSV from string, content length: {}", csv_content.length());

    CSVProcessor processor(options);
    auto parsed = processor.parseString(csv_content);
    if (!parsed) {
        return parsed.error();
    }
    CSVTable& data = *parsed;

    CSVParseInfo info;
    size_t first_data_row = 0;
    if (options.has_header && !data.empty()) {
        info.has_header_row = true;
        info.column_names = data[0];
        first_data_row = 1;
    }

    if (data.size() - first_data_row > static_cast<size_t>(Constants::kMaxRows)) {
        return makeError(ErrorCode::InvalidRange, "CSV content exceeds the maximum row count");
    }

    CellMap cells;
    for (size_t r = first_data_row; r < data.size(); ++r) {
        const auto& row = data[r];
        info.columns_detected = std::max(info.columns_detected, static_cast<int>(row.size()));
        if (row.size() > static_cast<size_t>(Constants::kMaxColumns)) {
            return makeError(ErrorCode::InvalidRange, "CSV row exceeds the maximum column count",
                             fmt::format("row {}", r + 1));
        }
        for (size_t c = 0; c < row.size(); ++c) {
            if (row[c].empty()) {
                continue;
            }
            const CellAddress addr(static_cast<int>(r - first_data_row) + 1, static_cast<int>(c) + 1);
            cells[addr].setLiteral(inferValue(row[c]));
        }
    }
    info.rows_parsed = static_cast<int>(data.size() - first_data_row);

    // 旧地址与新地址都可能被公式引用
    std::set<CellAddress> changed;
    for (const auto& entry : worksheet_.getCells()) {
        changed.insert(entry.first);
    }
    for (const auto& entry : cells) {
        changed.insert(entry.first);
    }

    worksheet_.replaceCells(std::move(cells));
    worksheet_.commit(std::vector<CellAddress>(changed.begin(), changed.end()), "import csv");

    CORE_INFO("Imported {} CSV rows ({} columns) into {}", info.rows_parsed, info.columns_detected,
              worksheet_.getName());
    return info;
}

std::string WorksheetCSVHandler::toCSVString(const Worksheet& worksheet, const CSVOptions& options) {
    int last_row = 0;
    int last_col = 0;
    for (const auto& [addr, cell] : worksheet.getCells()) {
        if (!cell.getValue().isEmpty()) {
            last_row = std::max(last_row, addr.row);
            last_col = std::max(last_col, addr.col);
        }
    }

    CSVTable table;
    table.reserve(static_cast<size_t>(last_row));
    for (int r = 1; r <= last_row; ++r) {
        std::vector<std::string> row;
        row.reserve(static_cast<size_t>(last_col));
        for (int c = 1; c <= last_col; ++c) {
            row.push_back(getCellDisplayValue(worksheet, CellAddress(r, c)));
        }
        table.push_back(std::move(row));
    }
    return CSVProcessor(options).formatTable(table);
}

VoidResult WorksheetCSVHandler::saveAsCSV(const Worksheet& worksheet, const std::string& filepath,
                                          const CSVOptions& options) {
    CORE_INFO("Saving worksheet {} as CSV: {}", worksheet.getName(), filepath);
    return writeTextFile(filepath, toCSVString(worksheet, options));
}

CellValue WorksheetCSVHandler::inferValue(const std::string& field) {
    if (auto number = utils::NumberUtils::parseNumber(field)) {
        return *number;
    }
    if (utils::TextUtils::equalsIgnoreCase(field, "TRUE")) {
        return true;
    }
    if (utils::TextUtils::equalsIgnoreCase(field, "FALSE")) {
        return false;
    }
    if (auto error = parseErrorText(field)) {
        return *error;
    }
    return field;
}

std::string WorksheetCSVHandler::getCellDisplayValue(const Worksheet& worksheet, const CellAddress& addr) {
    return worksheet.readValue(addr).toDisplayString();
}

}} // namespace fingrid::core
