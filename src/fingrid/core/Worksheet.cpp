#include "fingrid/core/Worksheet.hpp"
#include "fingrid/core/Workbook.hpp"
#include "fingrid/core/managers/WorksheetCSVHandler.hpp"
#include "fingrid/utils/AddressParser.hpp"
#include "fingrid/utils/ModuleLoggers.hpp"
#include "fingrid/utils/NumberUtils.hpp"
#include "fingrid/utils/TextUtils.hpp"
#include "fingrid/utils/TimeUtils.hpp"
#include <algorithm>
#include <cctype>

namespace fingrid {
namespace core {

using utils::AddressParser;

Worksheet::Worksheet(const std::string& name, Workbook& workbook, int sheet_id)
    : name_(name)
    , workbook_(workbook)
    , sheet_id_(sheet_id) {
    const WorkbookOptions& options = workbook_.getOptions();
    metadata_.rows = options.default_rows;
    metadata_.columns = options.default_columns;
    metadata_.frozen_rows = options.default_frozen_rows;
    metadata_.frozen_columns = options.default_frozen_columns;
    revision_ = workbook_.nextRevision();
}

// ========== 单元格写入 ==========

VoidResult Worksheet::write(const CellAddress& addr, const CellValue& value, const WriteOptions& options) {
    auto check = checkAddress(addr);
    if (!check) {
        return check;
    }

    Cell& cell = prepareWrite(addr, utils::TimeUtils::nowISO8601());
    if (options.link) {
        cell.setLiteral(value, CellType::Link);
        cell.setLink(*options.link);
    } else {
        cell.setLiteral(value);
    }
    if (options.source) {
        cell.setSourceAnnotation(*options.source);
    }
    ensureDimensions(addr);

    CORE_DEBUG("Wrote {} to {}!{}", value.toDisplayString(), name_, AddressParser::toString(addr));
    commit({addr}, "write " + AddressParser::toString(addr));
    return success();
}

VoidResult Worksheet::setFormula(const CellAddress& addr, const std::string& formula) {
    auto check = checkAddress(addr);
    if (!check) {
        return check;
    }
    std::string text = utils::TextUtils::trim(formula);
    if (text.empty() || text == "=") {
        return makeError(ErrorCode::InvalidFormula, "Formula is empty", AddressParser::toString(addr));
    }
    if (text.front() != '=') {
        text.insert(text.begin(), '=');
    }

    Cell& cell = prepareWrite(addr, utils::TimeUtils::nowISO8601());
    cell.setFormula(text);
    ensureDimensions(addr);

    CORE_DEBUG("Set formula {} at {}!{}", text, name_, AddressParser::toString(addr));
    commit({addr}, "formula " + AddressParser::toString(addr));
    return success();
}

VoidResult Worksheet::enterText(const CellAddress& addr, const std::string& text) {
    const std::string trimmed = utils::TextUtils::trim(text);
    if (!trimmed.empty() && trimmed.front() == '=') {
        return setFormula(addr, trimmed);
    }
    if (utils::TextUtils::equalsIgnoreCase(trimmed, "TRUE")) {
        return write(addr, CellValue(true));
    }
    if (utils::TextUtils::equalsIgnoreCase(trimmed, "FALSE")) {
        return write(addr, CellValue(false));
    }
    if (auto number = utils::NumberUtils::parseNumber(trimmed)) {
        return write(addr, CellValue(*number));
    }
    if (trimmed.empty()) {
        return write(addr, CellValue());
    }
    return write(addr, CellValue(trimmed));
}

VoidResult Worksheet::clearRange(const CellAddress& start, const CellAddress& end) {
    const CellRange range(start, end);
    auto check = checkRange(range);
    if (!check) {
        return check;
    }

    std::vector<CellAddress> removed;
    for (auto it = cells_.lower_bound(range.first); it != cells_.end() && it->first.row <= range.last.row;) {
        if (range.contains(it->first)) {
            removed.push_back(it->first);
            it = cells_.erase(it);
        } else {
            ++it;
        }
    }
    if (removed.empty()) {
        return success();
    }

    CORE_DEBUG("Cleared {} cells in {}!{}", removed.size(), name_, AddressParser::toString(range));
    commit(removed, "clear " + AddressParser::toString(range));
    return success();
}

VoidResult Worksheet::writeRange(const CellAddress& start, const CellAddress& end, const ValueMatrix& matrix) {
    const CellRange range(start, end);
    auto check = checkRange(range);
    if (!check) {
        return check;
    }

    const std::string timestamp = utils::TimeUtils::nowISO8601();
    std::vector<CellAddress> written;
    const size_t row_limit = std::min(matrix.size(), static_cast<size_t>(range.rowCount()));
    for (size_t i = 0; i < row_limit; ++i) {
        const auto& row = matrix[i];
        const size_t col_limit = std::min(row.size(), static_cast<size_t>(range.colCount()));
        for (size_t j = 0; j < col_limit; ++j) {
            const CellAddress addr(range.first.row + static_cast<int>(i), range.first.col + static_cast<int>(j));
            const CellValue& value = row[j];
            Cell& cell = prepareWrite(addr, timestamp);
            if (value.isText() && value.asText().size() > 1 && value.asText().front() == '=') {
                cell.setFormula(value.asText());
            } else {
                cell.setLiteral(value);
            }
            ensureDimensions(addr);
            written.push_back(addr);
        }
    }
    if (written.empty()) {
        return success();
    }

    CORE_DEBUG("Wrote {} cells into {}!{}", written.size(), name_, AddressParser::toString(range));
    commit(written, "write range " + AddressParser::toString(range));
    return success();
}

// ========== 样式与附加信息 ==========

VoidResult Worksheet::styleCell(const CellAddress& addr, const CellStyle& style) {
    auto check = checkAddress(addr);
    if (!check) {
        return check;
    }
    cells_[addr].applyStyle(style);
    ensureDimensions(addr);
    commit({}, "style " + AddressParser::toString(addr));
    return success();
}

VoidResult Worksheet::styleRange(const CellRange& range, const CellStyle& style) {
    auto check = checkRange(range);
    if (!check) {
        return check;
    }
    if (range.size() > Constants::kMaxExpandedCells) {
        return makeError(ErrorCode::InvalidRange,
                         fmt::format("Range {} exceeds {} cells for styling", AddressParser::toString(range),
                                     Constants::kMaxExpandedCells),
                         name_);
    }
    for (const CellAddress& addr : range.addresses()) {
        cells_[addr].applyStyle(style);
    }
    ensureDimensions(range.last);
    commit({}, "style " + AddressParser::toString(range));
    return success();
}

VoidResult Worksheet::setComment(const CellAddress& addr, const std::string& comment) {
    auto check = checkAddress(addr);
    if (!check) {
        return check;
    }
    cells_[addr].setComment(comment);
    commit({}, "comment " + AddressParser::toString(addr));
    return success();
}

VoidResult Worksheet::setLink(const CellAddress& addr, const std::string& url) {
    auto check = checkAddress(addr);
    if (!check) {
        return check;
    }
    cells_[addr].setLink(url);
    commit({}, "link " + AddressParser::toString(addr));
    return success();
}

VoidResult Worksheet::setSourceAnnotation(const CellAddress& addr, const std::string& source) {
    auto check = checkAddress(addr);
    if (!check) {
        return check;
    }
    cells_[addr].setSourceAnnotation(source);
    commit({}, "source " + AddressParser::toString(addr));
    return success();
}

// ========== 读取 ==========

const Cell* Worksheet::read(const CellAddress& addr) const {
    auto it = cells_.find(addr);
    return it == cells_.end() ? nullptr : &it->second;
}

CellValue Worksheet::readValue(const CellAddress& addr) const {
    const Cell* cell = read(addr);
    return cell ? cell->getValue() : CellValue();
}

std::pair<int, int> Worksheet::getUsedRange() const {
    int max_row = 0;
    int max_col = 0;
    for (const auto& [addr, cell] : cells_) {
        max_row = std::max(max_row, addr.row);
        max_col = std::max(max_col, addr.col);
    }
    return {max_row, max_col};
}

// ========== 元数据 ==========

VoidResult Worksheet::setDimensions(int rows, int columns) {
    if (rows < 1 || rows > Constants::kMaxRows || columns < 1 || columns > Constants::kMaxColumns) {
        return makeError(ErrorCode::InvalidArgument,
                         fmt::format("Invalid sheet dimensions {}x{}", rows, columns));
    }
    metadata_.rows = rows;
    metadata_.columns = columns;
    metadata_.frozen_rows = std::min(metadata_.frozen_rows, rows);
    metadata_.frozen_columns = std::min(metadata_.frozen_columns, columns);
    return success();
}

VoidResult Worksheet::setFrozenPanes(int rows, int columns) {
    if (rows < 0 || columns < 0 || rows > metadata_.rows || columns > metadata_.columns) {
        return makeError(ErrorCode::InvalidArgument,
                         fmt::format("Invalid frozen panes {}x{}", rows, columns));
    }
    metadata_.frozen_rows = rows;
    metadata_.frozen_columns = columns;
    return success();
}

VoidResult Worksheet::setRowHidden(int row, bool hidden) {
    if (row < 1 || row > Constants::kMaxRows) {
        return makeError(ErrorCode::InvalidArgument, fmt::format("Invalid row {}", row));
    }
    if (hidden) {
        metadata_.hidden_rows.insert(row);
    } else {
        metadata_.hidden_rows.erase(row);
    }
    return success();
}

VoidResult Worksheet::setColumnHidden(int column, bool hidden) {
    if (column < 1 || column > Constants::kMaxColumns) {
        return makeError(ErrorCode::InvalidArgument, fmt::format("Invalid column {}", column));
    }
    if (hidden) {
        metadata_.hidden_columns.insert(column);
    } else {
        metadata_.hidden_columns.erase(column);
    }
    return success();
}

VoidResult Worksheet::setRowHeight(int row, double height) {
    if (row < 1 || row > Constants::kMaxRows || !(height > 0)) {
        return makeError(ErrorCode::InvalidArgument, fmt::format("Invalid height {} for row {}", height, row));
    }
    metadata_.row_heights[row] = height;
    return success();
}

VoidResult Worksheet::setColumnWidth(int column, double width) {
    if (column < 1 || column > Constants::kMaxColumns || !(width > 0)) {
        return makeError(ErrorCode::InvalidArgument,
                         fmt::format("Invalid width {} for column {}", width, column));
    }
    metadata_.column_widths[column] = width;
    return success();
}

std::optional<double> Worksheet::getRowHeight(int row) const {
    auto it = metadata_.row_heights.find(row);
    if (it == metadata_.row_heights.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<double> Worksheet::getColumnWidth(int column) const {
    auto it = metadata_.column_widths.find(column);
    if (it == metadata_.column_widths.end()) {
        return std::nullopt;
    }
    return it->second;
}

VoidResult Worksheet::mergeRange(const CellRange& range) {
    auto check = checkRange(range);
    if (!check) {
        return check;
    }
    if (range.isSingleCell()) {
        return makeError(ErrorCode::InvalidRange, "Cannot merge a single cell", AddressParser::toString(range));
    }
    for (const CellRange& merged : metadata_.merged_ranges) {
        if (merged.intersects(range)) {
            return makeError(ErrorCode::InvalidRange, "Range overlaps an existing merged range",
                             AddressParser::toString(range));
        }
    }
    metadata_.merged_ranges.push_back(range);
    CORE_DEBUG("Merged {}!{}", name_, AddressParser::toString(range));
    return success();
}

VoidResult Worksheet::unmergeRange(const CellRange& range) {
    auto& merged = metadata_.merged_ranges;
    auto it = std::find(merged.begin(), merged.end(), range);
    if (it == merged.end()) {
        return makeError(ErrorCode::InvalidRange, "Range is not merged", AddressParser::toString(range));
    }
    merged.erase(it);
    return success();
}

// ========== 条件格式 ==========

Result<std::string> Worksheet::addConditionalFormat(ConditionalFormat rule) {
    auto check = checkRange(rule.range);
    if (!check) {
        return check.error();
    }

    auto& rules = metadata_.conditional_formats;
    auto id_taken = [&rules](const std::string& id) {
        return std::any_of(rules.begin(), rules.end(),
                           [&id](const ConditionalFormat& existing) { return existing.id == id; });
    };
    if (rule.id.empty()) {
        do {
            rule.id = fmt::format("cf{}", next_format_id_++);
        } while (id_taken(rule.id));
    } else if (id_taken(rule.id)) {
        return makeError(ErrorCode::InvalidArgument, "Conditional format id already exists", rule.id);
    }

    std::string id = rule.id;
    rules.push_back(std::move(rule));
    CORE_DEBUG("Added conditional format {} on {}", id, name_);
    workbook_.onFormatsChanged(*this);
    return id;
}

VoidResult Worksheet::removeConditionalFormat(const std::string& id) {
    auto& rules = metadata_.conditional_formats;
    auto it = std::find_if(rules.begin(), rules.end(),
                           [&id](const ConditionalFormat& rule) { return rule.id == id; });
    if (it == rules.end()) {
        return makeError(ErrorCode::InvalidArgument, "Conditional format not found", id);
    }
    rules.erase(it);
    workbook_.onFormatsChanged(*this);
    return success();
}

CellStyle Worksheet::effectiveStyle(const CellAddress& addr) const {
    CellStyle style;
    if (const Cell* cell = read(addr)) {
        style = cell->getStyle();
    }
    auto it = overlay_.find(addr);
    if (it != overlay_.end()) {
        mergeStyle(style, it->second);
    }
    return style;
}

// ========== 命名范围 ==========

bool Worksheet::isValidName(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    const unsigned char first = static_cast<unsigned char>(name.front());
    if (!std::isalpha(first) && first != '_') {
        return false;
    }
    for (char c : name) {
        const unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '_' && c != '.') {
            return false;
        }
    }
    if (AddressParser::looksLikeAddress(name)) {
        return false;
    }
    return !utils::TextUtils::equalsIgnoreCase(name, "TRUE") && !utils::TextUtils::equalsIgnoreCase(name, "FALSE");
}

VoidResult Worksheet::defineName(const std::string& name, const CellRange& range) {
    if (!isValidName(name)) {
        return makeError(ErrorCode::InvalidArgument, "Invalid range name", name);
    }
    auto check = checkRange(range);
    if (!check) {
        return check;
    }
    metadata_.named_ranges[utils::TextUtils::toUpper(name)] = NamedRange{name, range};
    CORE_DEBUG("Defined name {} = {}!{}", name, name_, AddressParser::toString(range));
    workbook_.onNamesChanged();
    return success();
}

VoidResult Worksheet::removeName(const std::string& name) {
    if (metadata_.named_ranges.erase(utils::TextUtils::toUpper(name)) == 0) {
        return makeError(ErrorCode::InvalidArgument, "Range name not defined", name);
    }
    workbook_.onNamesChanged();
    return success();
}

std::optional<NamedRange> Worksheet::findName(const std::string& name) const {
    auto it = metadata_.named_ranges.find(utils::TextUtils::toUpper(name));
    if (it == metadata_.named_ranges.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ========== CSV ==========

std::string Worksheet::toCSVString(const CSVOptions& options) const {
    return WorksheetCSVHandler::toCSVString(*this, options);
}

VoidResult Worksheet::saveAsCSV(const std::string& filepath, const CSVOptions& options) const {
    return WorksheetCSVHandler::saveAsCSV(*this, filepath, options);
}

Result<CSVParseInfo> Worksheet::loadFromCSVString(const std::string& content, const CSVOptions& options) {
    return WorksheetCSVHandler(*this).loadFromCSVString(content, options);
}

Result<CSVParseInfo> Worksheet::loadFromCSV(const std::string& filepath, const CSVOptions& options) {
    return WorksheetCSVHandler(*this).loadFromCSV(filepath, options);
}

// ========== 供工作簿、管理器与重算控制器使用 ==========

void Worksheet::setComputedValue(const CellAddress& addr, const CellValue& value) {
    Cell* cell = findCell(addr);
    if (!cell || cell->getValue() == value) {
        return;
    }
    cell->setComputedValue(value);
    touch();
}

Cell* Worksheet::findCell(const CellAddress& addr) {
    auto it = cells_.find(addr);
    return it == cells_.end() ? nullptr : &it->second;
}

void Worksheet::replaceCells(CellMap cells) {
    cells_ = std::move(cells);
    for (const auto& entry : cells_) {
        ensureDimensions(entry.first);
    }
    touch();
}

void Worksheet::restoreCells(const CellMap& cells, uint64_t revision) {
    cells_ = cells;
    revision_ = revision;
}

std::shared_ptr<Worksheet> Worksheet::clone(const std::string& name, int sheet_id) const {
    auto copy = std::make_shared<Worksheet>(name, workbook_, sheet_id);
    copy->cells_ = cells_;
    copy->metadata_ = metadata_;
    copy->overlay_ = overlay_;
    copy->next_format_id_ = next_format_id_;
    copy->touch();
    return copy;
}

// ========== 内部 ==========

VoidResult Worksheet::checkAddress(const CellAddress& addr) const {
    if (addr.row < 1 || addr.row > Constants::kMaxRows || addr.col < 1 || addr.col > Constants::kMaxColumns) {
        return makeError(ErrorCode::InvalidCellReference,
                         fmt::format("Cell address out of range (row {}, column {})", addr.row, addr.col),
                         name_);
    }
    return success();
}

VoidResult Worksheet::checkRange(const CellRange& range) const {
    auto first = checkAddress(range.first);
    if (!first) {
        return makeError(ErrorCode::InvalidRange, first.error().message, name_);
    }
    auto last = checkAddress(range.last);
    if (!last) {
        return makeError(ErrorCode::InvalidRange, last.error().message, name_);
    }
    return success();
}

void Worksheet::ensureDimensions(const CellAddress& addr) {
    metadata_.rows = std::max(metadata_.rows, addr.row);
    metadata_.columns = std::max(metadata_.columns, addr.col);
}

Cell& Worksheet::prepareWrite(const CellAddress& addr, const std::string& timestamp) {
    Cell& cell = cells_[addr];
    cell.appendHistory(cell.getValue(), timestamp);
    return cell;
}

void Worksheet::touch() {
    revision_ = workbook_.nextRevision();
}

void Worksheet::commit(const std::vector<CellAddress>& changed, const std::string& label) {
    touch();
    workbook_.onCellsChanged(*this, changed, label);
}

}} // namespace fingrid::core
