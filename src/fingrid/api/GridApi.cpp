#include "fingrid/api/GridApi.hpp"
#include "fingrid/utils/AddressParser.hpp"
#include "fingrid/utils/ModuleLoggers.hpp"
#include "fingrid/xml/StateSerializer.hpp"
#include <fmt/format.h>

namespace fingrid {
namespace api {

using core::ErrorCode;
using core::makeError;
using utils::AddressParser;

// ========== 写入 ==========

core::VoidResult GridApi::write(const std::string& address, const core::CellValue& value,
                                const core::WriteOptions& options) {
    auto target = resolveCell(address);
    if (!target) {
        API_WARN("write rejected: {}", target.error().fullMessage());
        return target.error();
    }
    API_DEBUG("write {} = {}", address, value.toDisplayString());
    return target.value().first->write(target.value().second, value, options);
}

core::VoidResult GridApi::setFormula(const std::string& address, const std::string& formula) {
    auto target = resolveCell(address);
    if (!target) {
        API_WARN("setFormula rejected: {}", target.error().fullMessage());
        return target.error();
    }
    API_DEBUG("formula {} = {}", address, formula);
    return target.value().first->setFormula(target.value().second, formula);
}

core::VoidResult GridApi::styleCell(const std::string& address, const core::CellStyle& style) {
    auto target = resolve(address);
    if (!target) {
        return target.error();
    }
    const Target& t = target.value();
    if (t.range.isSingleCell()) {
        return t.sheet->styleCell(t.range.first, style);
    }
    return t.sheet->styleRange(t.range, style);
}

core::VoidResult GridApi::clearRange(const std::string& start, const std::string& end) {
    auto first = resolve(start);
    if (!first) {
        return first.error();
    }
    core::CellRange range = first.value().range;
    if (!end.empty()) {
        auto last = resolve(end);
        if (!last) {
            return last.error();
        }
        if (last.value().sheet != first.value().sheet && end.find('!') != std::string::npos) {
            return makeError(ErrorCode::InvalidRange, "Range spans two sheets", start + ":" + end);
        }
        range = core::CellRange(range.first, last.value().range.last);
    }
    API_DEBUG("clear {}", AddressParser::toString(range));
    return first.value().sheet->clearRange(range.first, range.last);
}

core::VoidResult GridApi::writeRange(const std::string& start, const std::string& end,
                                     const core::ValueMatrix& values) {
    auto first = resolveCell(start);
    if (!first) {
        return first.error();
    }
    auto last = resolve(end);
    if (!last) {
        return last.error();
    }
    if (last.value().sheet != first.value().first && end.find('!') != std::string::npos) {
        return makeError(ErrorCode::InvalidRange, "Range spans two sheets", start + ":" + end);
    }
    API_DEBUG("writeRange {}:{} ({} rows)", start, end, values.size());
    return first.value().first->writeRange(first.value().second, last.value().range.last, values);
}

core::VoidResult GridApi::link(const std::string& address, const std::string& text, const std::string& url) {
    core::WriteOptions options;
    options.link = url;
    return write(address, core::CellValue(text), options);
}

// ========== 读取 ==========

core::Result<core::CellValue> GridApi::readValue(const std::string& address) const {
    auto target = resolveCell(address);
    if (!target) {
        return target.error();
    }
    return target.value().first->readValue(target.value().second);
}

core::CellValue GridApi::evaluate(const std::string& formula) {
    return workbook_.evaluate(workbook_.getActiveSheetId(), formula);
}

// ========== 布局与格式 ==========

core::VoidResult GridApi::setColumnWidth(int column, double width) {
    return workbook_.getActiveSheet()->setColumnWidth(column, width);
}

core::VoidResult GridApi::setRowHeight(int row, double height) {
    return workbook_.getActiveSheet()->setRowHeight(row, height);
}

core::Result<std::string> GridApi::addConditionalFormat(const std::string& range, core::ConditionalFormat rule) {
    auto target = resolve(range);
    if (!target) {
        return target.error();
    }
    rule.range = target.value().range;
    return target.value().sheet->addConditionalFormat(std::move(rule));
}

core::VoidResult GridApi::defineName(const std::string& name, const std::string& range) {
    auto target = resolve(range);
    if (!target) {
        return target.error();
    }
    return target.value().sheet->defineName(name, target.value().range);
}

// ========== 状态与交换 ==========

core::VoidResult GridApi::importState(const core::WorkbookState& state) {
    auto result = workbook_.importState(state);
    if (!result) {
        API_WARN("importState rejected: {}", result.error().fullMessage());
    }
    return result;
}

std::string GridApi::exportXml() const {
    return xml::StateSerializer::toXML(workbook_.exportState());
}

core::VoidResult GridApi::importXml(const std::string& xml) {
    auto state = xml::StateSerializer::fromXML(xml);
    if (!state) {
        API_WARN("importXml rejected: {}", state.error().fullMessage());
        return state.error();
    }
    return importState(state.value());
}

core::Result<std::string> GridApi::exportCsv(const std::string& sheet, const core::CSVOptions& options) const {
    auto target = resolveSheet(sheet);
    if (!target) {
        return target.error();
    }
    return target.value()->toCSVString(options);
}

core::Result<core::CSVParseInfo> GridApi::importCsv(const std::string& content, const std::string& sheet,
                                                    const core::CSVOptions& options) {
    auto target = resolveSheet(sheet);
    if (!target) {
        return target.error();
    }
    return target.value()->loadFromCSVString(content, options);
}

// ========== 内部 ==========

core::Result<core::Worksheet*> GridApi::resolveSheet(const std::string& name) const {
    auto sheet = name.empty() ? workbook_.getActiveSheet() : workbook_.getSheet(name);
    if (!sheet) {
        return makeError(ErrorCode::InvalidWorksheet, "Worksheet not found", name);
    }
    return sheet.get();
}

core::Result<GridApi::Target> GridApi::resolve(const std::string& reference) const {
    auto qualified = AddressParser::splitQualified(reference);
    if (!qualified) {
        return qualified.error();
    }
    if (qualified.value().isSheetSpan()) {
        return makeError(ErrorCode::InvalidCellReference, "Sheet spans are read-only references", reference);
    }
    auto sheet = resolveSheet(qualified.value().first_sheet);
    if (!sheet) {
        return sheet.error();
    }
    auto range = AddressParser::parseRange(qualified.value().local);
    if (!range) {
        return makeError(range.error().code, range.error().message, reference);
    }
    return Target{sheet.value(), range.value()};
}

core::Result<std::pair<core::Worksheet*, core::CellAddress>> GridApi::resolveCell(const std::string& address) const {
    auto target = resolve(address);
    if (!target) {
        return target.error();
    }
    if (!target.value().range.isSingleCell()) {
        return makeError(ErrorCode::InvalidCellReference, "Expected a single cell", address);
    }
    return std::make_pair(target.value().sheet, target.value().range.first);
}

}} // namespace fingrid::api
