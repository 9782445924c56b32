#include "fingrid/xml/StateSerializer.hpp"
#include "fingrid/core/CSVProcessor.hpp"
#include "fingrid/utils/AddressParser.hpp"
#include "fingrid/utils/ModuleLoggers.hpp"
#include "fingrid/utils/NumberUtils.hpp"
#include "fingrid/utils/TextUtils.hpp"
#include "fingrid/xml/XMLStreamReader.hpp"
#include "fingrid/xml/XMLStreamWriter.hpp"
#include <cmath>
#include <fmt/format.h>
#include <map>
#include <set>
#include <string>

namespace fingrid {
namespace xml {

using core::CellValue;
using core::ErrorCode;
using core::makeError;
using utils::AddressParser;
using Element = XMLStreamReader::SimpleElement;

namespace {

// ========== 写出 ==========

std::string valueText(const CellValue& value) {
    switch (value.kind()) {
        case CellValue::Kind::Number:
            return fmt::format("{}", value.asNumber());
        case CellValue::Kind::Text:
            return value.asText();
        case CellValue::Kind::Boolean:
            return value.asBoolean() ? "TRUE" : "FALSE";
        case CellValue::Kind::Error:
            return core::errorText(value.asError());
        case CellValue::Kind::Empty:
            break;
    }
    return "";
}

void writeValue(XMLStreamWriter& writer, const CellValue& value, const char* kind_attr, const char* value_attr) {
    writer.writeAttribute(kind_attr, core::kindName(value.kind()));
    if (!value.isEmpty()) {
        writer.writeAttribute(value_attr, valueText(value));
    }
}

void writeStyle(XMLStreamWriter& writer, const core::CellStyle& style) {
    for (const auto& entry : style) {
        writer.startElement("style");
        writer.writeAttribute("key", entry.first);
        writer.writeAttribute("value", entry.second);
        writer.endElement();
    }
}

void writeOptional(XMLStreamWriter& writer, const char* name, const std::string& value) {
    if (!value.empty()) {
        writer.writeAttribute(name, value);
    }
}

void writeCell(XMLStreamWriter& writer, const core::CellAddress& addr, const core::Cell& cell) {
    writer.startElement("cell");
    writer.writeAttribute("ref", AddressParser::toString(addr));
    writer.writeAttribute("type", core::cellTypeName(cell.getType()));
    writeValue(writer, cell.getValue(), "kind", "v");
    writeOptional(writer, "formula", cell.getFormula());
    writeOptional(writer, "link", cell.getLink());
    writeOptional(writer, "source", cell.getSourceAnnotation());
    writeOptional(writer, "comment", cell.getComment());

    writeStyle(writer, cell.getStyle());
    for (const auto& entry : cell.getHistory()) {
        writer.startElement("history");
        writeValue(writer, entry.value, "kind", "v");
        writer.writeAttribute("timestamp", entry.timestamp);
        writer.endElement();
    }
    writer.endElement();
}

void writeSheet(XMLStreamWriter& writer, const core::SheetState& sheet) {
    const core::SheetMetadata& meta = sheet.metadata;

    writer.startElement("sheet");
    writer.writeAttribute("id", sheet.id);
    writer.writeAttribute("name", sheet.name);
    writer.writeAttribute("rows", meta.rows);
    writer.writeAttribute("cols", meta.columns);
    writer.writeAttribute("frozenRows", meta.frozen_rows);
    writer.writeAttribute("frozenCols", meta.frozen_columns);

    for (int row : meta.hidden_rows) {
        writer.startElement("hiddenRow");
        writer.writeAttribute("index", row);
        writer.endElement();
    }
    for (int col : meta.hidden_columns) {
        writer.startElement("hiddenColumn");
        writer.writeAttribute("index", col);
        writer.endElement();
    }
    for (const auto& entry : meta.row_heights) {
        writer.startElement("rowHeight");
        writer.writeAttribute("index", entry.first);
        writer.writeAttribute("value", entry.second);
        writer.endElement();
    }
    for (const auto& entry : meta.column_widths) {
        writer.startElement("columnWidth");
        writer.writeAttribute("index", entry.first);
        writer.writeAttribute("value", entry.second);
        writer.endElement();
    }
    for (const auto& range : meta.merged_ranges) {
        writer.startElement("merge");
        writer.writeAttribute("ref", AddressParser::toString(range));
        writer.endElement();
    }
    for (const auto& entry : meta.named_ranges) {
        writer.startElement("name");
        writer.writeAttribute("name", entry.second.name);
        writer.writeAttribute("ref", AddressParser::toString(entry.second.range));
        writer.endElement();
    }
    for (const auto& rule : meta.conditional_formats) {
        writer.startElement("conditionalFormat");
        writer.writeAttribute("id", rule.id);
        writer.writeAttribute("ref", AddressParser::toString(rule.range));
        writer.writeAttribute("condition", core::conditionKindName(rule.condition));
        writeValue(writer, rule.value, "kind", "value");
        writeValue(writer, rule.value2, "kind2", "value2");
        writeStyle(writer, rule.style);
        writer.endElement();
    }
    for (const auto& entry : sheet.cells) {
        writeCell(writer, entry.first, entry.second);
    }
    writer.endElement();
}

// ========== 读取 ==========

core::Error missingAttribute(const Element& element, const std::string& attr) {
    return makeError(ErrorCode::XmlMissingElement,
                     fmt::format("Element <{}> is missing attribute '{}'", element.name, attr));
}

core::Result<std::string> requireAttribute(const Element& element, const std::string& attr) {
    if (!element.hasAttribute(attr)) {
        return missingAttribute(element, attr);
    }
    return element.getAttribute(attr);
}

core::Result<double> numberAttribute(const Element& element, const std::string& attr) {
    auto text = requireAttribute(element, attr);
    if (!text) {
        return text.error();
    }
    auto number = utils::NumberUtils::parseNumber(text.value());
    if (!number) {
        return makeError(ErrorCode::InvalidFormat,
                         fmt::format("Attribute '{}' of <{}> is not a number: {}", attr, element.name, text.value()));
    }
    return *number;
}

core::Result<int> intAttribute(const Element& element, const std::string& attr) {
    auto number = numberAttribute(element, attr);
    if (!number) {
        return number.error();
    }
    double value = number.value();
    if (value != std::floor(value) || std::fabs(value) > 2147483647.0) {
        return makeError(ErrorCode::InvalidFormat,
                         fmt::format("Attribute '{}' of <{}> is not an integer", attr, element.name));
    }
    return static_cast<int>(value);
}

core::Result<core::CellRange> rangeAttribute(const Element& element) {
    auto text = requireAttribute(element, "ref");
    if (!text) {
        return text.error();
    }
    return AddressParser::parseRange(text.value());
}

core::Result<CellValue> readValue(const Element& element, const std::string& kind_attr, const std::string& value_attr) {
    std::string kind = element.getAttribute(kind_attr, "empty");
    std::string text = element.getAttribute(value_attr);

    if (kind == "empty") {
        return CellValue();
    }
    if (kind == "text") {
        return CellValue(text);
    }
    if (kind == "number") {
        auto number = utils::NumberUtils::parseNumber(text);
        if (!number) {
            return makeError(ErrorCode::InvalidFormat, "Invalid number value: " + text);
        }
        return CellValue(*number);
    }
    if (kind == "boolean") {
        if (text == "TRUE") {
            return CellValue(true);
        }
        if (text == "FALSE") {
            return CellValue(false);
        }
        return makeError(ErrorCode::InvalidFormat, "Invalid boolean value: " + text);
    }
    if (kind == "error") {
        auto error = core::parseErrorText(text);
        if (!error) {
            return makeError(ErrorCode::InvalidFormat, "Invalid error value: " + text);
        }
        return CellValue(*error);
    }
    return makeError(ErrorCode::InvalidFormat, "Unknown value kind: " + kind);
}

core::Result<core::CellStyle> readStyle(const Element& element) {
    core::CellStyle style;
    for (const Element* child : element.findChildren("style")) {
        auto key = requireAttribute(*child, "key");
        if (!key) {
            return key.error();
        }
        style[key.value()] = child->getAttribute("value");
    }
    return style;
}

core::VoidResult readCell(const Element& element, core::CellMap& cells) {
    auto ref = requireAttribute(element, "ref");
    if (!ref) {
        return ref.error();
    }
    auto addr = AddressParser::parseAddress(ref.value());
    if (!addr) {
        return addr.error();
    }
    auto type_name = requireAttribute(element, "type");
    if (!type_name) {
        return type_name.error();
    }
    auto type = core::parseCellType(type_name.value());
    if (!type) {
        return makeError(ErrorCode::InvalidFormat, "Unknown cell type: " + type_name.value(), ref.value());
    }
    auto value = readValue(element, "kind", "v");
    if (!value) {
        return value.error();
    }

    core::Cell cell;
    std::string formula = element.getAttribute("formula");
    if (!formula.empty()) {
        cell.setFormula(formula);
        cell.setComputedValue(value.value());
    } else {
        cell.setLiteral(value.value(), *type);
    }
    if (element.hasAttribute("link")) {
        cell.setLink(element.getAttribute("link"));
    }
    if (element.hasAttribute("source")) {
        cell.setSourceAnnotation(element.getAttribute("source"));
    }
    if (element.hasAttribute("comment")) {
        cell.setComment(element.getAttribute("comment"));
    }

    auto style = readStyle(element);
    if (!style) {
        return style.error();
    }
    if (!style.value().empty()) {
        cell.setStyle(style.value());
    }

    for (const Element* child : element.findChildren("history")) {
        auto previous = readValue(*child, "kind", "v");
        if (!previous) {
            return previous.error();
        }
        cell.appendHistory(previous.value(), child->getAttribute("timestamp"));
    }

    if (!cells.emplace(addr.value(), std::move(cell)).second) {
        return makeError(ErrorCode::InvalidFormat, "Duplicate cell", ref.value());
    }
    return core::success();
}

core::VoidResult readIndexList(const Element& element, const std::string& tag, std::set<int>& target) {
    for (const Element* child : element.findChildren(tag)) {
        auto index = intAttribute(*child, "index");
        if (!index) {
            return index.error();
        }
        target.insert(index.value());
    }
    return core::success();
}

core::VoidResult readSizeList(const Element& element, const std::string& tag, std::map<int, double>& target) {
    for (const Element* child : element.findChildren(tag)) {
        auto index = intAttribute(*child, "index");
        if (!index) {
            return index.error();
        }
        auto size = numberAttribute(*child, "value");
        if (!size) {
            return size.error();
        }
        target[index.value()] = size.value();
    }
    return core::success();
}

core::Result<core::ConditionalFormat> readConditionalFormat(const Element& element) {
    core::ConditionalFormat rule;
    auto id = requireAttribute(element, "id");
    if (!id) {
        return id.error();
    }
    rule.id = id.value();

    auto range = rangeAttribute(element);
    if (!range) {
        return range.error();
    }
    rule.range = range.value();

    auto condition_name = requireAttribute(element, "condition");
    if (!condition_name) {
        return condition_name.error();
    }
    auto condition = core::parseConditionKind(condition_name.value());
    if (!condition) {
        return makeError(ErrorCode::InvalidFormat, "Unknown condition: " + condition_name.value(), rule.id);
    }
    rule.condition = *condition;

    auto value = readValue(element, "kind", "value");
    if (!value) {
        return value.error();
    }
    rule.value = value.value();
    auto value2 = readValue(element, "kind2", "value2");
    if (!value2) {
        return value2.error();
    }
    rule.value2 = value2.value();

    auto style = readStyle(element);
    if (!style) {
        return style.error();
    }
    rule.style = style.value();
    return rule;
}

core::Result<core::SheetState> readSheet(const Element& element) {
    core::SheetState sheet;

    auto id = intAttribute(element, "id");
    if (!id) {
        return id.error();
    }
    sheet.id = id.value();
    auto name = requireAttribute(element, "name");
    if (!name) {
        return name.error();
    }
    sheet.name = name.value();

    core::SheetMetadata& meta = sheet.metadata;
    auto rows = intAttribute(element, "rows");
    auto cols = intAttribute(element, "cols");
    auto frozen_rows = intAttribute(element, "frozenRows");
    auto frozen_cols = intAttribute(element, "frozenCols");
    if (!rows) return rows.error();
    if (!cols) return cols.error();
    if (!frozen_rows) return frozen_rows.error();
    if (!frozen_cols) return frozen_cols.error();
    meta.rows = rows.value();
    meta.columns = cols.value();
    meta.frozen_rows = frozen_rows.value();
    meta.frozen_columns = frozen_cols.value();

    auto check = readIndexList(element, "hiddenRow", meta.hidden_rows);
    if (check) check = readIndexList(element, "hiddenColumn", meta.hidden_columns);
    if (check) check = readSizeList(element, "rowHeight", meta.row_heights);
    if (check) check = readSizeList(element, "columnWidth", meta.column_widths);
    if (!check) {
        return check.error();
    }

    for (const Element* child : element.findChildren("merge")) {
        auto range = rangeAttribute(*child);
        if (!range) {
            return range.error();
        }
        meta.merged_ranges.push_back(range.value());
    }
    for (const Element* child : element.findChildren("name")) {
        auto range_name = requireAttribute(*child, "name");
        if (!range_name) {
            return range_name.error();
        }
        auto range = rangeAttribute(*child);
        if (!range) {
            return range.error();
        }
        meta.named_ranges[utils::TextUtils::toUpper(range_name.value())] =
            core::NamedRange{range_name.value(), range.value()};
    }
    for (const Element* child : element.findChildren("conditionalFormat")) {
        auto rule = readConditionalFormat(*child);
        if (!rule) {
            return rule.error();
        }
        meta.conditional_formats.push_back(std::move(rule).value());
    }
    for (const Element* child : element.findChildren("cell")) {
        auto cell_check = readCell(*child, sheet.cells);
        if (!cell_check) {
            return core::Error(cell_check.error().code,
                               cell_check.error().message,
                               sheet.name + "!" + child->getAttribute("ref"));
        }
    }
    return sheet;
}

} // namespace

std::string StateSerializer::toXML(const core::WorkbookState& state) {
    XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("workbook");
    writer.writeAttribute("version", kFormatVersion);
    writer.writeAttribute("activeSheet", state.active_sheet_id);
    for (const auto& sheet : state.sheets) {
        writeSheet(writer, sheet);
    }
    writer.endElement();
    writer.endDocument();

    XML_DEBUG("Serialized workbook state with {} sheets", state.sheets.size());
    return writer.toString();
}

core::Result<core::WorkbookState> StateSerializer::fromXML(const std::string& xml) {
    XMLStreamReader reader;
    auto root = reader.parseToDOM(xml);
    if (!root) {
        return makeError(ErrorCode::XmlParseError, reader.getLastErrorMessage());
    }
    if (root->name != "workbook") {
        return makeError(ErrorCode::XmlMissingElement, "Root element must be <workbook>, found <" + root->name + ">");
    }

    auto version = intAttribute(*root, "version");
    if (!version) {
        return version.error();
    }
    if (version.value() > kFormatVersion) {
        return makeError(ErrorCode::InvalidFormat,
                         fmt::format("Unsupported state version {}", version.value()));
    }

    core::WorkbookState state;
    auto active = intAttribute(*root, "activeSheet");
    if (!active) {
        return active.error();
    }
    state.active_sheet_id = active.value();

    for (const Element* child : root->findChildren("sheet")) {
        auto sheet = readSheet(*child);
        if (!sheet) {
            XML_WARN("Failed to read sheet: {}", sheet.error().fullMessage());
            return sheet.error();
        }
        state.sheets.push_back(std::move(sheet).value());
    }
    if (state.sheets.empty()) {
        return makeError(ErrorCode::XmlMissingElement, "Workbook has no <sheet> elements");
    }
    return state;
}

core::VoidResult StateSerializer::saveToFile(const core::WorkbookState& state, const std::string& filepath) {
    return core::writeTextFile(filepath, toXML(state));
}

core::Result<core::WorkbookState> StateSerializer::loadFromFile(const std::string& filepath) {
    auto content = core::readTextFile(filepath);
    if (!content) {
        return content.error();
    }
    return fromXML(content.value());
}

}} // namespace fingrid::xml
