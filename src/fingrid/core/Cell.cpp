#include "fingrid/core/Cell.hpp"
#include "fingrid/utils/TimeUtils.hpp"
#include <regex>

namespace fingrid {
namespace core {

namespace {

const std::string& emptyString() {
    static const std::string empty;
    return empty;
}

const CellStyle& emptyStyle() {
    static const CellStyle empty;
    return empty;
}

const std::vector<HistoryEntry>& emptyHistory() {
    static const std::vector<HistoryEntry> empty;
    return empty;
}

} // namespace

const char* cellTypeName(CellType type) noexcept {
    switch (type) {
        case CellType::Text:       return "text";
        case CellType::Number:     return "number";
        case CellType::Currency:   return "currency";
        case CellType::Percentage: return "percentage";
        case CellType::Date:       return "date";
        case CellType::Boolean:    return "boolean";
        case CellType::Formula:    return "formula";
        case CellType::Link:       return "link";
    }
    return "text";
}

std::optional<CellType> parseCellType(const std::string& name) noexcept {
    for (CellType type : {CellType::Text, CellType::Number, CellType::Currency, CellType::Percentage,
                          CellType::Date, CellType::Boolean, CellType::Formula, CellType::Link}) {
        if (name == cellTypeName(type)) {
            return type;
        }
    }
    return std::nullopt;
}

CellType detectCellType(const CellValue& value) {
    switch (value.kind()) {
        case CellValue::Kind::Number:  return CellType::Number;
        case CellValue::Kind::Boolean: return CellType::Boolean;
        case CellValue::Kind::Text:    break;
        default:                       return CellType::Text;
    }

    static const std::regex currency_regex(R"(^\$[\d,]+\.?\d*)");
    static const std::regex percentage_regex(R"(^\d+\.?\d*%$)");

    const std::string& text = value.asText();
    if (text.rfind("http", 0) == 0) {
        return CellType::Link;
    }
    if (utils::TimeUtils::hasISODatePrefix(text)) {
        return CellType::Date;
    }
    if (std::regex_search(text, currency_regex)) {
        return CellType::Currency;
    }
    if (std::regex_match(text, percentage_regex)) {
        return CellType::Percentage;
    }
    return CellType::Text;
}

void mergeStyle(CellStyle& base, const CellStyle& overlay) {
    for (const auto& [key, value] : overlay) {
        base[key] = value;
    }
}

Cell::Cell(const CellValue& value) {
    setLiteral(value);
}

Cell::Cell(const Cell& other)
    : value_(other.value_)
    , type_(other.type_) {
    deepCopyExtendedData(other);
}

Cell& Cell::operator=(const Cell& other) {
    if (this != &other) {
        value_ = other.value_;
        type_ = other.type_;
        deepCopyExtendedData(other);
    }
    return *this;
}

Cell::ExtendedData& Cell::ensureExtended() {
    if (!extended_) {
        extended_ = std::make_unique<ExtendedData>();
    }
    return *extended_;
}

void Cell::deepCopyExtendedData(const Cell& other) {
    if (other.extended_) {
        extended_ = std::make_unique<ExtendedData>(*other.extended_);
    } else {
        extended_.reset();
    }
}

void Cell::setLiteral(const CellValue& value) {
    setLiteral(value, detectCellType(value));
}

void Cell::setLiteral(const CellValue& value, CellType type) {
    value_ = value;
    type_ = type;
    if (extended_) {
        extended_->formula.clear();
    }
}

void Cell::setFormula(const std::string& formula) {
    ensureExtended().formula = formula;
    type_ = CellType::Formula;
}

const std::string& Cell::getFormula() const {
    return extended_ ? extended_->formula : emptyString();
}

void Cell::setStyle(const CellStyle& style) {
    ensureExtended().style = style;
}

void Cell::applyStyle(const CellStyle& style) {
    mergeStyle(ensureExtended().style, style);
}

const CellStyle& Cell::getStyle() const {
    return extended_ ? extended_->style : emptyStyle();
}

void Cell::setLink(const std::string& url) {
    ensureExtended().link = url;
}

const std::string& Cell::getLink() const {
    return extended_ ? extended_->link : emptyString();
}

void Cell::setSourceAnnotation(const std::string& source) {
    ensureExtended().source_annotation = source;
}

const std::string& Cell::getSourceAnnotation() const {
    return extended_ ? extended_->source_annotation : emptyString();
}

void Cell::setComment(const std::string& comment) {
    ensureExtended().comment = comment;
}

const std::string& Cell::getComment() const {
    return extended_ ? extended_->comment : emptyString();
}

void Cell::appendHistory(const CellValue& previous, const std::string& timestamp) {
    ensureExtended().history.push_back(HistoryEntry{previous, timestamp});
}

const std::vector<HistoryEntry>& Cell::getHistory() const {
    return extended_ ? extended_->history : emptyHistory();
}

bool Cell::isBlank() const {
    if (!value_.isEmpty()) {
        return false;
    }
    if (!extended_) {
        return true;
    }
    return extended_->formula.empty() && extended_->style.empty() && extended_->link.empty() &&
           extended_->source_annotation.empty() && extended_->comment.empty();
}

bool Cell::operator==(const Cell& other) const {
    return value_ == other.value_ &&
           type_ == other.type_ &&
           getFormula() == other.getFormula() &&
           getStyle() == other.getStyle() &&
           getLink() == other.getLink() &&
           getSourceAnnotation() == other.getSourceAnnotation() &&
           getComment() == other.getComment() &&
           getHistory() == other.getHistory();
}

}} // namespace fingrid::core
