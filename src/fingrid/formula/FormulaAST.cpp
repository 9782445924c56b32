#include "fingrid/formula/FormulaAST.hpp"
#include "fingrid/formula/FunctionLibrary.hpp"
#include "fingrid/utils/AddressParser.hpp"
#include "fingrid/utils/ModuleLoggers.hpp"
#include "fingrid/utils/NumberUtils.hpp"
#include "fingrid/utils/TextUtils.hpp"
#include "fingrid/utils/TimeUtils.hpp"
#include <fmt/format.h>
#include <cmath>

namespace fingrid {
namespace formula {

using core::CellValue;
using core::FormulaError;

namespace {

std::string quoteSheet(const std::string& sheet) {
    if (sheet.empty()) {
        return {};
    }
    return utils::AddressParser::qualify(sheet, "");
}

CellValue scalarFromBlock(const RangeValues& block) {
    if (block.size() == 1) {
        return block.get(0);
    }
    // 多单元格范围不能出现在标量位置
    return FormulaError::Generic;
}

int typeRank(const CellValue& value) {
    switch (value.kind()) {
        case CellValue::Kind::Text:    return 1;
        case CellValue::Kind::Boolean: return 2;
        default:                       return 0;
    }
}

} // namespace

// ========== 类型转换 ==========

core::Expected<double, FormulaError> toNumber(const CellValue& value) {
    switch (value.kind()) {
        case CellValue::Kind::Empty:
            return 0.0;
        case CellValue::Kind::Number:
        case CellValue::Kind::Boolean:
            return value.asNumber();
        case CellValue::Kind::Error:
            return value.asError();
        case CellValue::Kind::Text: {
            if (auto number = utils::NumberUtils::parseLooseNumber(value.asText())) {
                return *number;
            }
            if (auto serial = utils::TimeUtils::parseISODate(value.asText())) {
                return *serial;
            }
            return FormulaError::Value;
        }
    }
    return FormulaError::Value;
}

core::Expected<bool, FormulaError> toBoolean(const CellValue& value) {
    switch (value.kind()) {
        case CellValue::Kind::Empty:
            return false;
        case CellValue::Kind::Number:
        case CellValue::Kind::Boolean:
            return value.asBoolean();
        case CellValue::Kind::Error:
            return value.asError();
        case CellValue::Kind::Text: {
            const std::string& text = value.asText();
            if (utils::TextUtils::equalsIgnoreCase(text, "TRUE")) {
                return true;
            }
            if (utils::TextUtils::equalsIgnoreCase(text, "FALSE")) {
                return false;
            }
            return FormulaError::Value;
        }
    }
    return FormulaError::Value;
}

int compareValues(const CellValue& lhs, const CellValue& rhs) {
    // 空值向对方类型看齐
    if (lhs.isEmpty() && rhs.isEmpty()) {
        return 0;
    }
    if (lhs.isEmpty()) {
        if (rhs.isText()) return compareValues(CellValue(std::string()), rhs);
        if (rhs.isBoolean()) return compareValues(CellValue(false), rhs);
        return compareValues(CellValue(0.0), rhs);
    }
    if (rhs.isEmpty()) {
        return -compareValues(rhs, lhs);
    }

    const int lrank = typeRank(lhs);
    const int rrank = typeRank(rhs);
    if (lrank != rrank) {
        return lrank < rrank ? -1 : 1;
    }

    if (lhs.isText()) {
        std::string a = utils::TextUtils::toLower(lhs.asText());
        std::string b = utils::TextUtils::toLower(rhs.asText());
        return a < b ? -1 : (a > b ? 1 : 0);
    }

    const double a = lhs.asNumber();
    const double b = rhs.asNumber();
    return a < b ? -1 : (a > b ? 1 : 0);
}

CellValue finiteOrError(double value) {
    if (!std::isfinite(value)) {
        return FormulaError::Generic;
    }
    return value;
}

// ========== Expr ==========

RangeValues Expr::evaluateRange(EvalContext& ctx) const {
    return RangeValues::single(evaluate(ctx));
}

CellValue LiteralExpr::evaluate(EvalContext& /*ctx*/) const {
    return value_;
}

std::string LiteralExpr::toString() const {
    if (value_.isText()) {
        return fmt::format("\"{}\"", value_.asText());
    }
    return value_.toDisplayString();
}

CellValue CellRefExpr::evaluate(EvalContext& ctx) const {
    return ctx.cellValue(sheet_, address_);
}

void CellRefExpr::collectReferences(std::vector<ReferenceInfo>& out) const {
    ReferenceInfo info;
    info.kind = ReferenceInfo::Kind::Range;
    info.sheet = sheet_;
    info.range = core::CellRange(address_);
    out.push_back(std::move(info));
}

std::string CellRefExpr::toString() const {
    return quoteSheet(sheet_) + utils::AddressParser::toString(address_);
}

CellValue RangeRefExpr::evaluate(EvalContext& ctx) const {
    if (range_.isSingleCell()) {
        return ctx.cellValue(sheet_, range_.first);
    }
    return FormulaError::Generic;
}

RangeValues RangeRefExpr::evaluateRange(EvalContext& ctx) const {
    return ctx.rangeValues(sheet_, range_);
}

void RangeRefExpr::collectReferences(std::vector<ReferenceInfo>& out) const {
    ReferenceInfo info;
    info.kind = ReferenceInfo::Kind::Range;
    info.sheet = sheet_;
    info.range = range_;
    out.push_back(std::move(info));
}

std::string RangeRefExpr::toString() const {
    return quoteSheet(sheet_) + utils::AddressParser::toString(range_);
}

CellValue SheetSpanRefExpr::evaluate(EvalContext& ctx) const {
    return scalarFromBlock(evaluateRange(ctx));
}

RangeValues SheetSpanRefExpr::evaluateRange(EvalContext& ctx) const {
    return ctx.sheetSpanValues(first_sheet_, last_sheet_, range_);
}

void SheetSpanRefExpr::collectReferences(std::vector<ReferenceInfo>& out) const {
    ReferenceInfo info;
    info.kind = ReferenceInfo::Kind::SheetSpan;
    info.sheet = first_sheet_;
    info.last_sheet = last_sheet_;
    info.range = range_;
    out.push_back(std::move(info));
}

std::string SheetSpanRefExpr::toString() const {
    return fmt::format("{}:{}!{}", first_sheet_, last_sheet_, utils::AddressParser::toString(range_));
}

CellValue NameRefExpr::evaluate(EvalContext& ctx) const {
    return scalarFromBlock(evaluateRange(ctx));
}

RangeValues NameRefExpr::evaluateRange(EvalContext& ctx) const {
    return ctx.namedRangeValues(name_);
}

void NameRefExpr::collectReferences(std::vector<ReferenceInfo>& out) const {
    ReferenceInfo info;
    info.kind = ReferenceInfo::Kind::Name;
    info.name = name_;
    out.push_back(std::move(info));
}

std::string NameRefExpr::toString() const {
    return name_;
}

CellValue UnaryExpr::evaluate(EvalContext& ctx) const {
    auto number = toNumber(operand_->evaluate(ctx));
    if (!number) {
        return number.error();
    }
    return op_ == '-' ? finiteOrError(-*number) : finiteOrError(*number);
}

void UnaryExpr::collectReferences(std::vector<ReferenceInfo>& out) const {
    operand_->collectReferences(out);
}

std::string UnaryExpr::toString() const {
    return fmt::format("({}{})", op_, operand_->toString());
}

CellValue PercentExpr::evaluate(EvalContext& ctx) const {
    auto number = toNumber(operand_->evaluate(ctx));
    if (!number) {
        return number.error();
    }
    return finiteOrError(*number / 100.0);
}

void PercentExpr::collectReferences(std::vector<ReferenceInfo>& out) const {
    operand_->collectReferences(out);
}

std::string PercentExpr::toString() const {
    return fmt::format("({}%)", operand_->toString());
}

const char* binaryOpSymbol(BinaryOp op) noexcept {
    switch (op) {
        case BinaryOp::Add:          return "+";
        case BinaryOp::Subtract:     return "-";
        case BinaryOp::Multiply:     return "*";
        case BinaryOp::Divide:       return "/";
        case BinaryOp::Power:        return "^";
        case BinaryOp::Concat:       return "&";
        case BinaryOp::Equal:        return "=";
        case BinaryOp::NotEqual:     return "<>";
        case BinaryOp::Less:         return "<";
        case BinaryOp::LessEqual:    return "<=";
        case BinaryOp::Greater:      return ">";
        case BinaryOp::GreaterEqual: return ">=";
    }
    return "?";
}

CellValue BinaryExpr::evaluate(EvalContext& ctx) const {
    CellValue lhs = lhs_->evaluate(ctx);
    if (lhs.isError()) {
        return lhs;
    }
    CellValue rhs = rhs_->evaluate(ctx);
    if (rhs.isError()) {
        return rhs;
    }

    switch (op_) {
        case BinaryOp::Concat:
            return lhs.toDisplayString() + rhs.toDisplayString();
        case BinaryOp::Equal:        return compareValues(lhs, rhs) == 0;
        case BinaryOp::NotEqual:     return compareValues(lhs, rhs) != 0;
        case BinaryOp::Less:         return compareValues(lhs, rhs) < 0;
        case BinaryOp::LessEqual:    return compareValues(lhs, rhs) <= 0;
        case BinaryOp::Greater:      return compareValues(lhs, rhs) > 0;
        case BinaryOp::GreaterEqual: return compareValues(lhs, rhs) >= 0;
        default:
            break;
    }

    auto a = toNumber(lhs);
    if (!a) {
        return a.error();
    }
    auto b = toNumber(rhs);
    if (!b) {
        return b.error();
    }

    switch (op_) {
        case BinaryOp::Add:      return finiteOrError(*a + *b);
        case BinaryOp::Subtract: return finiteOrError(*a - *b);
        case BinaryOp::Multiply: return finiteOrError(*a * *b);
        case BinaryOp::Divide:   return finiteOrError(*a / *b);
        case BinaryOp::Power:    return finiteOrError(std::pow(*a, *b));
        default:                 return FormulaError::Generic;
    }
}

void BinaryExpr::collectReferences(std::vector<ReferenceInfo>& out) const {
    lhs_->collectReferences(out);
    rhs_->collectReferences(out);
}

std::string BinaryExpr::toString() const {
    return fmt::format("({}{}{})", lhs_->toString(), binaryOpSymbol(op_), rhs_->toString());
}

CellValue CallExpr::evaluate(EvalContext& ctx) const {
    if (!spec_) {
        FORMULA_DEBUG("Unknown function {}", name_);
        return FormulaError::Generic;
    }
    if (!spec_->acceptsArgCount(args_.size())) {
        FORMULA_DEBUG("{} called with {} arguments", spec_->name, args_.size());
        return FormulaError::Generic;
    }

    FunctionArgs args(args_, ctx);
    CellValue result = spec_->impl(args);
    if (result.isNumber()) {
        return finiteOrError(result.asNumber());
    }
    return result;
}

void CallExpr::collectReferences(std::vector<ReferenceInfo>& out) const {
    for (const auto& arg : args_) {
        arg->collectReferences(out);
    }
}

std::string CallExpr::toString() const {
    std::string text = name_ + "(";
    for (size_t i = 0; i < args_.size(); ++i) {
        if (i > 0) {
            text += ",";
        }
        text += args_[i]->toString();
    }
    return text + ")";
}

// ========== FormulaAST ==========

FormulaAST::FormulaAST(std::string source, ExprPtr root)
    : source_(std::move(source))
    , root_(std::move(root)) {
    root_->collectReferences(references_);
}

CellValue FormulaAST::evaluate(EvalContext& ctx) const {
    CellValue result = root_->evaluate(ctx);
    if (result.isNumber()) {
        return finiteOrError(result.asNumber());
    }
    return result;
}

}} // namespace fingrid::formula
