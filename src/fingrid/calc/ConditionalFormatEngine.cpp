#include "fingrid/calc/ConditionalFormatEngine.hpp"
#include "fingrid/formula/FormulaAST.hpp"
#include "fingrid/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <optional>

namespace fingrid {
namespace calc {

using core::CellValue;
using core::ConditionKind;

namespace {

// 数值或可解析为数值的文本
std::optional<double> numericValue(const CellValue& value) {
    if (value.isNumber()) {
        return value.asNumber();
    }
    if (value.isText()) {
        auto number = formula::toNumber(value);
        if (number) {
            return *number;
        }
    }
    return std::nullopt;
}

size_t occurrences(const CellValue& value, const std::vector<CellValue>& range_values) {
    return static_cast<size_t>(std::count(range_values.begin(), range_values.end(), value));
}

} // namespace

bool ConditionalFormatEngine::matches(const core::ConditionalFormat& rule, const CellValue& value,
                                      const std::vector<CellValue>& range_values) {
    switch (rule.condition) {
        case ConditionKind::Equals: {
            auto lhs = numericValue(value);
            auto rhs = numericValue(rule.value);
            if (lhs && rhs && !value.isEmpty()) {
                return *lhs == *rhs;
            }
            return value.toDisplayString() == rule.value.toDisplayString();
        }
        case ConditionKind::Greater: {
            auto lhs = numericValue(value);
            auto rhs = numericValue(rule.value);
            return lhs && rhs && *lhs > *rhs;
        }
        case ConditionKind::Less: {
            auto lhs = numericValue(value);
            auto rhs = numericValue(rule.value);
            return lhs && rhs && *lhs < *rhs;
        }
        case ConditionKind::Between: {
            auto x = numericValue(value);
            auto lo = numericValue(rule.value);
            auto hi = numericValue(rule.value2);
            if (!x || !lo || !hi) {
                return false;
            }
            return *x >= std::min(*lo, *hi) && *x <= std::max(*lo, *hi);
        }
        case ConditionKind::Contains: {
            if (value.isEmpty()) {
                return false;
            }
            return value.toDisplayString().find(rule.value.toDisplayString()) != std::string::npos;
        }
        case ConditionKind::Duplicate:
            return !value.isEmpty() && occurrences(value, range_values) > 1;
        case ConditionKind::Unique:
            return !value.isEmpty() && occurrences(value, range_values) == 1;
    }
    return false;
}

core::StyleOverlay ConditionalFormatEngine::computeOverlay(const core::Worksheet& sheet) {
    core::StyleOverlay overlay;
    for (const core::ConditionalFormat& rule : sheet.getConditionalFormats()) {
        std::vector<CellValue> range_values;
        const bool needs_range = rule.condition == ConditionKind::Duplicate ||
                                 rule.condition == ConditionKind::Unique;
        if (needs_range) {
            for (const auto& [addr, cell] : sheet.getCells()) {
                if (rule.range.contains(addr) && !cell.getValue().isEmpty()) {
                    range_values.push_back(cell.getValue());
                }
            }
        }

        size_t matched = 0;
        for (const auto& [addr, cell] : sheet.getCells()) {
            if (!rule.range.contains(addr)) {
                continue;
            }
            if (matches(rule, cell.getValue(), range_values)) {
                core::mergeStyle(overlay[addr], rule.style);
                ++matched;
            }
        }
        CALC_DEBUG("Conditional format {} on {} matched {} cells", rule.id, sheet.getName(), matched);
    }
    return overlay;
}

}} // namespace fingrid::calc
