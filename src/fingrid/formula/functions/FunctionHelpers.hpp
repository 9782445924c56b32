#pragma once

#include "fingrid/formula/FunctionLibrary.hpp"
#include "fingrid/utils/NumberUtils.hpp"
#include "fingrid/utils/TextUtils.hpp"
#include "fingrid/utils/TimeUtils.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <string>

namespace fingrid {
namespace formula {
namespace helpers {

using core::CellValue;
using core::FormulaError;

template<size_t N>
using NumberArray = core::Expected<std::array<double, N>, FormulaError>;

/**
 * @brief 依次取前 N 个必选数值参数
 */
template<size_t N>
NumberArray<N> requireNumbers(FunctionArgs& args) {
    std::array<double, N> values{};
    for (size_t i = 0; i < N; ++i) {
        auto number = args.number(i);
        if (!number) {
            return number.error();
        }
        values[i] = *number;
    }
    return values;
}

/**
 * @brief 单参数数学函数
 */
template<typename F>
CellValue unaryMath(FunctionArgs& args, F&& func) {
    auto x = args.number(0);
    if (!x) {
        return x.error();
    }
    return func(*x);
}

/**
 * @brief 日期参数：序列号或 ISO 文本；超出可换算范围为 #VALUE!
 */
inline NumberResult dateSerial(const CellValue& value) {
    if (value.isText()) {
        if (auto serial = utils::TimeUtils::parseISODate(value.asText())) {
            return *serial;
        }
    }
    auto number = toNumber(value);
    if (number && !utils::TimeUtils::isSerialInRange(*number)) {
        return FormulaError::Value;
    }
    return number;
}

// 计数参数的上限，远大于任何文本长度，两数相加也不会溢出
constexpr size_t kMaxCountArg = size_t{1} << 31;

/**
 * @brief 非负整数参数（字符个数、序号等），负数或 NaN 为 #VALUE!，过大的值截为 kMaxCountArg
 */
inline core::Expected<size_t, FormulaError> countArg(FunctionArgs& args, size_t index, size_t fallback) {
    if (!args.has(index)) {
        return fallback;
    }
    auto number = args.number(index);
    if (!number) {
        return number.error();
    }
    if (!(*number >= 0.0)) {
        return FormulaError::Value;
    }
    if (*number >= static_cast<double>(kMaxCountArg)) {
        return kMaxCountArg;
    }
    return static_cast<size_t>(std::floor(*number));
}

/**
 * @brief SUMIF/COUNTIF 条件匹配
 *
 * 条件可以是值本身（相等），也可以是 ">10"、"<>0"、"=abc" 形式的文本。
 */
inline bool criteriaMatches(const CellValue& cell, const CellValue& criteria) {
    if (!criteria.isText()) {
        return !cell.isEmpty() && compareValues(cell, criteria) == 0;
    }

    const std::string& text = criteria.asText();
    std::string op;
    size_t skip = 0;
    if (text.rfind("<>", 0) == 0 || text.rfind(">=", 0) == 0 || text.rfind("<=", 0) == 0) {
        op = text.substr(0, 2);
        skip = 2;
    } else if (!text.empty() && (text[0] == '>' || text[0] == '<' || text[0] == '=')) {
        op = text.substr(0, 1);
        skip = 1;
    }

    std::string operand_text = text.substr(skip);
    CellValue operand;
    if (auto number = utils::NumberUtils::parseNumber(operand_text)) {
        operand = *number;
    } else if (!operand_text.empty()) {
        operand = operand_text;
    }

    if (op.empty() || op == "=") {
        if (operand.isEmpty()) {
            return cell.isEmpty();
        }
        if (cell.isEmpty()) {
            return false;
        }
        if (operand.isNumber() && cell.isText()) {
            return false;
        }
        return compareValues(cell, operand) == 0;
    }
    if (op == "<>") {
        if (operand.isEmpty()) {
            return !cell.isEmpty();
        }
        return cell.isEmpty() || compareValues(cell, operand) != 0;
    }

    // 大小比较只对同类值成立
    if (cell.isEmpty() || cell.isError()) {
        return false;
    }
    if (operand.isNumber() != cell.isNumber()) {
        return false;
    }
    int cmp = compareValues(cell, operand);
    if (op == ">")  return cmp > 0;
    if (op == "<")  return cmp < 0;
    if (op == ">=") return cmp >= 0;
    if (op == "<=") return cmp <= 0;
    return false;
}

/**
 * @brief 去掉浮点噪声后再取整，ROUNDUP(0.1+0.2, 1) 应为 0.3
 */
inline double snapToInteger(double scaled) {
    double nearest = std::round(scaled);
    if (std::fabs(scaled - nearest) < 1e-9 * std::max(1.0, std::fabs(scaled))) {
        return nearest;
    }
    return scaled;
}

}}} // namespace fingrid::formula::helpers
