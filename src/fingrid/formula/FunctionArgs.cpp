#include "fingrid/formula/FunctionArgs.hpp"
#include "fingrid/utils/TextUtils.hpp"
#include <algorithm>

namespace fingrid {
namespace formula {

using core::CellValue;
using core::FormulaError;

CellValue FunctionArgs::value(size_t index) {
    if (!has(index)) {
        return CellValue();
    }
    return args_[index]->evaluate(ctx_);
}

RangeValues FunctionArgs::range(size_t index) {
    if (!has(index)) {
        return RangeValues();
    }
    return args_[index]->evaluateRange(ctx_);
}

NumberResult FunctionArgs::number(size_t index) {
    return toNumber(value(index));
}

NumberResult FunctionArgs::numberOr(size_t index, double fallback) {
    if (!has(index)) {
        return fallback;
    }
    CellValue v = value(index);
    if (v.isEmpty()) {
        return fallback;
    }
    return toNumber(v);
}

TextResult FunctionArgs::text(size_t index) {
    CellValue v = value(index);
    if (v.isError()) {
        return v.asError();
    }
    return v.toDisplayString();
}

BoolResult FunctionArgs::boolean(size_t index) {
    return toBoolean(value(index));
}

BoolResult FunctionArgs::booleanOr(size_t index, bool fallback) {
    if (!has(index)) {
        return fallback;
    }
    CellValue v = value(index);
    if (v.isEmpty()) {
        return fallback;
    }
    return toBoolean(v);
}

NumberListResult FunctionArgs::numbers(size_t from, size_t to) {
    std::vector<double> result;
    const size_t end = std::min(to, args_.size());

    for (size_t i = from; i < end; ++i) {
        if (args_[i]->isReference()) {
            RangeValues block = range(i);
            for (const RangeValues::Entry& entry : block.entries) {
                const CellValue& item = entry.value;
                if (item.isError()) {
                    return item.asError();
                }
                if (item.isNumber()) {
                    result.push_back(item.asNumber());
                }
            }
            continue;
        }

        CellValue item = value(i);
        if (item.isEmpty()) {
            continue;
        }
        auto number = toNumber(item);
        if (!number) {
            return number.error();
        }
        result.push_back(*number);
    }
    return result;
}

NumberListResult FunctionArgs::numberSeries(size_t index) {
    std::vector<double> result;
    RangeValues block = range(index);
    for (const RangeValues::Entry& entry : block.entries) {
        const CellValue& item = entry.value;
        if (item.isError()) {
            return item.asError();
        }
        if (item.isNumber()) {
            result.push_back(item.asNumber());
        } else if (!args_[index]->isReference() && item.isText()) {
            auto number = toNumber(item);
            if (!number) {
                return number.error();
            }
            result.push_back(*number);
        }
    }
    return result;
}

}} // namespace fingrid::formula
