#include "fingrid/formula/functions/FunctionHelpers.hpp"
#include <algorithm>
#include <cmath>

namespace fingrid {
namespace formula {

using core::CellValue;
using core::FormulaError;
using namespace helpers;

namespace {

constexpr size_t kVariadic = FunctionSpec::kVariadic;

// ROUND 族：mode 0 四舍五入（远离零），1 向上（远离零），-1 向下（趋向零）
CellValue roundWith(FunctionArgs& args, int mode) {
    auto x = args.number(0);
    if (!x) {
        return x.error();
    }
    auto digits = args.numberOr(1, 0.0);
    if (!digits) {
        return digits.error();
    }

    const double factor = std::pow(10.0, std::trunc(*digits));
    const double scaled = snapToInteger(std::fabs(*x) * factor);
    double rounded;
    switch (mode) {
        case 1:  rounded = std::ceil(scaled); break;
        case -1: rounded = std::floor(scaled); break;
        default: rounded = std::floor(scaled + 0.5); break;
    }
    return std::copysign(rounded / factor, *x);
}

CellValue countNumbers(FunctionArgs& args) {
    double count = 0;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args.isReference(i)) {
            for (const RangeValues::Entry& entry : args.range(i).entries) {
                if (entry.value.isNumber()) {
                    ++count;
                }
            }
            continue;
        }
        CellValue item = args.value(i);
        if (item.isNumber() || item.isBoolean() ||
            (item.isText() && toNumber(item).hasValue())) {
            ++count;
        }
    }
    return count;
}

CellValue countNonEmpty(FunctionArgs& args) {
    double count = 0;
    for (size_t i = 0; i < args.size(); ++i) {
        count += static_cast<double>(args.range(i).entries.size());
    }
    return count;
}

CellValue sumProduct(FunctionArgs& args) {
    std::vector<RangeValues> blocks;
    blocks.reserve(args.size());
    for (size_t i = 0; i < args.size(); ++i) {
        blocks.push_back(args.range(i));
        if (blocks.back().rows != blocks.front().rows || blocks.back().cols != blocks.front().cols) {
            return FormulaError::Value;
        }
    }

    for (const RangeValues& block : blocks) {
        for (const RangeValues::Entry& entry : block.entries) {
            if (entry.value.isError()) {
                return entry.value;
            }
        }
    }

    // 任一块为空的位置乘积为 0，只需遍历第一块的非空位置
    double total = 0.0;
    for (const RangeValues::Entry& entry : blocks.front().entries) {
        double product = 1.0;
        for (const RangeValues& block : blocks) {
            const CellValue& item = block.get(entry.index);
            product *= item.isNumber() ? item.asNumber() : 0.0;
        }
        total += product;
    }
    return total;
}

// SUMIF(range, criteria, [sum_range]) 与 COUNTIF(range, criteria)
CellValue conditionalAggregate(FunctionArgs& args, bool sum) {
    RangeValues range = args.range(0);
    CellValue criteria = args.value(1);
    if (criteria.isError()) {
        return criteria;
    }
    RangeValues sum_range = sum && args.has(2) ? args.range(2) : range;

    if (!sum) {
        double count = 0.0;
        for (const RangeValues::Entry& entry : range.entries) {
            if (criteriaMatches(entry.value, criteria)) {
                count += 1.0;
            }
        }
        if (criteriaMatches(CellValue(), criteria)) {
            count += static_cast<double>(range.size() - range.entries.size());
        }
        return count;
    }

    // 空的求和位置不影响结果，只遍历求和范围的非空位置
    double total = 0.0;
    for (const RangeValues::Entry& entry : sum_range.entries) {
        if (entry.index >= range.size()) {
            break;
        }
        if (!criteriaMatches(range.get(entry.index), criteria)) {
            continue;
        }
        if (entry.value.isError()) {
            return entry.value;
        }
        if (entry.value.isNumber()) {
            total += entry.value.asNumber();
        }
    }
    return total;
}

CellValue ceilingOrFloor(FunctionArgs& args, bool up) {
    auto x = args.number(0);
    if (!x) {
        return x.error();
    }
    auto significance = args.numberOr(1, 1.0);
    if (!significance) {
        return significance.error();
    }
    if (*significance == 0.0) {
        return up ? CellValue(0.0) : CellValue(FormulaError::Generic);
    }
    const double steps = snapToInteger(*x / *significance);
    return (up ? std::ceil(steps) : std::floor(steps)) * *significance;
}

} // namespace

void registerMathFunctions(FunctionLibrary& library) {
    const auto family = FunctionFamily::Math;

    library.add("SUM", family, 1, kVariadic, [](FunctionArgs& args) -> CellValue {
        auto values = args.numbers();
        if (!values) {
            return values.error();
        }
        double total = 0.0;
        for (double v : *values) {
            total += v;
        }
        return total;
    });

    library.add("AVERAGE", family, 1, kVariadic, [](FunctionArgs& args) -> CellValue {
        auto values = args.numbers();
        if (!values) {
            return values.error();
        }
        if (values->empty()) {
            return FormulaError::Generic;
        }
        double total = 0.0;
        for (double v : *values) {
            total += v;
        }
        return total / static_cast<double>(values->size());
    });

    library.add("MIN", family, 1, kVariadic, [](FunctionArgs& args) -> CellValue {
        auto values = args.numbers();
        if (!values) {
            return values.error();
        }
        if (values->empty()) {
            return 0.0;
        }
        return *std::min_element(values->begin(), values->end());
    });

    library.add("MAX", family, 1, kVariadic, [](FunctionArgs& args) -> CellValue {
        auto values = args.numbers();
        if (!values) {
            return values.error();
        }
        if (values->empty()) {
            return 0.0;
        }
        return *std::max_element(values->begin(), values->end());
    });

    library.add("COUNT", family, 1, kVariadic, countNumbers);
    library.add("COUNTA", family, 1, kVariadic, countNonEmpty);

    library.add("PRODUCT", family, 1, kVariadic, [](FunctionArgs& args) -> CellValue {
        auto values = args.numbers();
        if (!values) {
            return values.error();
        }
        if (values->empty()) {
            return 0.0;
        }
        double product = 1.0;
        for (double v : *values) {
            product *= v;
        }
        return product;
    });

    library.add("SUMPRODUCT", family, 1, kVariadic, sumProduct);

    library.add("SUMIF", family, 2, 3, [](FunctionArgs& args) {
        return conditionalAggregate(args, true);
    });
    library.add("COUNTIF", family, 2, 2, [](FunctionArgs& args) {
        return conditionalAggregate(args, false);
    });

    library.add("ABS", family, 1, 1, [](FunctionArgs& args) {
        return unaryMath(args, [](double x) { return std::fabs(x); });
    });

    library.add("ROUND", family, 1, 2, [](FunctionArgs& args) { return roundWith(args, 0); });
    library.add("ROUNDUP", family, 1, 2, [](FunctionArgs& args) { return roundWith(args, 1); });
    library.add("ROUNDDOWN", family, 1, 2, [](FunctionArgs& args) { return roundWith(args, -1); });

    library.add("INT", family, 1, 1, [](FunctionArgs& args) {
        return unaryMath(args, [](double x) { return std::floor(x); });
    });

    library.add("CEILING", family, 1, 2, [](FunctionArgs& args) { return ceilingOrFloor(args, true); });
    library.add("FLOOR", family, 1, 2, [](FunctionArgs& args) { return ceilingOrFloor(args, false); });

    library.add("POWER", family, 2, 2, [](FunctionArgs& args) -> CellValue {
        auto n = requireNumbers<2>(args);
        if (!n) {
            return n.error();
        }
        return std::pow((*n)[0], (*n)[1]);
    });

    library.add("SQRT", family, 1, 1, [](FunctionArgs& args) {
        return unaryMath(args, [](double x) { return std::sqrt(x); });
    });

    library.add("LN", family, 1, 1, [](FunctionArgs& args) {
        return unaryMath(args, [](double x) { return std::log(x); });
    });

    library.add("LOG", family, 1, 2, [](FunctionArgs& args) -> CellValue {
        auto x = args.number(0);
        if (!x) {
            return x.error();
        }
        auto base = args.numberOr(1, 10.0);
        if (!base) {
            return base.error();
        }
        return std::log(*x) / std::log(*base);
    });

    library.add("LOG10", family, 1, 1, [](FunctionArgs& args) {
        return unaryMath(args, [](double x) { return std::log10(x); });
    });

    library.add("EXP", family, 1, 1, [](FunctionArgs& args) {
        return unaryMath(args, [](double x) { return std::exp(x); });
    });

    // 余数符号与被除数一致
    library.add("MOD", family, 2, 2, [](FunctionArgs& args) -> CellValue {
        auto n = requireNumbers<2>(args);
        if (!n) {
            return n.error();
        }
        if ((*n)[1] == 0.0) {
            return FormulaError::Generic;
        }
        return std::fmod((*n)[0], (*n)[1]);
    });

    library.add("SIGN", family, 1, 1, [](FunctionArgs& args) {
        return unaryMath(args, [](double x) { return x > 0 ? 1.0 : (x < 0 ? -1.0 : 0.0); });
    });

    library.add("PI", family, 0, 0, [](FunctionArgs&) -> CellValue {
        return 3.14159265358979323846;
    });
}

}} // namespace fingrid::formula
