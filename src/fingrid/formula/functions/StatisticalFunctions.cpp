#include "fingrid/formula/functions/FunctionHelpers.hpp"
#include <algorithm>
#include <cmath>
#include <functional>

namespace fingrid {
namespace formula {

using core::CellValue;
using core::FormulaError;
using namespace helpers;

namespace {

constexpr size_t kVariadic = FunctionSpec::kVariadic;

// sample=true 时除以 n-1
CellValue variance(FunctionArgs& args, bool sample, bool root) {
    auto values = args.numbers();
    if (!values) {
        return values.error();
    }
    const size_t n = values->size();
    if (n == 0 || (sample && n < 2)) {
        return FormulaError::Generic;
    }

    double mean = 0.0;
    for (double v : *values) {
        mean += v;
    }
    mean /= static_cast<double>(n);

    double squares = 0.0;
    for (double v : *values) {
        squares += (v - mean) * (v - mean);
    }
    const double result = squares / static_cast<double>(sample ? n - 1 : n);
    return root ? std::sqrt(result) : result;
}

CellValue kthValue(FunctionArgs& args, bool largest) {
    auto values = args.numbers(0, 1);
    if (!values) {
        return values.error();
    }
    auto k = args.number(1);
    if (!k) {
        return k.error();
    }
    const double rank = std::ceil(*k);
    if (!(rank >= 1.0 && rank <= static_cast<double>(values->size()))) {
        return FormulaError::Generic;
    }
    std::vector<double> sorted = std::move(*values);
    if (largest) {
        std::sort(sorted.begin(), sorted.end(), std::greater<double>());
    } else {
        std::sort(sorted.begin(), sorted.end());
    }
    return sorted[static_cast<size_t>(rank) - 1];
}

} // namespace

void registerStatisticalFunctions(FunctionLibrary& library) {
    const auto family = FunctionFamily::Statistical;

    library.add("MEDIAN", family, 1, kVariadic, [](FunctionArgs& args) -> CellValue {
        auto values = args.numbers();
        if (!values) {
            return values.error();
        }
        if (values->empty()) {
            return FormulaError::Generic;
        }
        std::vector<double> sorted = std::move(*values);
        std::sort(sorted.begin(), sorted.end());
        const size_t mid = sorted.size() / 2;
        if (sorted.size() % 2 != 0) {
            return sorted[mid];
        }
        return (sorted[mid - 1] + sorted[mid]) / 2.0;
    });

    // STDEV/VAR 为总体口径，.S 为样本口径
    library.add("STDEV", family, 1, kVariadic, [](FunctionArgs& args) { return variance(args, false, true); });
    library.add("STDEV.P", family, 1, kVariadic, [](FunctionArgs& args) { return variance(args, false, true); });
    library.add("STDEV.S", family, 1, kVariadic, [](FunctionArgs& args) { return variance(args, true, true); });
    library.add("VAR", family, 1, kVariadic, [](FunctionArgs& args) { return variance(args, false, false); });
    library.add("VAR.P", family, 1, kVariadic, [](FunctionArgs& args) { return variance(args, false, false); });
    library.add("VAR.S", family, 1, kVariadic, [](FunctionArgs& args) { return variance(args, true, false); });

    // 线性插值：位置 (n-1)*k
    library.add("PERCENTILE", family, 2, 2, [](FunctionArgs& args) -> CellValue {
        auto values = args.numbers(0, 1);
        if (!values) {
            return values.error();
        }
        auto k = args.number(1);
        if (!k) {
            return k.error();
        }
        if (values->empty() || !(*k >= 0.0 && *k <= 1.0)) {
            return FormulaError::Generic;
        }
        std::vector<double> sorted = std::move(*values);
        std::sort(sorted.begin(), sorted.end());
        const double index = static_cast<double>(sorted.size() - 1) * *k;
        const size_t lower = static_cast<size_t>(std::floor(index));
        const size_t upper = static_cast<size_t>(std::ceil(index));
        const double weight = index - static_cast<double>(lower);
        return sorted[lower] * (1.0 - weight) + sorted[upper] * weight;
    });

    // 按位置配对，只取两边都是数值的位置
    library.add("CORREL", family, 2, 2, [](FunctionArgs& args) -> CellValue {
        RangeValues xs = args.range(0);
        RangeValues ys = args.range(1);
        if (xs.size() != ys.size()) {
            return FormulaError::NotAvailable;
        }

        std::vector<double> x;
        std::vector<double> y;
        for (const RangeValues* block : {&xs, &ys}) {
            for (const RangeValues::Entry& entry : block->entries) {
                if (entry.value.isError()) {
                    return entry.value;
                }
            }
        }
        for (const RangeValues::Entry& entry : xs.entries) {
            const CellValue& other = ys.get(entry.index);
            if (entry.value.isNumber() && other.isNumber()) {
                x.push_back(entry.value.asNumber());
                y.push_back(other.asNumber());
            }
        }
        if (x.size() < 2) {
            return FormulaError::Generic;
        }

        double mean_x = 0.0;
        double mean_y = 0.0;
        for (size_t i = 0; i < x.size(); ++i) {
            mean_x += x[i];
            mean_y += y[i];
        }
        mean_x /= static_cast<double>(x.size());
        mean_y /= static_cast<double>(y.size());

        double numerator = 0.0;
        double denom_x = 0.0;
        double denom_y = 0.0;
        for (size_t i = 0; i < x.size(); ++i) {
            numerator += (x[i] - mean_x) * (y[i] - mean_y);
            denom_x += (x[i] - mean_x) * (x[i] - mean_x);
            denom_y += (y[i] - mean_y) * (y[i] - mean_y);
        }
        return numerator / std::sqrt(denom_x * denom_y);
    });

    library.add("LARGE", family, 2, 2, [](FunctionArgs& args) { return kthValue(args, true); });
    library.add("SMALL", family, 2, 2, [](FunctionArgs& args) { return kthValue(args, false); });
}

}} // namespace fingrid::formula
