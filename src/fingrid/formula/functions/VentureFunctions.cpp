#include "fingrid/formula/functions/FunctionHelpers.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace fingrid {
namespace formula {

using core::CellValue;
using core::FormulaError;
using namespace helpers;

namespace {

constexpr size_t kVariadic = FunctionSpec::kVariadic;

// 参与分配上限："uncapped" 或省略表示无上限
core::Expected<double, FormulaError> capArg(FunctionArgs& args, size_t index) {
    if (!args.has(index)) {
        return std::numeric_limits<double>::infinity();
    }
    CellValue cap = args.value(index);
    if (cap.isEmpty() || (cap.isText() && utils::TextUtils::equalsIgnoreCase(cap.asText(), "uncapped"))) {
        return std::numeric_limits<double>::infinity();
    }
    return toNumber(cap);
}

// 超过门槛部分按比例分成（CATCHUP、CARRIEDINT）
CellValue excessShare(FunctionArgs& args) {
    auto n = requireNumbers<3>(args);
    if (!n) {
        return n.error();
    }
    const double amount = (*n)[0];
    const double hurdle = (*n)[1];
    if (amount <= hurdle) {
        return 0.0;
    }
    return (amount - hurdle) * (*n)[2];
}

} // namespace

void registerVentureFunctions(FunctionLibrary& library) {
    const auto family = FunctionFamily::Venture;

    // ========== 股权结构 ==========

    // DILUTION(old_shares, new_shares, total_shares) = 1 - old / (total + new)
    library.add("DILUTION", family, 3, 3, [](FunctionArgs& args) -> CellValue {
        auto n = requireNumbers<3>(args);
        if (!n) {
            return n.error();
        }
        return 1.0 - (*n)[0] / ((*n)[2] + (*n)[1]);
    });

    library.add("OWNERSHIP", family, 2, 2, [](FunctionArgs& args) -> CellValue {
        auto n = requireNumbers<2>(args);
        if (!n) {
            return n.error();
        }
        return (*n)[0] / (*n)[1];
    });

    library.add("PRICEPERSHARE", family, 2, 2, [](FunctionArgs& args) -> CellValue {
        auto n = requireNumbers<2>(args);
        if (!n) {
            return n.error();
        }
        return (*n)[0] / (*n)[1];
    });

    // OPTIONPOOL(percentage, post_money)
    library.add("OPTIONPOOL", family, 2, 2, [](FunctionArgs& args) -> CellValue {
        auto n = requireNumbers<2>(args);
        if (!n) {
            return n.error();
        }
        return (*n)[1] * (*n)[0];
    });

    // ========== 清算分配 ==========

    // LIQUIDPREF(investment, multiple, [participating])，参与标志不改变优先额
    library.add("LIQUIDPREF", family, 2, 3, [](FunctionArgs& args) -> CellValue {
        auto n = requireNumbers<2>(args);
        if (!n) {
            return n.error();
        }
        auto participating = args.booleanOr(2, false);
        if (!participating) {
            return participating.error();
        }
        return (*n)[0] * (*n)[1];
    });

    // WATERFALL(exit_value, pref_amount, common_shares, total_shares)：普通股所得
    library.add("WATERFALL", family, 4, 4, [](FunctionArgs& args) -> CellValue {
        auto n = requireNumbers<4>(args);
        if (!n) {
            return n.error();
        }
        const double exit = (*n)[0];
        const double pref = (*n)[1];
        if (exit <= pref) {
            return 0.0;
        }
        return (exit - pref) * ((*n)[2] / (*n)[3]);
    });

    // PARTICIPATING(exit_value, investment, multiple, ownership, [cap])
    library.add("PARTICIPATING", family, 4, 5, [](FunctionArgs& args) -> CellValue {
        auto n = requireNumbers<4>(args);
        if (!n) {
            return n.error();
        }
        auto cap = capArg(args, 4);
        if (!cap) {
            return cap.error();
        }
        const double exit = (*n)[0];
        const double preference = (*n)[1] * (*n)[2];
        if (exit <= preference) {
            return std::min(exit, preference);
        }
        const double participation = (exit - preference) * (*n)[3];
        return std::min(preference + participation, *cap);
    });

    // IPORATCHET(investment, current_value, [min_return = 20%])
    library.add("IPORATCHET", family, 2, 3, [](FunctionArgs& args) -> CellValue {
        auto n = requireNumbers<2>(args);
        if (!n) {
            return n.error();
        }
        auto min_return = args.numberOr(2, 0.20);
        if (!min_return) {
            return min_return.error();
        }
        return std::max((*n)[1], (*n)[0] * (1.0 + *min_return));
    });

    // DOWNROUND(exit_value, investment, enhanced_multiple, [participating], [ownership = 20%])
    library.add("DOWNROUND", family, 3, 5, [](FunctionArgs& args) -> CellValue {
        auto n = requireNumbers<3>(args);
        if (!n) {
            return n.error();
        }
        auto participating = args.booleanOr(3, false);
        if (!participating) {
            return participating.error();
        }
        auto ownership = args.numberOr(4, 0.20);
        if (!ownership) {
            return ownership.error();
        }
        const double exit = (*n)[0];
        const double preference = (*n)[1] * (*n)[2];
        if (!*participating || exit <= preference) {
            return std::min(exit, preference);
        }
        return preference + (exit - preference) * *ownership;
    });

    // CUMULDIV(investment, rate, years)：复利累积股息后的总额
    library.add("CUMULDIV", family, 3, 3, [](FunctionArgs& args) -> CellValue {
        auto n = requireNumbers<3>(args);
        if (!n) {
            return n.error();
        }
        return (*n)[0] * std::pow(1.0 + (*n)[1], (*n)[2]);
    });

    library.add("CATCHUP", family, 3, 3, excessShare);
    library.add("CARRIEDINT", family, 3, 3, excessShare);

    // ========== 情景分析 ==========

    // SCENARIO(base, best, worst, probabilities...)：概率可以是三个参数或一个范围
    library.add("SCENARIO", family, 4, kVariadic, [](FunctionArgs& args) -> CellValue {
        auto n = requireNumbers<3>(args);
        if (!n) {
            return n.error();
        }
        auto weights = args.numbers(3);
        if (!weights) {
            return weights.error();
        }
        if (weights->size() != 3) {
            return FormulaError::Value;
        }
        return (*n)[0] * (*weights)[0] + (*n)[1] * (*weights)[1] + (*n)[2] * (*weights)[2];
    });

    // SENSITIVITY(base_value, variable, change) = base * (1 + variable * change)
    library.add("SENSITIVITY", family, 3, 3, [](FunctionArgs& args) -> CellValue {
        auto n = requireNumbers<3>(args);
        if (!n) {
            return n.error();
        }
        return (*n)[0] * (1.0 + (*n)[1] * (*n)[2]);
    });

    // BREAKEVEN(fixed_costs, contribution, [units])，units 为 0 或省略按 1 计
    library.add("BREAKEVEN", family, 2, 3, [](FunctionArgs& args) -> CellValue {
        auto n = requireNumbers<2>(args);
        if (!n) {
            return n.error();
        }
        auto units = args.numberOr(2, 1.0);
        if (!units) {
            return units.error();
        }
        const double per_unit = *units == 0.0 ? 1.0 : *units;
        return (*n)[0] / ((*n)[1] / per_unit);
    });
}

}} // namespace fingrid::formula
