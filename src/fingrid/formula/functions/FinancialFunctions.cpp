#include "fingrid/formula/functions/FunctionHelpers.hpp"
#include "fingrid/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace fingrid {
namespace formula {

using core::CellValue;
using core::FormulaError;
using namespace helpers;

namespace {

// DB/DDB 逐期迭代，使用年限不超过该值
constexpr double kMaxDepreciationLife = 100000.0;

constexpr size_t kVariadic = FunctionSpec::kVariadic;

/**
 * @brief 牛顿迭代
 *
 * 连续两次迭代之差小于 tolerance 即收敛；导数为零或出现非有限值时失败；
 * 达到迭代上限仍未收敛则返回最后一次迭代值。
 */
template<typename F, typename D>
NumberResult newton(F&& f, D&& df, double guess, const CalcSettings& settings) {
    double rate = guess;
    for (int i = 0; i < settings.irr_max_iterations; ++i) {
        const double value = f(rate);
        const double slope = df(rate);
        if (slope == 0.0 || !std::isfinite(value) || !std::isfinite(slope)) {
            return FormulaError::Generic;
        }
        const double next = rate - value / slope;
        if (!std::isfinite(next)) {
            return FormulaError::Generic;
        }
        if (std::fabs(next - rate) < settings.irr_tolerance) {
            return next;
        }
        rate = next;
    }
    CALC_DEBUG("Newton iteration did not converge after {} steps, last rate {}",
               settings.irr_max_iterations, rate);
    return rate;
}

// 年金现值因子相关的闭式公式，type=1 表示期初付款
double pmtValue(double rate, double nper, double pv, double fv, double type) {
    if (rate == 0.0) {
        return -(pv + fv) / nper;
    }
    const double growth = std::pow(1.0 + rate, nper);
    return -(rate * (pv * growth + fv)) / ((1.0 + rate * type) * (growth - 1.0));
}

double fvValue(double rate, double nper, double pmt, double pv, double type) {
    if (rate == 0.0) {
        return -(pv + pmt * nper);
    }
    const double growth = std::pow(1.0 + rate, nper);
    return -(pv * growth + pmt * (1.0 + rate * type) * (growth - 1.0) / rate);
}

double ipmtValue(double rate, double per, double nper, double pv, double fv, double type) {
    const double pmt = pmtValue(rate, nper, pv, fv, type);
    if (type != 0.0 && per == 1.0) {
        return 0.0;
    }
    double interest = fvValue(rate, per - 1.0, pmt, pv, type) * rate;
    if (type != 0.0) {
        interest /= 1.0 + rate;
    }
    return interest;
}

struct DatedFlows {
    std::vector<double> values;
    std::vector<double> dates;
};

// 现金流与日期按位置配对，数量必须一致
core::Expected<DatedFlows, FormulaError> datedFlows(FunctionArgs& args, size_t values_index, size_t dates_index) {
    RangeValues values = args.range(values_index);
    RangeValues dates = args.range(dates_index);
    if (values.size() != dates.size() || values.size() == 0) {
        return FormulaError::Value;
    }

    // 两边都为空的位置跳过，按位置顺序合并两侧的非空条目
    constexpr size_t kNone = std::numeric_limits<size_t>::max();
    DatedFlows flows;
    size_t i = 0;
    size_t j = 0;
    while (i < values.entries.size() || j < dates.entries.size()) {
        const size_t value_index = i < values.entries.size() ? values.entries[i].index : kNone;
        const size_t date_index = j < dates.entries.size() ? dates.entries[j].index : kNone;
        const size_t index = std::min(value_index, date_index);
        if (value_index == index) {
            ++i;
        }
        if (date_index == index) {
            ++j;
        }

        auto amount = toNumber(values.get(index));
        if (!amount) {
            return amount.error();
        }
        auto serial = dateSerial(dates.get(index));
        if (!serial) {
            return serial.error();
        }
        flows.values.push_back(*amount);
        flows.dates.push_back(*serial);
    }
    if (flows.values.empty()) {
        return FormulaError::Value;
    }
    return flows;
}

double xnpvValue(double rate, const DatedFlows& flows) {
    double total = 0.0;
    for (size_t i = 0; i < flows.values.size(); ++i) {
        const double years = (flows.dates[i] - flows.dates[0]) / 365.0;
        total += flows.values[i] / std::pow(1.0 + rate, years);
    }
    return total;
}

double xnpvDerivative(double rate, const DatedFlows& flows) {
    double total = 0.0;
    for (size_t i = 0; i < flows.values.size(); ++i) {
        const double years = (flows.dates[i] - flows.dates[0]) / 365.0;
        total -= years * flows.values[i] / std::pow(1.0 + rate, years + 1.0);
    }
    return total;
}

// 可选的 fv、type 参数
struct Tail {
    double fv = 0.0;
    double type = 0.0;
};

core::Expected<Tail, FormulaError> optionalTail(FunctionArgs& args, size_t first) {
    Tail tail;
    auto fv = args.numberOr(first, 0.0);
    if (!fv) {
        return fv.error();
    }
    auto type = args.numberOr(first + 1, 0.0);
    if (!type) {
        return type.error();
    }
    tail.fv = *fv;
    tail.type = *type != 0.0 ? 1.0 : 0.0;
    return tail;
}

CellValue irr(FunctionArgs& args) {
    auto flows = args.numbers(0, 1);
    if (!flows) {
        return flows.error();
    }
    if (flows->size() < 2) {
        return FormulaError::Generic;
    }
    const CalcSettings& settings = args.context().settings();
    auto guess = args.numberOr(1, settings.irr_initial_guess);
    if (!guess) {
        return guess.error();
    }

    const std::vector<double>& values = *flows;
    auto npv = [&values](double rate) {
        double total = 0.0;
        for (size_t t = 0; t < values.size(); ++t) {
            total += values[t] / std::pow(1.0 + rate, static_cast<double>(t));
        }
        return total;
    };
    auto slope = [&values](double rate) {
        double total = 0.0;
        for (size_t t = 0; t < values.size(); ++t) {
            const double period = static_cast<double>(t);
            total -= period * values[t] / std::pow(1.0 + rate, period + 1.0);
        }
        return total;
    };

    auto rate = newton(npv, slope, *guess, settings);
    if (!rate) {
        return rate.error();
    }
    return *rate;
}

CellValue rate(FunctionArgs& args) {
    auto n = requireNumbers<3>(args);
    if (!n) {
        return n.error();
    }
    auto tail = optionalTail(args, 3);
    if (!tail) {
        return tail.error();
    }
    const CalcSettings& settings = args.context().settings();
    auto guess = args.numberOr(5, settings.irr_initial_guess);
    if (!guess) {
        return guess.error();
    }

    const double nper = (*n)[0];
    const double pmt = (*n)[1];
    const double pv = (*n)[2];
    const Tail t = *tail;

    auto f = [=](double r) {
        if (r == 0.0) {
            return pv + pmt * nper + t.fv;
        }
        const double growth = std::pow(1.0 + r, nper);
        return pv * growth + pmt * (1.0 + r * t.type) * (growth - 1.0) / r + t.fv;
    };
    auto df = [&f](double r) {
        const double h = 1e-7;
        return (f(r + h) - f(r - h)) / (2.0 * h);
    };

    auto result = newton(f, df, *guess, settings);
    if (!result) {
        return result.error();
    }
    return *result;
}

// DB：年折旧率保留三位小数，首末期按月份折算
CellValue decliningBalance(FunctionArgs& args) {
    auto n = requireNumbers<4>(args);
    if (!n) {
        return n.error();
    }
    auto month = args.numberOr(4, 12.0);
    if (!month) {
        return month.error();
    }
    const double cost = (*n)[0];
    const double salvage = (*n)[1];
    const double life = (*n)[2];
    const double period = std::trunc((*n)[3]);
    const double months = std::trunc(*month);

    if (cost <= 0.0 || !(life > 0.0 && life <= kMaxDepreciationLife) || period < 1.0 ||
        months < 1.0 || months > 12.0 || period > life + (months < 12.0 ? 1.0 : 0.0)) {
        return FormulaError::Generic;
    }

    const double rate = std::round((1.0 - std::pow(salvage / cost, 1.0 / life)) * 1000.0) / 1000.0;
    double total = 0.0;
    double depreciation = 0.0;
    for (int p = 1; p <= static_cast<int>(period); ++p) {
        if (p == 1) {
            depreciation = cost * rate * months / 12.0;
        } else if (p == static_cast<int>(life) + 1) {
            depreciation = (cost - total) * rate * (12.0 - months) / 12.0;
        } else {
            depreciation = (cost - total) * rate;
        }
        total += depreciation;
    }
    return depreciation;
}

CellValue doubleDecliningBalance(FunctionArgs& args) {
    auto n = requireNumbers<4>(args);
    if (!n) {
        return n.error();
    }
    auto factor = args.numberOr(4, 2.0);
    if (!factor) {
        return factor.error();
    }
    const double cost = (*n)[0];
    const double salvage = (*n)[1];
    const double life = (*n)[2];
    const double period = (*n)[3];
    if (!(life > 0.0 && life <= kMaxDepreciationLife) || !(period >= 1.0 && period <= life) || *factor <= 0.0) {
        return FormulaError::Generic;
    }

    double book = cost;
    double depreciation = 0.0;
    for (int p = 1; p <= static_cast<int>(std::ceil(period)); ++p) {
        depreciation = std::min(book * *factor / life, std::max(0.0, book - salvage));
        book -= depreciation;
    }
    return depreciation;
}

} // namespace

void registerFinancialFunctions(FunctionLibrary& library) {
    const auto family = FunctionFamily::Financial;

    // NPV(rate, value1, ...)：第 i 笔现金流折现 i+1 期
    library.add("NPV", family, 2, kVariadic, [](FunctionArgs& args) -> CellValue {
        auto rate = args.number(0);
        if (!rate) {
            return rate.error();
        }
        auto flows = args.numbers(1);
        if (!flows) {
            return flows.error();
        }
        double total = 0.0;
        for (size_t i = 0; i < flows->size(); ++i) {
            total += (*flows)[i] / std::pow(1.0 + *rate, static_cast<double>(i + 1));
        }
        return total;
    });

    library.add("IRR", family, 1, 2, irr);

    library.add("XNPV", family, 3, 3, [](FunctionArgs& args) -> CellValue {
        auto rate = args.number(0);
        if (!rate) {
            return rate.error();
        }
        auto flows = datedFlows(args, 1, 2);
        if (!flows) {
            return flows.error();
        }
        return xnpvValue(*rate, *flows);
    });

    library.add("XIRR", family, 2, 3, [](FunctionArgs& args) -> CellValue {
        auto flows = datedFlows(args, 0, 1);
        if (!flows) {
            return flows.error();
        }
        const CalcSettings& settings = args.context().settings();
        auto guess = args.numberOr(2, settings.irr_initial_guess);
        if (!guess) {
            return guess.error();
        }
        const DatedFlows& data = *flows;
        auto result = newton([&data](double r) { return xnpvValue(r, data); },
                             [&data](double r) { return xnpvDerivative(r, data); },
                             *guess, settings);
        if (!result) {
            return result.error();
        }
        return *result;
    });

    // MIRR：负现金流按融资利率折现到期初，正现金流按再投资利率复利到期末
    library.add("MIRR", family, 3, 3, [](FunctionArgs& args) -> CellValue {
        auto flows = args.numbers(0, 1);
        if (!flows) {
            return flows.error();
        }
        auto finance = args.number(1);
        if (!finance) {
            return finance.error();
        }
        auto reinvest = args.number(2);
        if (!reinvest) {
            return reinvest.error();
        }
        const size_t n = flows->size();
        if (n < 2) {
            return FormulaError::Generic;
        }

        double negative_pv = 0.0;
        double positive_fv = 0.0;
        for (size_t i = 0; i < n; ++i) {
            const double v = (*flows)[i];
            if (v < 0.0) {
                negative_pv += v / std::pow(1.0 + *finance, static_cast<double>(i));
            } else {
                positive_fv += v * std::pow(1.0 + *reinvest, static_cast<double>(n - 1 - i));
            }
        }
        if (negative_pv == 0.0 || positive_fv == 0.0) {
            return FormulaError::Generic;
        }
        return std::pow(-positive_fv / negative_pv, 1.0 / static_cast<double>(n - 1)) - 1.0;
    });

    library.add("PMT", family, 3, 5, [](FunctionArgs& args) -> CellValue {
        auto n = requireNumbers<3>(args);
        if (!n) {
            return n.error();
        }
        auto tail = optionalTail(args, 3);
        if (!tail) {
            return tail.error();
        }
        return pmtValue((*n)[0], (*n)[1], (*n)[2], tail->fv, tail->type);
    });

    library.add("FV", family, 3, 5, [](FunctionArgs& args) -> CellValue {
        auto n = requireNumbers<3>(args);
        if (!n) {
            return n.error();
        }
        auto pv = args.numberOr(3, 0.0);
        if (!pv) {
            return pv.error();
        }
        auto type = args.numberOr(4, 0.0);
        if (!type) {
            return type.error();
        }
        return fvValue((*n)[0], (*n)[1], (*n)[2], *pv, *type != 0.0 ? 1.0 : 0.0);
    });

    library.add("PV", family, 3, 5, [](FunctionArgs& args) -> CellValue {
        auto n = requireNumbers<3>(args);
        if (!n) {
            return n.error();
        }
        auto tail = optionalTail(args, 3);
        if (!tail) {
            return tail.error();
        }
        const double rate = (*n)[0];
        const double nper = (*n)[1];
        const double pmt = (*n)[2];
        if (rate == 0.0) {
            return -(tail->fv + pmt * nper);
        }
        const double growth = std::pow(1.0 + rate, nper);
        return -(tail->fv + pmt * (1.0 + rate * tail->type) * (growth - 1.0) / rate) / growth;
    });

    library.add("RATE", family, 3, 6, rate);

    library.add("NPER", family, 3, 5, [](FunctionArgs& args) -> CellValue {
        auto n = requireNumbers<3>(args);
        if (!n) {
            return n.error();
        }
        auto tail = optionalTail(args, 3);
        if (!tail) {
            return tail.error();
        }
        const double rate = (*n)[0];
        const double pmt = (*n)[1];
        const double pv = (*n)[2];
        if (rate == 0.0) {
            return -(pv + tail->fv) / pmt;
        }
        const double adjusted = pmt * (1.0 + rate * tail->type);
        return std::log((adjusted - tail->fv * rate) / (adjusted + pv * rate)) / std::log(1.0 + rate);
    });

    library.add("IPMT", family, 4, 6, [](FunctionArgs& args) -> CellValue {
        auto n = requireNumbers<4>(args);
        if (!n) {
            return n.error();
        }
        auto tail = optionalTail(args, 4);
        if (!tail) {
            return tail.error();
        }
        const double per = (*n)[1];
        const double nper = (*n)[2];
        if (per < 1.0 || per > nper) {
            return FormulaError::Generic;
        }
        return ipmtValue((*n)[0], per, nper, (*n)[3], tail->fv, tail->type);
    });

    library.add("PPMT", family, 4, 6, [](FunctionArgs& args) -> CellValue {
        auto n = requireNumbers<4>(args);
        if (!n) {
            return n.error();
        }
        auto tail = optionalTail(args, 4);
        if (!tail) {
            return tail.error();
        }
        const double rate = (*n)[0];
        const double per = (*n)[1];
        const double nper = (*n)[2];
        const double pv = (*n)[3];
        if (per < 1.0 || per > nper) {
            return FormulaError::Generic;
        }
        return pmtValue(rate, nper, pv, tail->fv, tail->type) -
               ipmtValue(rate, per, nper, pv, tail->fv, tail->type);
    });

    library.add("SLN", family, 3, 3, [](FunctionArgs& args) -> CellValue {
        auto n = requireNumbers<3>(args);
        if (!n) {
            return n.error();
        }
        return ((*n)[0] - (*n)[1]) / (*n)[2];
    });

    library.add("DB", family, 4, 5, decliningBalance);
    library.add("DDB", family, 4, 5, doubleDecliningBalance);

    library.add("EFFECT", family, 2, 2, [](FunctionArgs& args) -> CellValue {
        auto n = requireNumbers<2>(args);
        if (!n) {
            return n.error();
        }
        const double periods = std::trunc((*n)[1]);
        if ((*n)[0] <= 0.0 || periods < 1.0) {
            return FormulaError::Generic;
        }
        return std::pow(1.0 + (*n)[0] / periods, periods) - 1.0;
    });

    library.add("NOMINAL", family, 2, 2, [](FunctionArgs& args) -> CellValue {
        auto n = requireNumbers<2>(args);
        if (!n) {
            return n.error();
        }
        const double periods = std::trunc((*n)[1]);
        if ((*n)[0] <= 0.0 || periods < 1.0) {
            return FormulaError::Generic;
        }
        return periods * (std::pow(1.0 + (*n)[0], 1.0 / periods) - 1.0);
    });

    // WACC(equity, debt, cost_of_equity, cost_of_debt, tax_rate)
    library.add("WACC", family, 5, 5, [](FunctionArgs& args) -> CellValue {
        auto n = requireNumbers<5>(args);
        if (!n) {
            return n.error();
        }
        const double equity = (*n)[0];
        const double debt = (*n)[1];
        const double total = equity + debt;
        return (equity / total) * (*n)[2] + (debt / total) * (*n)[3] * (1.0 - (*n)[4]);
    });

    library.add("CAGR", family, 3, 3, [](FunctionArgs& args) -> CellValue {
        auto n = requireNumbers<3>(args);
        if (!n) {
            return n.error();
        }
        return std::pow((*n)[1] / (*n)[0], 1.0 / (*n)[2]) - 1.0;
    });

    library.add("MOIC", family, 2, 2, [](FunctionArgs& args) -> CellValue {
        auto n = requireNumbers<2>(args);
        if (!n) {
            return n.error();
        }
        return (*n)[0] / (*n)[1];
    });

    library.add("DPI", family, 2, 2, [](FunctionArgs& args) -> CellValue {
        auto n = requireNumbers<2>(args);
        if (!n) {
            return n.error();
        }
        return (*n)[0] / (*n)[1];
    });

    library.add("TVPI", family, 3, 3, [](FunctionArgs& args) -> CellValue {
        auto n = requireNumbers<3>(args);
        if (!n) {
            return n.error();
        }
        return ((*n)[0] + (*n)[1]) / (*n)[2];
    });
}

}} // namespace fingrid::formula
