#include "fingrid/formula/functions/FunctionHelpers.hpp"
#include <algorithm>
#include <cmath>

namespace fingrid {
namespace formula {

using core::CellValue;
using core::FormulaError;
using namespace helpers;
using utils::TimeUtils;

namespace {

// DATE 各分量与 EDATE 月数的绝对值上限，换算成 int 前在 double 上检查
constexpr double kMaxDatePart = 1.0e7;

bool datePartInRange(double part) {
    return part >= -kMaxDatePart && part <= kMaxDatePart;
}

CellValue serialResult(double serial) {
    if (!TimeUtils::isSerialInRange(serial)) {
        return FormulaError::Value;
    }
    return serial;
}

NumberResult dateArg(FunctionArgs& args, size_t index) {
    return dateSerial(args.value(index));
}

template<typename F>
CellValue datePart(FunctionArgs& args, F&& extract) {
    auto serial = dateArg(args, 0);
    if (!serial) {
        return serial.error();
    }
    return static_cast<double>(extract(TimeUtils::fromSerial(*serial)));
}

} // namespace

void registerDateFunctions(FunctionLibrary& library) {
    const auto family = FunctionFamily::Date;

    library.add("TODAY", family, 0, 0, [](FunctionArgs&) -> CellValue {
        return TimeUtils::todaySerial();
    });

    library.add("NOW", family, 0, 0, [](FunctionArgs&) -> CellValue {
        return TimeUtils::nowSerial();
    });

    // DATE(year, month, day)，月份与日可越界并自动进位
    library.add("DATE", family, 3, 3, [](FunctionArgs& args) -> CellValue {
        auto n = requireNumbers<3>(args);
        if (!n) {
            return n.error();
        }
        for (double part : *n) {
            if (!datePartInRange(part)) {
                return FormulaError::Value;
            }
        }
        return serialResult(TimeUtils::toSerial(static_cast<int>(std::trunc((*n)[0])),
                                                static_cast<int>(std::trunc((*n)[1])),
                                                static_cast<int>(std::trunc((*n)[2]))));
    });

    library.add("YEAR", family, 1, 1, [](FunctionArgs& args) {
        return datePart(args, [](const utils::CivilDate& d) { return d.year; });
    });

    library.add("MONTH", family, 1, 1, [](FunctionArgs& args) {
        return datePart(args, [](const utils::CivilDate& d) { return d.month; });
    });

    library.add("DAY", family, 1, 1, [](FunctionArgs& args) {
        return datePart(args, [](const utils::CivilDate& d) { return d.day; });
    });

    // DATEDIF(start, end, unit)："D" 天数，"M" 按 30 天折算，"Y" 按 365 天折算，向下取整
    library.add("DATEDIF", family, 3, 3, [](FunctionArgs& args) -> CellValue {
        auto start = dateArg(args, 0);
        if (!start) {
            return start.error();
        }
        auto end = dateArg(args, 1);
        if (!end) {
            return end.error();
        }
        auto unit = args.text(2);
        if (!unit) {
            return unit.error();
        }

        const double days = std::floor(*end - *start);
        const std::string code = utils::TextUtils::toUpper(utils::TextUtils::trim(*unit));
        if (code == "D") {
            return days;
        }
        if (code == "M") {
            return std::floor(days / 30.0);
        }
        if (code == "Y") {
            return std::floor(days / 365.0);
        }
        return FormulaError::Value;
    });

    // EDATE(start, months)，目标月份没有该日时取月末
    library.add("EDATE", family, 2, 2, [](FunctionArgs& args) -> CellValue {
        auto start = dateArg(args, 0);
        if (!start) {
            return start.error();
        }
        auto months = args.number(1);
        if (!months) {
            return months.error();
        }
        if (!datePartInRange(*months)) {
            return FormulaError::Value;
        }
        utils::CivilDate date = TimeUtils::fromSerial(*start);
        const int target_month = date.month + static_cast<int>(std::trunc(*months));
        const double first = TimeUtils::toSerial(date.year, target_month, 1);
        const double next = TimeUtils::toSerial(date.year, target_month + 1, 1);
        const int days_in_month = static_cast<int>(next - first);
        return serialResult(first + static_cast<double>(std::min(date.day, days_in_month) - 1));
    });

    // DAYS(end, start)
    library.add("DAYS", family, 2, 2, [](FunctionArgs& args) -> CellValue {
        auto end = dateArg(args, 0);
        if (!end) {
            return end.error();
        }
        auto start = dateArg(args, 1);
        if (!start) {
            return start.error();
        }
        return std::floor(*end) - std::floor(*start);
    });
}

}} // namespace fingrid::formula
