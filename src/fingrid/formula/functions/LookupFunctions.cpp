#include "fingrid/formula/functions/FunctionHelpers.hpp"
#include <cmath>

namespace fingrid {
namespace formula {

using core::CellValue;
using core::FormulaError;
using namespace helpers;

namespace {

constexpr size_t kVariadic = FunctionSpec::kVariadic;

/**
 * @brief 查找键匹配
 *
 * 精确模式按值相等（文本忽略大小写）；非精确模式为子串包含。
 */
bool keyMatches(const CellValue& candidate, const CellValue& key, bool exact) {
    if (candidate.isEmpty() || candidate.isError()) {
        return false;
    }
    if (exact) {
        if (candidate.isNumber() != key.isNumber()) {
            return false;
        }
        return compareValues(candidate, key) == 0;
    }
    return candidate.toDisplayString().find(key.toDisplayString()) != std::string::npos;
}

/**
 * @brief VLOOKUP/HLOOKUP：vertical 为真时扫描首列、按列号取值
 */
CellValue tableLookup(FunctionArgs& args, bool vertical) {
    CellValue key = args.value(0);
    if (key.isError()) {
        return key;
    }
    RangeValues table = args.range(1);
    auto index = args.number(2);
    if (!index) {
        return index.error();
    }
    auto exact = args.booleanOr(3, true);
    if (!exact) {
        return exact.error();
    }

    // 在 double 上比较范围，再转换为下标
    const double position = std::trunc(*index);
    const size_t limit = vertical ? table.cols : table.rows;
    if (table.cols == 0 || !(position >= 1.0 && position <= static_cast<double>(limit))) {
        return FormulaError::Ref;
    }
    const size_t offset = static_cast<size_t>(position) - 1;

    // 空单元格不会匹配，只扫描首列（首行）的非空条目
    for (const RangeValues::Entry& entry : table.entries) {
        const size_t row = entry.index / table.cols;
        const size_t col = entry.index % table.cols;
        if ((vertical ? col : row) != 0) {
            continue;
        }
        if (keyMatches(entry.value, key, *exact)) {
            return vertical ? table.at(row, offset) : table.at(offset, col);
        }
    }
    return FormulaError::NotAvailable;
}

} // namespace

void registerLookupFunctions(FunctionLibrary& library) {
    const auto family = FunctionFamily::Lookup;

    // 第四个参数为 exact：TRUE（默认）精确匹配，FALSE 子串包含
    library.add("VLOOKUP", family, 3, 4, [](FunctionArgs& args) { return tableLookup(args, true); });
    library.add("HLOOKUP", family, 3, 4, [](FunctionArgs& args) { return tableLookup(args, false); });

    // INDEX(range, row, [col])；单行范围只给一个序号时按列取
    library.add("INDEX", family, 2, 3, [](FunctionArgs& args) -> CellValue {
        RangeValues table = args.range(0);
        auto row = args.number(1);
        if (!row) {
            return row.error();
        }
        auto col = args.numberOr(2, 1.0);
        if (!col) {
            return col.error();
        }

        double r = std::trunc(*row);
        double c = std::trunc(*col);
        if (!args.has(2) && table.rows == 1) {
            c = r;
            r = 1.0;
        }
        if (!(r >= 1.0 && c >= 1.0 && r <= static_cast<double>(table.rows) &&
              c <= static_cast<double>(table.cols))) {
            return FormulaError::Ref;
        }
        return table.at(static_cast<size_t>(r) - 1, static_cast<size_t>(c) - 1);
    });

    // MATCH(value, range, [type])：0（默认）精确，1 不大于值的最大项，-1 不小于值的最小项
    library.add("MATCH", family, 2, 3, [](FunctionArgs& args) -> CellValue {
        CellValue key = args.value(0);
        if (key.isError()) {
            return key;
        }
        RangeValues range = args.range(1);
        auto type = args.numberOr(2, 0.0);
        if (!type) {
            return type.error();
        }
        const int mode = *type > 0 ? 1 : (*type < 0 ? -1 : 0);

        bool found = false;
        size_t best = 0;
        for (const RangeValues::Entry& entry : range.entries) {
            const CellValue& candidate = entry.value;
            if (candidate.isError()) {
                continue;
            }
            if (mode == 0) {
                if (keyMatches(candidate, key, true)) {
                    return static_cast<double>(entry.index + 1);
                }
                continue;
            }
            if (candidate.isNumber() != key.isNumber()) {
                continue;
            }
            const int cmp = compareValues(candidate, key);
            if ((mode == 1 && cmp <= 0) || (mode == -1 && cmp >= 0)) {
                found = true;
                best = entry.index;
            } else {
                // 有序数据上越过目标即可停止
                break;
            }
        }
        if (!found) {
            return FormulaError::NotAvailable;
        }
        return static_cast<double>(best + 1);
    });

    // CHOOSE(index, value1, ...)，只求值被选中的参数
    library.add("CHOOSE", family, 2, kVariadic, [](FunctionArgs& args) -> CellValue {
        auto index = args.number(0);
        if (!index) {
            return index.error();
        }
        const double choice = std::trunc(*index);
        if (!(choice >= 1.0 && choice < static_cast<double>(args.size()))) {
            return FormulaError::Value;
        }
        return args.value(static_cast<size_t>(choice));
    });
}

}} // namespace fingrid::formula
