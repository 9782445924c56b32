#include "fingrid/formula/functions/FunctionHelpers.hpp"

namespace fingrid {
namespace formula {

using core::CellValue;
using core::FormulaError;
using namespace helpers;

namespace {

constexpr size_t kVariadic = FunctionSpec::kVariadic;

/**
 * @brief AND/OR 共用实现，遇到决定性的值立即返回
 *
 * 引用中的文本和空单元格被忽略；没有任何逻辑值时为 #VALUE!。
 */
CellValue logicalFold(FunctionArgs& args, bool is_and) {
    bool seen = false;
    for (size_t i = 0; i < args.size(); ++i) {
        std::vector<CellValue> items;
        if (args.isReference(i)) {
            for (const RangeValues::Entry& entry : args.range(i).entries) {
                items.push_back(entry.value);
            }
        } else {
            items.push_back(args.value(i));
        }

        for (const CellValue& item : items) {
            if (item.isError()) {
                return item;
            }
            if (args.isReference(i) && !item.isNumber() && !item.isBoolean()) {
                continue;
            }
            auto flag = toBoolean(item);
            if (!flag) {
                return flag.error();
            }
            seen = true;
            if (is_and && !*flag) {
                return false;
            }
            if (!is_and && *flag) {
                return true;
            }
        }
    }
    if (!seen) {
        return FormulaError::Value;
    }
    return is_and;
}

} // namespace

void registerLogicalFunctions(FunctionLibrary& library) {
    const auto family = FunctionFamily::Logical;

    // 只求值被选中的分支
    library.add("IF", family, 2, 3, [](FunctionArgs& args) -> CellValue {
        auto condition = args.boolean(0);
        if (!condition) {
            return condition.error();
        }
        if (*condition) {
            return args.value(1);
        }
        if (!args.has(2)) {
            return false;
        }
        return args.value(2);
    });

    library.add("AND", family, 1, kVariadic, [](FunctionArgs& args) { return logicalFold(args, true); });
    library.add("OR", family, 1, kVariadic, [](FunctionArgs& args) { return logicalFold(args, false); });

    library.add("NOT", family, 1, 1, [](FunctionArgs& args) -> CellValue {
        auto flag = args.boolean(0);
        if (!flag) {
            return flag.error();
        }
        return !*flag;
    });

    library.add("IFERROR", family, 2, 2, [](FunctionArgs& args) -> CellValue {
        CellValue value = args.value(0);
        if (value.isError()) {
            return args.value(1);
        }
        return value;
    });

    library.add("ISERROR", family, 1, 1, [](FunctionArgs& args) -> CellValue {
        return args.value(0).isError();
    });

    library.add("ISNA", family, 1, 1, [](FunctionArgs& args) -> CellValue {
        CellValue value = args.value(0);
        return value.isError() && value.asError() == FormulaError::NotAvailable;
    });

    library.add("ISNUMBER", family, 1, 1, [](FunctionArgs& args) -> CellValue {
        return args.value(0).isNumber();
    });

    library.add("ISTEXT", family, 1, 1, [](FunctionArgs& args) -> CellValue {
        return args.value(0).isText();
    });

    library.add("ISBLANK", family, 1, 1, [](FunctionArgs& args) -> CellValue {
        return args.value(0).isEmpty();
    });

    library.add("TRUE", family, 0, 0, [](FunctionArgs&) -> CellValue { return true; });
    library.add("FALSE", family, 0, 0, [](FunctionArgs&) -> CellValue { return false; });
}

}} // namespace fingrid::formula
