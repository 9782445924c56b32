#pragma once

#include "fingrid/core/CellAddress.hpp"
#include "fingrid/core/CellValue.hpp"
#include "fingrid/core/Constants.hpp"
#include <algorithm>
#include <string>
#include <vector>

namespace fingrid {
namespace formula {

/**
 * @brief 引用展开后的值块
 *
 * 形状为 rows x cols（行优先），只保存非空位置，按偏移递增排列；
 * 未保存的位置视为空值。整表范围因此只占用已填单元格的空间。
 */
struct RangeValues {
    struct Entry {
        size_t index = 0;
        core::CellValue value;
    };

    size_t rows = 0;
    size_t cols = 0;
    std::vector<Entry> entries;

    RangeValues() = default;
    RangeValues(size_t r, size_t c) : rows(r), cols(c) {}

    static RangeValues single(const core::CellValue& value) {
        RangeValues block(1, 1);
        block.add(0, value);
        return block;
    }

    // 偏移必须大于已有条目
    void add(size_t index, const core::CellValue& value) {
        if (!value.isEmpty()) {
            entries.push_back(Entry{index, value});
        }
    }

    const core::CellValue& get(size_t index) const {
        static const core::CellValue empty;
        auto it = std::lower_bound(entries.begin(), entries.end(), index,
                                   [](const Entry& entry, size_t target) { return entry.index < target; });
        return it != entries.end() && it->index == index ? it->value : empty;
    }

    const core::CellValue& at(size_t row, size_t col) const { return get(row * cols + col); }

    size_t size() const { return rows * cols; }
};

/**
 * @brief 迭代类金融函数的数值参数
 */
struct CalcSettings {
    int irr_max_iterations = core::Constants::kIrrMaxIterations;
    double irr_tolerance = core::Constants::kIrrTolerance;
    double irr_initial_guess = core::Constants::kIrrInitialGuess;
};

/**
 * @brief 求值上下文：引用解析的抽象接口
 *
 * sheet 为空表示公式所在的工作表。解析失败（工作表不存在等）以错误值返回。
 */
class EvalContext {
public:
    virtual ~EvalContext() = default;

    virtual core::CellValue cellValue(const std::string& sheet, const core::CellAddress& addr) = 0;

    virtual RangeValues rangeValues(const std::string& sheet, const core::CellRange& range) = 0;

    /**
     * @brief 3D 引用：按创建顺序依次展开 first..last 各表的同一范围，结果为单列
     */
    virtual RangeValues sheetSpanValues(const std::string& first_sheet, const std::string& last_sheet,
                                        const core::CellRange& range) = 0;

    /**
     * @brief 命名范围；未定义时返回 1x1 的 #REF!
     */
    virtual RangeValues namedRangeValues(const std::string& name) = 0;

    virtual const CalcSettings& settings() const = 0;
};

}} // namespace fingrid::formula
