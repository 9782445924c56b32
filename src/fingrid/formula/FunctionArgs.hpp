#pragma once

#include "fingrid/formula/FormulaAST.hpp"
#include <limits>
#include <string>
#include <vector>

namespace fingrid {
namespace formula {

using NumberResult = core::Expected<double, core::FormulaError>;
using TextResult = core::Expected<std::string, core::FormulaError>;
using BoolResult = core::Expected<bool, core::FormulaError>;
using NumberListResult = core::Expected<std::vector<double>, core::FormulaError>;

/**
 * @brief 函数实参访问器
 *
 * 实参按需求值：函数只对访问到的参数求值，IF/AND/OR/IFERROR 借此实现短路。
 * 同一参数多次访问会重复求值，函数实现应缓存结果。
 */
class FunctionArgs {
public:
    static constexpr size_t npos = std::numeric_limits<size_t>::max();

    FunctionArgs(const std::vector<ExprPtr>& args, EvalContext& ctx)
        : args_(args), ctx_(ctx) {}

    size_t size() const { return args_.size(); }
    bool has(size_t index) const { return index < args_.size(); }
    bool isReference(size_t index) const { return has(index) && args_[index]->isReference(); }

    EvalContext& context() { return ctx_; }

    /**
     * @brief 标量求值；1x1 的引用取其值，多单元格范围得到 #ERROR!
     */
    core::CellValue value(size_t index);

    /**
     * @brief 范围求值，标量视为 1x1
     */
    RangeValues range(size_t index);

    NumberResult number(size_t index);
    NumberResult numberOr(size_t index, double fallback);
    TextResult text(size_t index);
    BoolResult boolean(size_t index);
    BoolResult booleanOr(size_t index, bool fallback);

    /**
     * @brief 收集数值（SUM 语义）
     *
     * 引用参数只取数值单元格，文本、布尔、空被忽略；字面量参数做类型转换，
     * 非数值文本为 #VALUE!。遇到错误值立即返回该错误。
     */
    NumberListResult numbers(size_t from = 0, size_t to = npos);

    /**
     * @brief 单个参数展开为数值序列，非数值项一律跳过（现金流、样本序列）
     */
    NumberListResult numberSeries(size_t index);

private:
    const std::vector<ExprPtr>& args_;
    EvalContext& ctx_;
};

}} // namespace fingrid::formula
