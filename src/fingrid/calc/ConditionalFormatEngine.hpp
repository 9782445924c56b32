#pragma once

#include "fingrid/core/ConditionalFormat.hpp"
#include "fingrid/core/Worksheet.hpp"
#include <vector>

namespace fingrid {
namespace calc {

/**
 * @brief 条件格式引擎
 *
 * 用物化值逐条测试规则；多条规则命中同一单元格时，后声明的样式覆盖先声明的。
 */
class ConditionalFormatEngine {
public:
    /**
     * @brief 计算整张表的条件格式结果
     */
    static core::StyleOverlay computeOverlay(const core::Worksheet& sheet);

    /**
     * @brief 单条规则对一个值的判定
     * @param range_values 规则范围内的全部值（duplicate/unique 使用）
     */
    static bool matches(const core::ConditionalFormat& rule, const core::CellValue& value,
                        const std::vector<core::CellValue>& range_values);
};

}} // namespace fingrid::calc
