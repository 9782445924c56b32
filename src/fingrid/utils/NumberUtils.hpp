#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace fingrid {
namespace utils {

/**
 * @brief 数值文本解析与显示格式化
 */
class NumberUtils {
public:
    /**
     * @brief 严格解析：整段文本（去掉首尾空白后）必须是一个数
     */
    static std::optional<double> parseNumber(std::string_view text);

    /**
     * @brief 宽松解析：额外接受货币符号、千分位逗号和百分号后缀
     *
     * "$1,234.50" -> 1234.5，"15%" -> 0.15
     */
    static std::optional<double> parseLooseNumber(std::string_view text);

    /**
     * @brief 显示文本：最多 15 位有效数字，整数不带小数点
     */
    static std::string formatNumber(double value);

    /**
     * @brief 按固定小数位格式化（ROUND/TEXT 使用）
     */
    static std::string formatFixed(double value, int decimals);

    static std::string_view trim(std::string_view text);
};

}} // namespace fingrid::utils
