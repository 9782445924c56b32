#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace fingrid {
namespace core {

/**
 * @brief 单元格级错误值
 *
 * 求值失败以值的形式保存在单元格中并沿引用传播，不会以异常形式
 * 越过求值器边界。
 */
enum class FormulaError : uint8_t {
    Generic = 0,      // #ERROR!  表达式非法、结果非有限数
    Ref = 1,          // #REF!    地址非法或越界、工作表不存在
    NotAvailable = 2, // #N/A     查找无匹配
    Circular = 3,     // #CIRCULAR! 循环引用
    Value = 4         // #VALUE!  参数无法解释为所需类型
};

const char* errorText(FormulaError error) noexcept;

/**
 * @brief 把 "#REF!" 等文本还原为错误值（状态导入使用）
 */
std::optional<FormulaError> parseErrorText(std::string_view text) noexcept;

/**
 * @brief 物化值：空、数值、文本、布尔或错误
 */
class CellValue {
public:
    enum class Kind : uint8_t {
        Empty = 0,
        Number = 1,
        Text = 2,
        Boolean = 3,
        Error = 4
    };

    CellValue() = default;
    CellValue(double number) : data_(number) {}
    CellValue(int number) : data_(static_cast<double>(number)) {}
    CellValue(bool boolean) : data_(boolean) {}
    CellValue(std::string text) : data_(std::move(text)) {}
    CellValue(const char* text) : data_(std::string(text)) {}
    CellValue(FormulaError error) : data_(error) {}

    Kind kind() const noexcept { return static_cast<Kind>(data_.index()); }

    bool isEmpty() const noexcept { return kind() == Kind::Empty; }
    bool isNumber() const noexcept { return kind() == Kind::Number; }
    bool isText() const noexcept { return kind() == Kind::Text; }
    bool isBoolean() const noexcept { return kind() == Kind::Boolean; }
    bool isError() const noexcept { return kind() == Kind::Error; }

    // 类型不符时返回默认值，调用方先用 isXxx() 判断
    double asNumber() const noexcept;
    const std::string& asText() const noexcept;
    bool asBoolean() const noexcept;
    FormulaError asError() const noexcept;

    /**
     * @brief 显示文本：数值最多 15 位有效数字，布尔为 TRUE/FALSE，
     *        错误为其哨兵文本，空为 ""
     */
    std::string toDisplayString() const;

    bool operator==(const CellValue& other) const { return data_ == other.data_; }
    bool operator!=(const CellValue& other) const { return !(*this == other); }

private:
    // 下标顺序与 Kind 保持一致
    std::variant<std::monostate, double, std::string, bool, FormulaError> data_;
};

const char* kindName(CellValue::Kind kind) noexcept;

}} // namespace fingrid::core
