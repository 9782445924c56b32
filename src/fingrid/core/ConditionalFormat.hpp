#pragma once

#include "fingrid/core/Cell.hpp"
#include "fingrid/core/CellAddress.hpp"
#include "fingrid/core/CellValue.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace fingrid {
namespace core {

/**
 * @brief 条件格式的判定方式
 */
enum class ConditionKind : uint8_t {
    Equals = 0,
    Greater = 1,
    Less = 2,
    Between = 3,    // 闭区间 [value, value2]
    Contains = 4,   // 显示文本包含 value（区分大小写）
    Duplicate = 5,  // 在规则范围内出现至少两次
    Unique = 6      // 在规则范围内只出现一次
};

const char* conditionKindName(ConditionKind kind) noexcept;
std::optional<ConditionKind> parseConditionKind(const std::string& name) noexcept;

/**
 * @brief 一条条件格式规则
 */
struct ConditionalFormat {
    std::string id;
    CellRange range;
    ConditionKind condition = ConditionKind::Equals;
    CellValue value;
    CellValue value2;
    CellStyle style;

    bool operator==(const ConditionalFormat& other) const {
        return id == other.id && range == other.range && condition == other.condition &&
               value == other.value && value2 == other.value2 && style == other.style;
    }
    bool operator!=(const ConditionalFormat& other) const { return !(*this == other); }
};

}} // namespace fingrid::core
