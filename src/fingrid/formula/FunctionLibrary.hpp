#pragma once

#include "fingrid/formula/FunctionArgs.hpp"
#include <functional>
#include <limits>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace fingrid {
namespace formula {

enum class FunctionFamily {
    Math,
    Statistical,
    Financial,
    Venture,
    Logical,
    Text,
    Date,
    Lookup
};

const char* familyName(FunctionFamily family) noexcept;

using FunctionImpl = std::function<core::CellValue(FunctionArgs&)>;

/**
 * @brief 函数描述：名称、所属族、参数个数范围、实现
 */
struct FunctionSpec {
    static constexpr size_t kVariadic = std::numeric_limits<size_t>::max();

    std::string name;
    FunctionFamily family = FunctionFamily::Math;
    size_t min_args = 0;
    size_t max_args = 0;
    FunctionImpl impl;

    bool acceptsArgCount(size_t count) const {
        return count >= min_args && count <= max_args;
    }
};

/**
 * @brief 函数注册表
 *
 * 名称不区分大小写。内置表 builtins() 在首次使用时构建，之后只读。
 */
class FunctionLibrary {
public:
    FunctionLibrary() = default;

    static const FunctionLibrary& builtins();

    void add(const std::string& name, FunctionFamily family, size_t min_args, size_t max_args,
             FunctionImpl impl);

    const FunctionSpec* find(std::string_view name) const;

    bool contains(std::string_view name) const { return find(name) != nullptr; }
    size_t size() const { return functions_.size(); }

    /**
     * @brief 某族的函数名，按字母排序
     */
    std::vector<std::string> names(FunctionFamily family) const;

private:
    std::unordered_map<std::string, FunctionSpec> functions_;
};

// 各函数族的注册入口，实现在 functions/ 目录
void registerMathFunctions(FunctionLibrary& library);
void registerStatisticalFunctions(FunctionLibrary& library);
void registerFinancialFunctions(FunctionLibrary& library);
void registerVentureFunctions(FunctionLibrary& library);
void registerLogicalFunctions(FunctionLibrary& library);
void registerTextFunctions(FunctionLibrary& library);
void registerDateFunctions(FunctionLibrary& library);
void registerLookupFunctions(FunctionLibrary& library);

}} // namespace fingrid::formula
