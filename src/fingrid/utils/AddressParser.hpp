#pragma once

#include "fingrid/core/CellAddress.hpp"
#include "fingrid/core/Expected.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace fingrid {
namespace utils {

/**
 * @brief 带工作表限定的引用拆分结果
 *
 * "A1"            -> first_sheet="", last_sheet="", local="A1"
 * "Sheet2!A1:B3"  -> first_sheet="Sheet2", last_sheet="", local="A1:B3"
 * "S1:S3!A1"      -> first_sheet="S1", last_sheet="S3", local="A1"（3D 引用）
 */
struct QualifiedReference {
    std::string first_sheet;
    std::string last_sheet;
    std::string local;

    bool hasSheet() const { return !first_sheet.empty(); }
    bool isSheetSpan() const { return !last_sheet.empty(); }
};

/**
 * @brief 地址编解码工具类
 *
 * 列字母与整数的双射（A=1, Z=26, AA=27），"A1" 形式地址与范围的解析、
 * 行优先展开。解析失败通过 Result 返回，不抛异常。
 */
class AddressParser {
public:
    /**
     * @brief 列字母转列号
     * @param letters 列字母，大小写均可
     * @return 从 1 开始的列号；空串、非字母或超过最大列数时返回错误
     */
    static core::Result<int> toIndex(std::string_view letters);

    /**
     * @brief 列号转列字母
     * @param column 从 1 开始的列号
     * @throws ParameterException column 小于 1
     */
    static std::string toLetters(int column);

    /**
     * @brief 解析 "A1"（允许 $ 绝对引用标记）
     */
    static core::Result<core::CellAddress> parseAddress(std::string_view text);

    /**
     * @brief 解析 "A1:B3"；单个地址视为 1x1 范围
     */
    static core::Result<core::CellRange> parseRange(std::string_view text);

    /**
     * @brief 按行优先展开范围；超过 Constants::kMaxExpandedCells 个单元格时返回 InvalidRange
     */
    static core::Result<std::vector<core::CellAddress>> expandRange(std::string_view text);

    /**
     * @brief 拆分工作表限定部分，工作表名可用单引号包围
     */
    static core::Result<QualifiedReference> splitQualified(std::string_view text);

    static std::string toString(const core::CellAddress& addr);
    static std::string toString(const core::CellRange& range);

    /**
     * @brief 生成带工作表限定的引用文本，必要时给工作表名加引号
     */
    static std::string qualify(const std::string& sheet_name, const std::string& local);

    static bool needsQuoting(const std::string& sheet_name);

    static bool isValidAddress(std::string_view text) {
        return parseAddress(text).hasValue();
    }

    /**
     * @brief 判断文本形状是否为 "字母+数字"（不检查上限）
     */
    static bool looksLikeAddress(std::string_view text);
};

}} // namespace fingrid::utils
