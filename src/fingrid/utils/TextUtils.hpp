#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace fingrid {
namespace utils {

/**
 * @brief 文本函数使用的 UTF-8 工具
 *
 * 位置与长度一律按码点计算；非法 UTF-8 退化为按字节处理。
 */
class TextUtils {
public:
    static size_t length(const std::string& text);

    /**
     * @brief 按码点截取子串
     * @param start 从 0 开始的码点位置
     * @param count 码点个数，超出末尾时截到末尾
     */
    static std::string substr(const std::string& text, size_t start, size_t count);

    static std::string left(const std::string& text, size_t count);
    static std::string right(const std::string& text, size_t count);

    static std::string toUpper(std::string text);
    static std::string toLower(std::string text);

    /**
     * @brief 每个单词首字母大写，其余小写
     */
    static std::string proper(const std::string& text);

    static std::string trim(const std::string& text);

    /**
     * @brief 查找子串，返回从 0 开始的码点位置
     * @param from 起始码点位置
     * @param ignore_case 是否忽略 ASCII 大小写（SEARCH 语义）
     */
    static std::optional<size_t> find(const std::string& haystack, const std::string& needle,
                                      size_t from, bool ignore_case);

    /**
     * @brief 替换子串
     * @param instance 0 表示全部替换，否则只替换第 instance 次出现
     */
    static std::string substitute(const std::string& text, const std::string& old_text,
                                  const std::string& new_text, size_t instance = 0);

    /**
     * @brief 用 replacement 替换从 start 起 count 个码点
     */
    static std::string replace(const std::string& text, size_t start, size_t count,
                               const std::string& replacement);

    static bool equalsIgnoreCase(std::string_view a, std::string_view b);
    static bool containsIgnoreCase(std::string_view haystack, std::string_view needle);

private:
    static size_t byteOffset(const std::string& text, size_t code_points);
};

}} // namespace fingrid::utils
