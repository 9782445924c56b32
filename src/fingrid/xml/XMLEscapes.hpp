#pragma once

#include <cstddef>
#include <string>

namespace fingrid {
namespace xml {

// XML 转义常量：实体字面量
struct XMLEscapes {
    inline static constexpr char AMP[]  = "&amp;";   // &  → &amp;
    inline static constexpr char LT[]   = "&lt;";    // <  → &lt;
    inline static constexpr char GT[]   = "&gt;";    // >  → &gt;
    inline static constexpr char QUOT[] = "&quot;";  // " → &quot;
    inline static constexpr char APOS[] = "&apos;";  // '  → &apos;
    inline static constexpr char NL[]   = "&#xA;";   // \n（属性上下文）
    inline static constexpr char CR[]   = "&#xD;";   // \r（属性上下文）
    inline static constexpr char TAB[]  = "&#x9;";   // \t（属性上下文）

    /**
     * @brief 转义文本内容
     */
    static void appendText(std::string& target, const std::string& source) {
        for (char c : source) {
            switch (c) {
                case '<': target += LT; break;
                case '>': target += GT; break;
                case '&': target += AMP; break;
                case '\r': target += CR; break;
                default: target += c; break;
            }
        }
    }

    /**
     * @brief 转义属性值，空白控制字符也转为字符引用以免被属性值规范化
     */
    static void appendAttribute(std::string& target, const std::string& source) {
        for (char c : source) {
            switch (c) {
                case '<': target += LT; break;
                case '>': target += GT; break;
                case '&': target += AMP; break;
                case '"': target += QUOT; break;
                case '\'': target += APOS; break;
                case '\n': target += NL; break;
                case '\r': target += CR; break;
                case '\t': target += TAB; break;
                default: target += c; break;
            }
        }
    }
};

}} // namespace fingrid::xml
