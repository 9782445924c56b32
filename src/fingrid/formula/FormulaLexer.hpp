#pragma once

#include "fingrid/core/Expected.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace fingrid {
namespace formula {

enum class TokenType {
    Number,
    String,       // "text"，"" 表示一个双引号
    Word,         // 函数名、单元格地址、工作表名、命名范围、TRUE/FALSE
    QuotedName,   // 'Sheet Name'
    ErrorLiteral, // #REF! 等
    Plus,
    Minus,
    Star,
    Slash,
    Caret,
    Ampersand,
    Percent,
    Equal,
    NotEqual,
    Less,
    LessEqual,
    Greater,
    GreaterEqual,
    LParen,
    RParen,
    Comma,
    Colon,
    Bang,
    End
};

struct Token {
    TokenType type = TokenType::End;
    std::string text;
    double number = 0.0;
    size_t position = 0;
};

const char* tokenTypeName(TokenType type) noexcept;

/**
 * @brief 公式词法分析器
 *
 * 输入为去掉前导 = 的表达式；空白只起分隔作用。
 */
class FormulaLexer {
public:
    static core::Result<std::vector<Token>> tokenize(std::string_view expression);
};

}} // namespace fingrid::formula
