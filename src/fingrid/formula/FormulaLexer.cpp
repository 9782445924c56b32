#include "fingrid/formula/FormulaLexer.hpp"
#include "fingrid/core/CellValue.hpp"
#include "fingrid/utils/NumberUtils.hpp"
#include <fmt/format.h>
#include <cctype>

namespace fingrid {
namespace formula {

namespace {

bool isWordStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$' ||
           static_cast<unsigned char>(c) >= 0x80;
}

bool isWordChar(char c) {
    return isWordStart(c) || std::isdigit(static_cast<unsigned char>(c)) || c == '.';
}

core::Error lexError(const std::string& message, size_t position) {
    return core::makeError(core::ErrorCode::InvalidFormula, message,
                           fmt::format("position {}", position));
}

} // namespace

const char* tokenTypeName(TokenType type) noexcept {
    switch (type) {
        case TokenType::Number:       return "number";
        case TokenType::String:       return "string";
        case TokenType::Word:         return "word";
        case TokenType::QuotedName:   return "quoted name";
        case TokenType::ErrorLiteral: return "error literal";
        case TokenType::Plus:         return "+";
        case TokenType::Minus:        return "-";
        case TokenType::Star:         return "*";
        case TokenType::Slash:        return "/";
        case TokenType::Caret:        return "^";
        case TokenType::Ampersand:    return "&";
        case TokenType::Percent:      return "%";
        case TokenType::Equal:        return "=";
        case TokenType::NotEqual:     return "<>";
        case TokenType::Less:         return "<";
        case TokenType::LessEqual:    return "<=";
        case TokenType::Greater:      return ">";
        case TokenType::GreaterEqual: return ">=";
        case TokenType::LParen:       return "(";
        case TokenType::RParen:       return ")";
        case TokenType::Comma:        return ",";
        case TokenType::Colon:        return ":";
        case TokenType::Bang:         return "!";
        case TokenType::End:          return "end of formula";
    }
    return "?";
}

core::Result<std::vector<Token>> FormulaLexer::tokenize(std::string_view expression) {
    std::vector<Token> tokens;
    size_t pos = 0;
    const size_t length = expression.size();

    auto push = [&tokens](TokenType type, std::string text, size_t position) {
        Token token;
        token.type = type;
        token.text = std::move(text);
        token.position = position;
        tokens.push_back(std::move(token));
    };

    while (pos < length) {
        char c = expression[pos];

        if (std::isspace(static_cast<unsigned char>(c))) {
            ++pos;
            continue;
        }

        const size_t start = pos;

        // 数字：123、1.5、.5、1e-3
        if (std::isdigit(static_cast<unsigned char>(c)) ||
            (c == '.' && pos + 1 < length && std::isdigit(static_cast<unsigned char>(expression[pos + 1])))) {
            while (pos < length && (std::isdigit(static_cast<unsigned char>(expression[pos])) || expression[pos] == '.')) {
                ++pos;
            }
            if (pos < length && (expression[pos] == 'e' || expression[pos] == 'E')) {
                size_t exp = pos + 1;
                if (exp < length && (expression[exp] == '+' || expression[exp] == '-')) {
                    ++exp;
                }
                if (exp < length && std::isdigit(static_cast<unsigned char>(expression[exp]))) {
                    pos = exp;
                    while (pos < length && std::isdigit(static_cast<unsigned char>(expression[pos]))) {
                        ++pos;
                    }
                }
            }
            std::string text(expression.substr(start, pos - start));
            auto number = utils::NumberUtils::parseNumber(text);
            if (!number) {
                return lexError(fmt::format("Malformed number '{}'", text), start);
            }
            Token token;
            token.type = TokenType::Number;
            token.text = std::move(text);
            token.number = *number;
            token.position = start;
            tokens.push_back(std::move(token));
            continue;
        }

        if (isWordStart(c)) {
            while (pos < length && isWordChar(expression[pos])) {
                ++pos;
            }
            push(TokenType::Word, std::string(expression.substr(start, pos - start)), start);
            continue;
        }

        if (c == '"' || c == '\'') {
            const char quote = c;
            std::string text;
            ++pos;
            bool closed = false;
            while (pos < length) {
                if (expression[pos] == quote) {
                    if (pos + 1 < length && expression[pos + 1] == quote) {
                        text.push_back(quote);
                        pos += 2;
                        continue;
                    }
                    ++pos;
                    closed = true;
                    break;
                }
                text.push_back(expression[pos++]);
            }
            if (!closed) {
                return lexError("Unterminated quoted text", start);
            }
            push(quote == '"' ? TokenType::String : TokenType::QuotedName, std::move(text), start);
            continue;
        }

        // 错误字面量：#REF!、#N/A、#ERROR!、#VALUE!、#CIRCULAR!
        if (c == '#') {
            ++pos;
            while (pos < length && (std::isalpha(static_cast<unsigned char>(expression[pos])) || expression[pos] == '/')) {
                ++pos;
            }
            if (pos < length && expression[pos] == '!') {
                ++pos;
            }
            std::string text(expression.substr(start, pos - start));
            if (!core::parseErrorText(text)) {
                return lexError(fmt::format("Unknown error literal '{}'", text), start);
            }
            push(TokenType::ErrorLiteral, std::move(text), start);
            continue;
        }

        ++pos;
        switch (c) {
            case '+': push(TokenType::Plus, "+", start); break;
            case '-': push(TokenType::Minus, "-", start); break;
            case '*': push(TokenType::Star, "*", start); break;
            case '/': push(TokenType::Slash, "/", start); break;
            case '^': push(TokenType::Caret, "^", start); break;
            case '&': push(TokenType::Ampersand, "&", start); break;
            case '%': push(TokenType::Percent, "%", start); break;
            case '(': push(TokenType::LParen, "(", start); break;
            case ')': push(TokenType::RParen, ")", start); break;
            case ',':
            case ';': push(TokenType::Comma, ",", start); break;
            case ':': push(TokenType::Colon, ":", start); break;
            case '!': push(TokenType::Bang, "!", start); break;
            case '=': push(TokenType::Equal, "=", start); break;
            case '<':
                if (pos < length && expression[pos] == '=') {
                    ++pos;
                    push(TokenType::LessEqual, "<=", start);
                } else if (pos < length && expression[pos] == '>') {
                    ++pos;
                    push(TokenType::NotEqual, "<>", start);
                } else {
                    push(TokenType::Less, "<", start);
                }
                break;
            case '>':
                if (pos < length && expression[pos] == '=') {
                    ++pos;
                    push(TokenType::GreaterEqual, ">=", start);
                } else {
                    push(TokenType::Greater, ">", start);
                }
                break;
            default:
                return lexError(fmt::format("Unexpected character '{}'", c), start);
        }
    }

    push(TokenType::End, "", length);
    return tokens;
}

}} // namespace fingrid::formula
