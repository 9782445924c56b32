#include "fingrid/formula/FormulaParser.hpp"
#include "fingrid/core/Constants.hpp"
#include "fingrid/formula/FunctionLibrary.hpp"
#include "fingrid/utils/AddressParser.hpp"
#include "fingrid/utils/ModuleLoggers.hpp"
#include "fingrid/utils/TextUtils.hpp"
#include <fmt/format.h>
#include <cctype>

namespace fingrid {
namespace formula {

using core::CellValue;
using core::FormulaError;
using core::Result;

namespace {

template<typename T, typename... Args>
ExprPtr make(Args&&... args) {
    return ExprPtr(new T(std::forward<Args>(args)...));
}

// 列字母不超过 3 个才按单元格地址处理，Revenue2024 之类仍是命名范围
bool isCellToken(const std::string& text) {
    if (!utils::AddressParser::looksLikeAddress(text)) {
        return false;
    }
    size_t letters = 0;
    for (char ch : text) {
        if (std::isalpha(static_cast<unsigned char>(ch))) {
            ++letters;
        }
    }
    return letters <= 3;
}

ExprPtr refError() {
    return make<LiteralExpr>(CellValue(FormulaError::Ref));
}

// 进入一层嵌套，离开作用域时退出
class NestingScope {
public:
    explicit NestingScope(int& depth) : depth_(depth) { ++depth_; }
    ~NestingScope() { --depth_; }

    NestingScope(const NestingScope&) = delete;
    NestingScope& operator=(const NestingScope&) = delete;

private:
    int& depth_;
};

} // namespace

FormulaParser::FormulaParser(const FunctionLibrary& library)
    : library_(library) {
}

Result<std::shared_ptr<const FormulaAST>> FormulaParser::parse(const std::string& formula) {
    if (formula.size() > core::Constants::kMaxFormulaLength) {
        return core::makeError(core::ErrorCode::InvalidFormula,
                               fmt::format("Formula longer than {} characters", core::Constants::kMaxFormulaLength),
                               formula.substr(0, 32));
    }

    std::string_view body(formula);
    if (!body.empty() && body.front() == '=') {
        body.remove_prefix(1);
    }

    auto tokens = FormulaLexer::tokenize(body);
    if (!tokens) {
        return tokens.error();
    }
    tokens_ = std::move(*tokens);
    pos_ = 0;
    depth_ = 0;

    if (peek().type == TokenType::End) {
        return core::makeError(core::ErrorCode::InvalidFormula, "Empty formula", formula);
    }

    auto root = parseExpression();
    if (!root) {
        core::Error error = root.error();
        error.context = formula;
        return error;
    }
    if (peek().type != TokenType::End) {
        core::Error error = unexpected(peek(), "end of formula");
        error.context = formula;
        return error;
    }

    return std::shared_ptr<const FormulaAST>(std::make_shared<FormulaAST>(formula, std::move(*root)));
}

Result<ExprPtr> FormulaParser::parseExpression() {
    return parseComparison();
}

Result<ExprPtr> FormulaParser::parseComparison() {
    auto lhs = parseConcat();
    if (!lhs) {
        return lhs;
    }
    ExprPtr left = std::move(*lhs);

    while (true) {
        BinaryOp op;
        switch (peek().type) {
            case TokenType::Equal:        op = BinaryOp::Equal; break;
            case TokenType::NotEqual:     op = BinaryOp::NotEqual; break;
            case TokenType::Less:         op = BinaryOp::Less; break;
            case TokenType::LessEqual:    op = BinaryOp::LessEqual; break;
            case TokenType::Greater:      op = BinaryOp::Greater; break;
            case TokenType::GreaterEqual: op = BinaryOp::GreaterEqual; break;
            default:
                return left;
        }
        advance();
        auto rhs = parseConcat();
        if (!rhs) {
            return rhs;
        }
        left = make<BinaryExpr>(op, std::move(left), std::move(*rhs));
    }
}

Result<ExprPtr> FormulaParser::parseConcat() {
    auto lhs = parseAdditive();
    if (!lhs) {
        return lhs;
    }
    ExprPtr left = std::move(*lhs);

    while (match(TokenType::Ampersand)) {
        auto rhs = parseAdditive();
        if (!rhs) {
            return rhs;
        }
        left = make<BinaryExpr>(BinaryOp::Concat, std::move(left), std::move(*rhs));
    }
    return left;
}

Result<ExprPtr> FormulaParser::parseAdditive() {
    auto lhs = parseMultiplicative();
    if (!lhs) {
        return lhs;
    }
    ExprPtr left = std::move(*lhs);

    while (peek().type == TokenType::Plus || peek().type == TokenType::Minus) {
        BinaryOp op = advance().type == TokenType::Plus ? BinaryOp::Add : BinaryOp::Subtract;
        auto rhs = parseMultiplicative();
        if (!rhs) {
            return rhs;
        }
        left = make<BinaryExpr>(op, std::move(left), std::move(*rhs));
    }
    return left;
}

Result<ExprPtr> FormulaParser::parseMultiplicative() {
    auto lhs = parsePower();
    if (!lhs) {
        return lhs;
    }
    ExprPtr left = std::move(*lhs);

    while (peek().type == TokenType::Star || peek().type == TokenType::Slash) {
        BinaryOp op = advance().type == TokenType::Star ? BinaryOp::Multiply : BinaryOp::Divide;
        auto rhs = parsePower();
        if (!rhs) {
            return rhs;
        }
        left = make<BinaryExpr>(op, std::move(left), std::move(*rhs));
    }
    return left;
}

Result<ExprPtr> FormulaParser::parsePower() {
    auto lhs = parseUnary();
    if (!lhs) {
        return lhs;
    }
    ExprPtr left = std::move(*lhs);

    while (match(TokenType::Caret)) {
        auto rhs = parseUnary();
        if (!rhs) {
            return rhs;
        }
        left = make<BinaryExpr>(BinaryOp::Power, std::move(left), std::move(*rhs));
    }
    return left;
}

Result<ExprPtr> FormulaParser::parseUnary() {
    // 括号、函数参数与连续正负号都经过这里，深度即嵌套层数
    if (depth_ >= core::Constants::kMaxFormulaNesting) {
        return core::makeError(core::ErrorCode::InvalidFormula,
                               fmt::format("Formula nesting deeper than {} levels at position {}",
                                           core::Constants::kMaxFormulaNesting, peek().position));
    }
    NestingScope scope(depth_);

    if (peek().type == TokenType::Plus || peek().type == TokenType::Minus) {
        char op = advance().type == TokenType::Plus ? '+' : '-';
        auto operand = parseUnary();
        if (!operand) {
            return operand;
        }
        return make<UnaryExpr>(op, std::move(*operand));
    }
    return parsePostfix();
}

Result<ExprPtr> FormulaParser::parsePostfix() {
    auto primary = parsePrimary();
    if (!primary) {
        return primary;
    }
    ExprPtr expr = std::move(*primary);
    while (match(TokenType::Percent)) {
        expr = make<PercentExpr>(std::move(expr));
    }
    return expr;
}

Result<ExprPtr> FormulaParser::parsePrimary() {
    const Token& token = peek();

    switch (token.type) {
        case TokenType::Number: {
            double number = advance().number;
            return make<LiteralExpr>(CellValue(number));
        }
        case TokenType::String: {
            std::string text = advance().text;
            return make<LiteralExpr>(CellValue(std::move(text)));
        }
        case TokenType::ErrorLiteral: {
            auto error = core::parseErrorText(advance().text);
            return make<LiteralExpr>(CellValue(error.value_or(FormulaError::Generic)));
        }
        case TokenType::LParen: {
            advance();
            auto inner = parseExpression();
            if (!inner) {
                return inner;
            }
            if (!match(TokenType::RParen)) {
                return unexpected(peek(), "')'");
            }
            return inner;
        }
        case TokenType::QuotedName: {
            std::string name = advance().text;
            if (!match(TokenType::Bang)) {
                return unexpected(peek(), "'!' after sheet name");
            }
            // 'First:Last'!A1 形式的 3D 引用
            size_t colon = name.find(':');
            if (colon != std::string::npos) {
                return parseSheetReference(name.substr(0, colon), name.substr(colon + 1));
            }
            return parseSheetReference(name, "");
        }
        case TokenType::Word:
            return parseWord();
        default:
            return unexpected(token, "a value");
    }
}

Result<ExprPtr> FormulaParser::parseWord() {
    std::string word = advance().text;

    if (peek().type == TokenType::LParen) {
        return parseCall(word);
    }

    if (match(TokenType::Bang)) {
        return parseSheetReference(word, "");
    }

    if (peek().type == TokenType::Colon && peek(1).type == TokenType::Word) {
        if (peek(2).type == TokenType::Bang) {
            advance();
            std::string last = advance().text;
            advance();
            return parseSheetReference(word, last);
        }
        if (isCellToken(word)) {
            advance();
            std::string second = advance().text;
            return makeReference("", word, second);
        }
    }

    if (isCellToken(word)) {
        return makeReference("", word, "");
    }

    if (utils::TextUtils::equalsIgnoreCase(word, "TRUE")) {
        return make<LiteralExpr>(CellValue(true));
    }
    if (utils::TextUtils::equalsIgnoreCase(word, "FALSE")) {
        return make<LiteralExpr>(CellValue(false));
    }

    return make<NameRefExpr>(word);
}

Result<ExprPtr> FormulaParser::parseCall(const std::string& name) {
    advance();  // (
    std::vector<ExprPtr> args;

    if (!match(TokenType::RParen)) {
        while (true) {
            // 省略的参数按空值处理，如 IF(A1,,0)
            if (peek().type == TokenType::Comma || peek().type == TokenType::RParen) {
                args.push_back(make<LiteralExpr>(CellValue()));
            } else {
                auto arg = parseExpression();
                if (!arg) {
                    return arg;
                }
                args.push_back(std::move(*arg));
            }

            if (match(TokenType::Comma)) {
                continue;
            }
            if (match(TokenType::RParen)) {
                break;
            }
            return unexpected(peek(), "',' or ')'");
        }
    }

    std::string upper = utils::TextUtils::toUpper(name);
    const FunctionSpec* spec = library_.find(upper);
    if (!spec) {
        FORMULA_DEBUG("Formula calls unknown function {}", upper);
    }
    return make<CallExpr>(std::move(upper), spec, std::move(args));
}

Result<ExprPtr> FormulaParser::parseSheetReference(const std::string& first_sheet, const std::string& last_sheet) {
    if (peek().type != TokenType::Word) {
        return unexpected(peek(), "a cell reference after '!'");
    }
    std::string first = advance().text;
    std::string second;
    if (peek().type == TokenType::Colon && peek(1).type == TokenType::Word) {
        advance();
        second = advance().text;
    }

    if (last_sheet.empty()) {
        return makeReference(first_sheet, first, second);
    }

    auto range = utils::AddressParser::parseRange(second.empty() ? first : first + ":" + second);
    if (!range) {
        return refError();
    }
    return make<SheetSpanRefExpr>(first_sheet, last_sheet, *range);
}

ExprPtr FormulaParser::makeReference(const std::string& sheet, const std::string& first, const std::string& last) {
    auto start = utils::AddressParser::parseAddress(first);
    if (!start) {
        return refError();
    }
    if (last.empty()) {
        return make<CellRefExpr>(sheet, *start);
    }
    auto end = utils::AddressParser::parseAddress(last);
    if (!end) {
        return refError();
    }
    return make<RangeRefExpr>(sheet, core::CellRange(*start, *end));
}

const Token& FormulaParser::peek(size_t offset) const {
    size_t index = pos_ + offset;
    if (index >= tokens_.size()) {
        return tokens_.back();
    }
    return tokens_[index];
}

const Token& FormulaParser::advance() {
    const Token& token = peek();
    if (pos_ < tokens_.size() - 1) {
        ++pos_;
    }
    return token;
}

bool FormulaParser::match(TokenType type) {
    if (peek().type == type) {
        advance();
        return true;
    }
    return false;
}

core::Error FormulaParser::unexpected(const Token& token, const char* expected) const {
    return core::makeError(core::ErrorCode::InvalidFormula,
                           fmt::format("Expected {} but found {} at position {}",
                                       expected, tokenTypeName(token.type), token.position));
}

}} // namespace fingrid::formula
