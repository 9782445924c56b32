#pragma once

#include "fingrid/formula/FormulaAST.hpp"
#include "fingrid/formula/FormulaLexer.hpp"
#include <memory>
#include <string>
#include <vector>

namespace fingrid {
namespace formula {

class FunctionLibrary;

/**
 * @brief 递归下降公式解析器
 *
 * 优先级从低到高：比较、连接 &、加减、乘除、乘方（左结合）、一元正负、
 * 后缀 %、基本项。地址形状正确但超出网格的引用解析为 #REF! 字面量，
 * 语法错误通过 Result 返回。文本超过 Constants::kMaxFormulaLength 或
 * 嵌套超过 Constants::kMaxFormulaNesting 层时同样返回 InvalidFormula。
 */
class FormulaParser {
public:
    explicit FormulaParser(const FunctionLibrary& library);

    /**
     * @brief 解析公式
     * @param formula 公式文本，前导 = 可有可无
     */
    core::Result<std::shared_ptr<const FormulaAST>> parse(const std::string& formula);

private:
    core::Result<ExprPtr> parseExpression();
    core::Result<ExprPtr> parseComparison();
    core::Result<ExprPtr> parseConcat();
    core::Result<ExprPtr> parseAdditive();
    core::Result<ExprPtr> parseMultiplicative();
    core::Result<ExprPtr> parsePower();
    core::Result<ExprPtr> parseUnary();
    core::Result<ExprPtr> parsePostfix();
    core::Result<ExprPtr> parsePrimary();

    core::Result<ExprPtr> parseWord();
    core::Result<ExprPtr> parseCall(const std::string& name);
    core::Result<ExprPtr> parseSheetReference(const std::string& first_sheet, const std::string& last_sheet);

    /**
     * @brief 由地址文本构造引用节点；形状正确但越界得到 #REF!
     */
    ExprPtr makeReference(const std::string& sheet, const std::string& first, const std::string& last);

    const Token& peek(size_t offset = 0) const;
    const Token& advance();
    bool match(TokenType type);
    core::Error unexpected(const Token& token, const char* expected) const;

    const FunctionLibrary& library_;
    std::vector<Token> tokens_;
    size_t pos_ = 0;
    int depth_ = 0;
};

}} // namespace fingrid::formula
