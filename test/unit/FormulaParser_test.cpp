#include <gtest/gtest.h>
#include "fingrid/formula/FormulaLexer.hpp"
#include "fingrid/formula/FormulaParser.hpp"
#include "fingrid/formula/FunctionLibrary.hpp"
#include <algorithm>

using namespace fingrid::formula;
using fingrid::core::ErrorCode;

class FormulaLexerTest : public ::testing::Test {
protected:
    std::vector<TokenType> types(const std::string& expression) {
        std::vector<TokenType> result;
        auto tokens = FormulaLexer::tokenize(expression);
        if (tokens.hasValue()) {
            for (const Token& token : tokens.value()) {
                result.push_back(token.type);
            }
        }
        return result;
    }
};

// 测试基本记号
TEST_F(FormulaLexerTest, Operators) {
    std::vector<TokenType> expected = {
        TokenType::Word, TokenType::Plus, TokenType::Number, TokenType::LessEqual,
        TokenType::Number, TokenType::NotEqual, TokenType::Word, TokenType::End};
    EXPECT_EQ(types("A1 + 2 <= 3 <> TRUE"), expected);
}

// 测试数字、字符串和错误字面量
TEST_F(FormulaLexerTest, Literals) {
    auto tokens = FormulaLexer::tokenize("1.5e3 \"say \"\"hi\"\"\" #N/A 'Cap Table'");
    ASSERT_TRUE(tokens.hasValue());
    const auto& list = tokens.value();
    ASSERT_EQ(list.size(), 5u);
    EXPECT_EQ(list[0].type, TokenType::Number);
    EXPECT_DOUBLE_EQ(list[0].number, 1500.0);
    EXPECT_EQ(list[1].type, TokenType::String);
    EXPECT_EQ(list[1].text, "say \"hi\"");
    EXPECT_EQ(list[2].type, TokenType::ErrorLiteral);
    EXPECT_EQ(list[2].text, "#N/A");
    EXPECT_EQ(list[3].type, TokenType::QuotedName);
    EXPECT_EQ(list[3].text, "Cap Table");
}

// 测试分号作为参数分隔符
TEST_F(FormulaLexerTest, SemicolonSeparator) {
    std::vector<TokenType> expected = {
        TokenType::Word, TokenType::LParen, TokenType::Number, TokenType::Comma,
        TokenType::Number, TokenType::RParen, TokenType::End};
    EXPECT_EQ(types("MAX(1;2)"), expected);
}

// 测试词法错误
TEST_F(FormulaLexerTest, Errors) {
    auto unterminated = FormulaLexer::tokenize("\"open");
    ASSERT_FALSE(unterminated.hasValue());
    EXPECT_EQ(unterminated.error().code, ErrorCode::InvalidFormula);

    EXPECT_FALSE(FormulaLexer::tokenize("#DIV/0!").hasValue());
    EXPECT_FALSE(FormulaLexer::tokenize("1 @ 2").hasValue());
}

class FormulaParserTest : public ::testing::Test {
protected:
    std::string render(const std::string& formula) {
        FormulaParser parser(FunctionLibrary::builtins());
        auto ast = parser.parse(formula);
        if (!ast) {
            return "<error>";
        }
        return ast.value()->root().toString();
    }
};

// 测试运算符优先级
TEST_F(FormulaParserTest, Precedence) {
    EXPECT_EQ(render("=1+2*3"), "(1+(2*3))");
    EXPECT_EQ(render("=(1+2)*3"), "((1+2)*3)");
    EXPECT_EQ(render("=2^3^2"), "((2^3)^2)");
    EXPECT_EQ(render("=-2^2"), "((-2)^2)");
    EXPECT_EQ(render("=\"a\"&1+2"), "(\"a\"&(1+2))");
    EXPECT_EQ(render("=A1+1>B1"), "((A1+1)>B1)");
    EXPECT_EQ(render("=50%"), "(50%)");
}

// 测试函数调用与引用
TEST_F(FormulaParserTest, CallsAndReferences) {
    EXPECT_EQ(render("=sum(A1:B2, 3)"), "SUM(A1:B2,3)");
    EXPECT_EQ(render("=IF(A1,,0)"), "IF(A1,,0)");
    EXPECT_EQ(render("=Inputs!B3*2"), "(Inputs!B3*2)");
    EXPECT_EQ(render("='Cap Table'!A1"), "'Cap Table'!A1");
    EXPECT_EQ(render("=SUM(Q1:Q4!B2)"), "SUM(Q1:Q4!B2)");
    EXPECT_EQ(render("=Revenue*TRUE"), "(Revenue*TRUE)");
    EXPECT_EQ(render("=$A$1"), "A1");
}

// 测试引用收集
TEST_F(FormulaParserTest, CollectsReferences) {
    FormulaParser parser(FunctionLibrary::builtins());
    auto ast = parser.parse("=A1+SUM(Inputs!B2:B4)+Growth+SUM(Q1:Q2!C1)");
    ASSERT_TRUE(ast.hasValue());

    const auto& refs = ast.value()->references();
    ASSERT_EQ(refs.size(), 4u);
    EXPECT_EQ(refs[0].kind, ReferenceInfo::Kind::Range);
    EXPECT_TRUE(refs[0].sheet.empty());
    EXPECT_EQ(refs[1].sheet, "Inputs");
    EXPECT_EQ(refs[1].range.rowCount(), 3);
    EXPECT_EQ(refs[2].kind, ReferenceInfo::Kind::Name);
    EXPECT_EQ(refs[2].name, "Growth");
    EXPECT_EQ(refs[3].kind, ReferenceInfo::Kind::SheetSpan);
    EXPECT_EQ(refs[3].last_sheet, "Q2");
}

// 测试语法错误
TEST_F(FormulaParserTest, SyntaxErrors) {
    FormulaParser parser(FunctionLibrary::builtins());
    for (const char* bad : {"=", "=1+", "=(1", "=SUM(1,", "=1 2", "=Inputs!"}) {
        auto result = parser.parse(bad);
        EXPECT_FALSE(result.hasValue()) << bad;
        if (!result) {
            EXPECT_EQ(result.error().code, ErrorCode::InvalidFormula) << bad;
        }
    }
}

// 测试嵌套深度与公式长度上限
TEST_F(FormulaParserTest, NestingAndLengthLimits) {
    FormulaParser parser(FunctionLibrary::builtins());
    auto nested = [](int depth) {
        return "=" + std::string(static_cast<size_t>(depth), '(') + "1" + std::string(static_cast<size_t>(depth), ')');
    };

    EXPECT_EQ(render(nested(3)), "1");
    EXPECT_TRUE(parser.parse(nested(200)).hasValue());

    for (int depth : {300, 10000}) {
        auto result = parser.parse(nested(depth));
        ASSERT_FALSE(result.hasValue()) << depth;
        EXPECT_EQ(result.error().code, ErrorCode::InvalidFormula) << depth;
    }

    auto negations = parser.parse("=" + std::string(5000, '-') + "1");
    ASSERT_FALSE(negations.hasValue());
    EXPECT_EQ(negations.error().code, ErrorCode::InvalidFormula);

    std::string calls = "=";
    for (int i = 0; i < 300; ++i) {
        calls += "ABS(";
    }
    calls += "1" + std::string(300, ')');
    EXPECT_FALSE(parser.parse(calls).hasValue());

    // 失败后解析器可以继续使用
    EXPECT_TRUE(parser.parse("=SUM(1,2)").hasValue());

    std::string long_sum = "=1";
    while (long_sum.size() <= 8192) {
        long_sum += "+1";
    }
    auto too_long = parser.parse(long_sum);
    ASSERT_FALSE(too_long.hasValue());
    EXPECT_EQ(too_long.error().code, ErrorCode::InvalidFormula);
}

// 测试函数注册表
TEST_F(FormulaParserTest, FunctionRegistry) {
    const FunctionLibrary& library = FunctionLibrary::builtins();
    EXPECT_TRUE(library.contains("irr"));
    EXPECT_TRUE(library.contains("WATERFALL"));
    EXPECT_FALSE(library.contains("NOSUCHFUNC"));

    const FunctionSpec* sum = library.find("SUM");
    ASSERT_NE(sum, nullptr);
    EXPECT_EQ(sum->family, FunctionFamily::Math);
    EXPECT_TRUE(sum->acceptsArgCount(5));

    const FunctionSpec* pi = library.find("PI");
    ASSERT_NE(pi, nullptr);
    EXPECT_FALSE(pi->acceptsArgCount(1));

    auto venture = library.names(FunctionFamily::Venture);
    EXPECT_FALSE(venture.empty());
    EXPECT_TRUE(std::is_sorted(venture.begin(), venture.end()));
}
