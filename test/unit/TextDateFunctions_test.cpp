#include "FormulaTestSupport.hpp"

using fingrid::core::CellValue;
using fingrid::core::FormulaError;

class TextFunctionsTest : public FormulaTestBase {
};

// 测试大小写、长度与截取
TEST_F(TextFunctionsTest, CaseAndSlicing) {
    EXPECT_DOUBLE_EQ(number("=LEN(\"FinGrid\")"), 7.0);
    EXPECT_DOUBLE_EQ(number("=LEN(\"h\xC3\xA9llo\")"), 5.0);
    EXPECT_EQ(text("=UPPER(\"series a\")"), "SERIES A");
    EXPECT_EQ(text("=LOWER(\"EBITDA\")"), "ebitda");
    EXPECT_EQ(text("=TRIM(\"  net revenue  \")"), "net revenue");
    EXPECT_EQ(text("=PROPER(\"hello wORLD\")"), "Hello World");

    EXPECT_EQ(text("=LEFT(\"abc\")"), "a");
    EXPECT_EQ(text("=LEFT(\"abc\", 5)"), "abc");
    EXPECT_EQ(text("=RIGHT(\"abc\", 2)"), "bc");
    EXPECT_EQ(text("=MID(\"FinGrid\", 4, 4)"), "Grid");
    EXPECT_EQ(text("=MID(\"FinGrid\", 10, 2)"), "");
    EXPECT_EQ(eval("=MID(\"FinGrid\", 0, 2)"), error(FormulaError::Value));
    EXPECT_EQ(eval("=LEFT(\"abc\", -1)"), error(FormulaError::Value));
}

// 测试查找与替换
TEST_F(TextFunctionsTest, FindAndReplace) {
    EXPECT_DOUBLE_EQ(number("=FIND(\"b\", \"abcb\")"), 2.0);
    EXPECT_DOUBLE_EQ(number("=FIND(\"b\", \"abcb\", 3)"), 4.0);
    EXPECT_EQ(eval("=FIND(\"B\", \"abc\")"), error(FormulaError::Value));
    EXPECT_DOUBLE_EQ(number("=SEARCH(\"B\", \"abc\")"), 2.0);
    EXPECT_EQ(eval("=SEARCH(\"z\", \"abc\")"), error(FormulaError::Value));

    EXPECT_EQ(text("=SUBSTITUTE(\"a-b-c\", \"-\", \"+\")"), "a+b+c");
    EXPECT_EQ(text("=SUBSTITUTE(\"a-b-c\", \"-\", \"+\", 2)"), "a-b+c");
    EXPECT_EQ(eval("=SUBSTITUTE(\"a-b-c\", \"-\", \"+\", 0)"), error(FormulaError::Value));
    EXPECT_EQ(text("=REPLACE(\"abcdef\", 2, 3, \"X\")"), "aXef");

    EXPECT_EQ(text("=REPT(\"ab\", 3)"), "ababab");
    EXPECT_EQ(eval("=REPT(\"x\", 40000)"), error(FormulaError::Value));
}

// 测试拼接
TEST_F(TextFunctionsTest, Concatenation) {
    put("A1", CellValue("Q"));
    put("B1", CellValue(4.0));
    EXPECT_EQ(text("=CONCATENATE(\"FY\", 24, TRUE)"), "FY24TRUE");
    EXPECT_EQ(text("=CONCAT(A1:B1, \"-2024\")"), "Q4-2024");
    EXPECT_EQ(text("=\"a\"&1"), "a1");
    EXPECT_EQ(text("=A1&B1*2"), "Q8");
}

// 测试 TEXT 与 VALUE
TEST_F(TextFunctionsTest, NumberFormatting) {
    EXPECT_EQ(text("=TEXT(1234.567, \"#,##0.00\")"), "1,234.57");
    EXPECT_EQ(text("=TEXT(0.125, \"0.0%\")"), "12.5%");
    EXPECT_EQ(text("=TEXT(-1500, \"$#,##0\")"), "-$1,500");
    EXPECT_EQ(text("=TEXT(1234567, \"#,##0\")"), "1,234,567");
    EXPECT_EQ(text("=TEXT(DATE(2024, 6, 15), \"yyyy-mm-dd\")"), "2024-06-15");

    EXPECT_DOUBLE_EQ(number("=VALUE(\"$1,200\")"), 1200.0);
    EXPECT_DOUBLE_EQ(number("=VALUE(\"42\")"), 42.0);
    EXPECT_EQ(eval("=VALUE(\"abc\")"), error(FormulaError::Value));
}

// 测试超大的次数与位置参数
TEST_F(TextFunctionsTest, OversizedCounts) {
    EXPECT_EQ(eval("=LEN(REPT(\"ab\", 9223372036854775808))"), error(FormulaError::Value));
    EXPECT_EQ(eval("=REPT(\"ab\", 1e300)"), error(FormulaError::Value));
    EXPECT_EQ(eval("=REPT(\"x\", 32768)"), error(FormulaError::Value));
    EXPECT_DOUBLE_EQ(number("=LEN(REPT(\"x\", 32767))"), 32767.0);
    EXPECT_EQ(text("=REPT(\"\", 1e6)"), "");
    EXPECT_EQ(text("=REPT(\"ab\", 2.9)"), "abab");

    EXPECT_EQ(text("=LEFT(\"abc\", 1e20)"), "abc");
    EXPECT_EQ(text("=RIGHT(\"abc\", 1e20)"), "abc");
    EXPECT_EQ(text("=MID(\"abc\", 1e20, 1)"), "");
    EXPECT_EQ(text("=MID(\"abc\", 2, 1e20)"), "bc");
    EXPECT_EQ(text("=REPLACE(\"abc\", 1e20, 1, \"d\")"), "abcd");
    EXPECT_EQ(text("=SUBSTITUTE(\"a-a\", \"a\", \"b\", 1e20)"), "a-a");
}

class DateFunctionsTest : public FormulaTestBase {
};

// 测试日期序列号
TEST_F(DateFunctionsTest, Serials) {
    EXPECT_DOUBLE_EQ(number("=DATE(2024, 1, 31)"), 45322.0);
    EXPECT_DOUBLE_EQ(number("=DATE(2023, 13, 1)"), number("=DATE(2024, 1, 1)"));
    EXPECT_DOUBLE_EQ(number("=YEAR(DATE(2024, 6, 15))"), 2024.0);
    EXPECT_DOUBLE_EQ(number("=MONTH(DATE(2024, 6, 15))"), 6.0);
    EXPECT_DOUBLE_EQ(number("=DAY(DATE(2024, 6, 15))"), 15.0);

    // ISO 日期文本可直接作为日期参数
    EXPECT_DOUBLE_EQ(number("=YEAR(\"2025-03-31\")"), 2025.0);
    EXPECT_EQ(eval("=YEAR(\"soon\")"), error(FormulaError::Value));

    EXPECT_GT(number("=TODAY()"), 45000.0);
    EXPECT_GE(number("=NOW()"), number("=TODAY()"));
}

// 测试日期运算
TEST_F(DateFunctionsTest, Arithmetic) {
    EXPECT_DOUBLE_EQ(number("=EDATE(DATE(2024, 1, 31), 1)"), number("=DATE(2024, 2, 29)"));
    EXPECT_DOUBLE_EQ(number("=EDATE(DATE(2024, 3, 15), -3)"), number("=DATE(2023, 12, 15)"));
    EXPECT_DOUBLE_EQ(number("=DAYS(DATE(2024, 3, 1), DATE(2024, 2, 1))"), 29.0);

    EXPECT_DOUBLE_EQ(number("=DATEDIF(DATE(2024, 1, 1), DATE(2025, 1, 1), \"D\")"), 366.0);
    EXPECT_DOUBLE_EQ(number("=DATEDIF(DATE(2024, 1, 1), DATE(2025, 1, 1), \"M\")"), 12.0);
    EXPECT_DOUBLE_EQ(number("=DATEDIF(DATE(2024, 1, 1), DATE(2025, 1, 1), \"y\")"), 1.0);
    EXPECT_EQ(eval("=DATEDIF(DATE(2024, 1, 1), DATE(2025, 1, 1), \"W\")"), error(FormulaError::Value));
}

// 超出可表示范围的日期为 #VALUE!
TEST_F(DateFunctionsTest, OutOfRangeParts) {
    EXPECT_EQ(eval("=DATE(1e12, 1, 1)"), error(FormulaError::Value));
    EXPECT_EQ(eval("=DATE(2024, 1e12, 1)"), error(FormulaError::Value));
    EXPECT_EQ(eval("=DATE(2024, 1, -1e12)"), error(FormulaError::Value));
    EXPECT_EQ(eval("=EDATE(DATE(2024, 1, 1), 1e12)"), error(FormulaError::Value));
    EXPECT_EQ(eval("=YEAR(1e20)"), error(FormulaError::Value));
    EXPECT_EQ(eval("=MONTH(-1e20)"), error(FormulaError::Value));
    EXPECT_DOUBLE_EQ(number("=YEAR(DATE(9999, 12, 31))"), 9999.0);
}
