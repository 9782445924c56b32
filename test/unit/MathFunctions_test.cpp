#include "FormulaTestSupport.hpp"

using fingrid::core::CellValue;
using fingrid::core::FormulaError;

class MathFunctionsTest : public FormulaTestBase {
protected:
    void SetUp() override {
        FormulaTestBase::SetUp();
        // A1:A4 = 1, "x", 3, TRUE；B1:B3 = 2, 4, 6
        put("A1", CellValue(1.0));
        put("A2", CellValue("x"));
        put("A3", CellValue(3.0));
        put("A4", CellValue(true));
        put("B1", CellValue(2.0));
        put("B2", CellValue(4.0));
        put("B3", CellValue(6.0));
    }
};

// 测试基本聚合
TEST_F(MathFunctionsTest, Aggregates) {
    EXPECT_DOUBLE_EQ(number("=SUM(1,2,3)"), 6.0);
    EXPECT_DOUBLE_EQ(number("=AVERAGE(1,2,3)"), 2.0);
    EXPECT_DOUBLE_EQ(number("=MIN(B1:B3, 5)"), 2.0);
    EXPECT_DOUBLE_EQ(number("=MAX(B1:B3, 5)"), 6.0);
    EXPECT_DOUBLE_EQ(number("=PRODUCT(B1:B3)"), 48.0);
}

// 引用中的文本与布尔值被跳过
TEST_F(MathFunctionsTest, ReferencesSkipNonNumbers) {
    EXPECT_DOUBLE_EQ(number("=SUM(A1:A4)"), 4.0);
    EXPECT_DOUBLE_EQ(number("=AVERAGE(A1:A4)"), 2.0);
    EXPECT_DOUBLE_EQ(number("=COUNT(A1:A4)"), 2.0);
    EXPECT_DOUBLE_EQ(number("=COUNTA(A1:A4)"), 4.0);
    EXPECT_DOUBLE_EQ(number("=COUNT(1,\"2\",TRUE,\"x\")"), 3.0);
}

// 测试空集合
TEST_F(MathFunctionsTest, EmptyInputs) {
    EXPECT_EQ(eval("=AVERAGE(Z1:Z5)"), error(FormulaError::Generic));
    EXPECT_DOUBLE_EQ(number("=MIN(Z1:Z5)"), 0.0);
    EXPECT_DOUBLE_EQ(number("=MAX(Z1:Z5)"), 0.0);
    EXPECT_DOUBLE_EQ(number("=SUM(Z1:Z5)"), 0.0);
}

// 引用中的错误向外传播
TEST_F(MathFunctionsTest, ErrorPropagation) {
    formula("C1", "=1/0");
    EXPECT_EQ(value("C1"), error(FormulaError::Generic));
    EXPECT_EQ(eval("=SUM(B1:C1)"), error(FormulaError::Generic));
    EXPECT_EQ(eval("=SQRT(-1)"), error(FormulaError::Generic));
    EXPECT_EQ(eval("=1+\"abc\""), error(FormulaError::Value));
}

// 测试 SUMPRODUCT 与条件聚合
TEST_F(MathFunctionsTest, SumProductAndCriteria) {
    put("C1", CellValue(1.0));
    put("C2", CellValue(2.0));
    put("C3", CellValue(3.0));
    EXPECT_DOUBLE_EQ(number("=SUMPRODUCT(B1:B3, C1:C3)"), 28.0);
    EXPECT_EQ(eval("=SUMPRODUCT(B1:B3, C1:C2)"), error(FormulaError::Value));

    EXPECT_DOUBLE_EQ(number("=SUMIF(B1:B3, \">3\")"), 10.0);
    EXPECT_DOUBLE_EQ(number("=SUMIF(B1:B3, \"<>4\", C1:C3)"), 4.0);
    EXPECT_DOUBLE_EQ(number("=SUMIF(B1:B3, 4, C1:C3)"), 2.0);
    EXPECT_DOUBLE_EQ(number("=COUNTIF(B1:B3, \">=4\")"), 2.0);
    EXPECT_DOUBLE_EQ(number("=COUNTIF(A1:A4, \"=X\")"), 1.0);
}

// 测试取整族
TEST_F(MathFunctionsTest, Rounding) {
    EXPECT_DOUBLE_EQ(number("=ROUND(2.5)"), 3.0);
    EXPECT_DOUBLE_EQ(number("=ROUND(-2.5)"), -3.0);
    EXPECT_DOUBLE_EQ(number("=ROUND(2.345, 1)"), 2.3);
    EXPECT_NEAR(number("=ROUND(1234, -2)"), 1200.0, 1e-9);
    EXPECT_DOUBLE_EQ(number("=ROUNDUP(0.1+0.2, 1)"), 0.3);
    EXPECT_DOUBLE_EQ(number("=ROUNDUP(-1.21, 1)"), -1.3);
    EXPECT_DOUBLE_EQ(number("=ROUNDDOWN(-1.29, 1)"), -1.2);
    EXPECT_DOUBLE_EQ(number("=INT(-1.5)"), -2.0);

    EXPECT_DOUBLE_EQ(number("=CEILING(4.2)"), 5.0);
    EXPECT_DOUBLE_EQ(number("=CEILING(4.2, 0.5)"), 4.5);
    EXPECT_DOUBLE_EQ(number("=FLOOR(4.7, 2)"), 4.0);
    EXPECT_EQ(eval("=FLOOR(1, 0)"), error(FormulaError::Generic));
}

// 测试其他数学函数
TEST_F(MathFunctionsTest, Scalars) {
    EXPECT_DOUBLE_EQ(number("=ABS(-7)"), 7.0);
    EXPECT_DOUBLE_EQ(number("=POWER(2, 10)"), 1024.0);
    EXPECT_DOUBLE_EQ(number("=2^10"), 1024.0);
    EXPECT_DOUBLE_EQ(number("=SQRT(16)"), 4.0);
    EXPECT_NEAR(number("=LN(EXP(2))"), 2.0, 1e-12);
    EXPECT_NEAR(number("=LOG(100)"), 2.0, 1e-12);
    EXPECT_NEAR(number("=LOG(8, 2)"), 3.0, 1e-12);
    EXPECT_DOUBLE_EQ(number("=MOD(7, 3)"), 1.0);
    EXPECT_DOUBLE_EQ(number("=MOD(-7, 3)"), -1.0);
    EXPECT_EQ(eval("=MOD(1, 0)"), error(FormulaError::Generic));
    EXPECT_DOUBLE_EQ(number("=SIGN(-5)"), -1.0);
    EXPECT_NEAR(number("=PI()"), 3.14159265358979, 1e-12);
    EXPECT_DOUBLE_EQ(number("=50%"), 0.5);
    EXPECT_DOUBLE_EQ(number("=-(3-5)"), 2.0);
}

// 未知函数与参数个数错误
TEST_F(MathFunctionsTest, UnknownFunctionAndArity) {
    EXPECT_EQ(eval("=NOSUCH(1)"), error(FormulaError::Generic));
    EXPECT_EQ(eval("=PI(1)"), error(FormulaError::Generic));
    EXPECT_EQ(eval("=ABS()"), error(FormulaError::Generic));
    EXPECT_EQ(eval("=1+"), error(FormulaError::Generic));
}

class StatisticalFunctionsTest : public FormulaTestBase {
protected:
    void SetUp() override {
        FormulaTestBase::SetUp();
        const double data[] = {2, 4, 4, 4, 5, 5, 7, 9};
        for (int i = 0; i < 8; ++i) {
            put("A" + std::to_string(i + 1), CellValue(data[i]));
        }
    }
};

// 测试中位数、方差与标准差
TEST_F(StatisticalFunctionsTest, Dispersion) {
    EXPECT_DOUBLE_EQ(number("=MEDIAN(A1:A8)"), 4.5);
    EXPECT_DOUBLE_EQ(number("=MEDIAN(3, 1, 2)"), 2.0);
    EXPECT_DOUBLE_EQ(number("=STDEV(A1:A8)"), 2.0);
    EXPECT_DOUBLE_EQ(number("=STDEV.P(A1:A8)"), 2.0);
    EXPECT_DOUBLE_EQ(number("=VAR(A1:A8)"), 4.0);
    EXPECT_NEAR(number("=VAR.S(A1:A8)"), 32.0 / 7.0, 1e-12);
    EXPECT_NEAR(number("=STDEV.S(1, 2, 3, 4)"), 1.2909944487358056, 1e-12);
    EXPECT_EQ(eval("=STDEV.S(1)"), error(FormulaError::Generic));
}

// 测试百分位与排序取值
TEST_F(StatisticalFunctionsTest, Ranking) {
    EXPECT_DOUBLE_EQ(number("=PERCENTILE(A1:A8, 0)"), 2.0);
    EXPECT_DOUBLE_EQ(number("=PERCENTILE(A1:A8, 1)"), 9.0);
    EXPECT_DOUBLE_EQ(number("=PERCENTILE(A1:A8, 0.5)"), 4.5);
    EXPECT_EQ(eval("=PERCENTILE(A1:A8, 1.5)"), error(FormulaError::Generic));

    EXPECT_DOUBLE_EQ(number("=LARGE(A1:A8, 1)"), 9.0);
    EXPECT_DOUBLE_EQ(number("=LARGE(A1:A8, 1.2)"), 7.0);
    EXPECT_DOUBLE_EQ(number("=SMALL(A1:A8, 2)"), 4.0);
    EXPECT_EQ(eval("=SMALL(A1:A8, 9)"), error(FormulaError::Generic));
    EXPECT_EQ(eval("=LARGE(A1:A8, 1e20)"), error(FormulaError::Generic));
    EXPECT_EQ(eval("=SMALL(A1:A8, -1e20)"), error(FormulaError::Generic));
}

// 测试相关系数
TEST_F(StatisticalFunctionsTest, Correlation) {
    put("B1", CellValue(1.0));
    put("B2", CellValue(2.0));
    put("B3", CellValue(3.0));
    put("C1", CellValue(2.0));
    put("C2", CellValue(4.0));
    put("C3", CellValue(6.0));
    put("D1", CellValue(3.0));
    put("D2", CellValue(2.0));
    put("D3", CellValue(1.0));

    EXPECT_NEAR(number("=CORREL(B1:B3, C1:C3)"), 1.0, 1e-12);
    EXPECT_NEAR(number("=CORREL(B1:B3, D1:D3)"), -1.0, 1e-12);
    EXPECT_EQ(eval("=CORREL(B1:B3, C1:C2)"), error(FormulaError::NotAvailable));
    EXPECT_EQ(eval("=CORREL(B1, C1)"), error(FormulaError::Generic));
}
