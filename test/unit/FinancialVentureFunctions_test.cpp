#include "FormulaTestSupport.hpp"
#include <cmath>

using fingrid::core::CellValue;
using fingrid::core::FormulaError;

class FinancialFunctionsTest : public FormulaTestBase {
};

// 测试 IRR 使净现值归零
TEST_F(FinancialFunctionsTest, InternalRateOfReturn) {
    const double flows[] = {-100, 30, 30, 30, 30, 30};
    for (int i = 0; i < 6; ++i) {
        put("A" + std::to_string(i + 1), CellValue(flows[i]));
    }

    const double rate = number("=IRR(A1:A6)");
    double npv = 0.0;
    for (int t = 0; t < 6; ++t) {
        npv += flows[t] / std::pow(1.0 + rate, t);
    }
    EXPECT_NEAR(npv, 0.0, 1e-3);
    EXPECT_NEAR(rate, 0.1524, 1e-3);

    EXPECT_NEAR(number("=IRR(A1:A6, 0.3)"), rate, 1e-6);
    EXPECT_EQ(eval("=IRR(A1)"), error(FormulaError::Generic));
}

// 测试折现与年金
TEST_F(FinancialFunctionsTest, TimeValue) {
    EXPECT_NEAR(number("=NPV(0.1, 100, 100)"), 173.553719, 1e-6);
    EXPECT_NEAR(number("=PMT(0.01, 12, 1000)"), -88.8488, 1e-4);
    EXPECT_NEAR(number("=PMT(0, 10, 1000)"), -100.0, 1e-12);
    EXPECT_NEAR(number("=FV(0.05, 10, -100)"), 1257.789, 1e-3);
    EXPECT_NEAR(number("=PV(0.05, 10, -100)"), 772.173, 1e-3);
    EXPECT_NEAR(number("=NPER(0.01, PMT(0.01, 12, 1000), 1000)"), 12.0, 1e-9);
    EXPECT_NEAR(number("=RATE(12, PMT(0.01, 12, 1000), 1000)"), 0.01, 1e-6);

    EXPECT_NEAR(number("=IPMT(0.01, 1, 12, 1000)"), -10.0, 1e-9);
    EXPECT_NEAR(number("=IPMT(0.01, 5, 12, 1000) + PPMT(0.01, 5, 12, 1000)"),
                number("=PMT(0.01, 12, 1000)"), 1e-9);
    EXPECT_EQ(eval("=IPMT(0.01, 0, 12, 1000)"), error(FormulaError::Generic));
    EXPECT_EQ(eval("=PPMT(0.01, 13, 12, 1000)"), error(FormulaError::Generic));

    put("D1", CellValue(-100.0));
    put("D2", CellValue(60.0));
    put("D3", CellValue(60.0));
    EXPECT_NEAR(number("=MIRR(D1:D3, 0.1, 0.1)"), std::sqrt(1.26) - 1.0, 1e-12);
    EXPECT_EQ(eval("=MIRR(D2:D3, 0.1, 0.1)"), error(FormulaError::Generic));
}

// 测试利率换算与折旧
TEST_F(FinancialFunctionsTest, RatesAndDepreciation) {
    EXPECT_NEAR(number("=EFFECT(0.12, 12)"), 0.126825, 1e-6);
    EXPECT_NEAR(number("=NOMINAL(EFFECT(0.12, 12), 12)"), 0.12, 1e-9);
    EXPECT_EQ(eval("=EFFECT(0, 12)"), error(FormulaError::Generic));
    EXPECT_EQ(eval("=NOMINAL(0.1, 0)"), error(FormulaError::Generic));

    EXPECT_DOUBLE_EQ(number("=SLN(1000, 100, 9)"), 100.0);
    EXPECT_DOUBLE_EQ(number("=DDB(1000, 100, 5, 1)"), 400.0);
    EXPECT_DOUBLE_EQ(number("=DDB(1000, 100, 5, 2)"), 240.0);
    EXPECT_NEAR(number("=DB(1000, 100, 5, 1)"), 369.0, 1e-9);
    EXPECT_EQ(eval("=DDB(1000, 100, 5, 6)"), error(FormulaError::Generic));
}

// 测试投资回报指标
TEST_F(FinancialFunctionsTest, ReturnMetrics) {
    EXPECT_NEAR(number("=WACC(600, 400, 0.12, 0.06, 0.25)"), 0.09, 1e-12);
    EXPECT_NEAR(number("=CAGR(100, 200, 5)"), 0.148698, 1e-6);
    EXPECT_DOUBLE_EQ(number("=MOIC(250, 100)"), 2.5);
    EXPECT_DOUBLE_EQ(number("=DPI(80, 100)"), 0.8);
    EXPECT_DOUBLE_EQ(number("=TVPI(50, 150, 100)"), 2.0);
    EXPECT_EQ(eval("=MOIC(250, 0)"), error(FormulaError::Generic));
}

// 测试按日期的现金流
TEST_F(FinancialFunctionsTest, DatedCashFlows) {
    put("A1", CellValue(-1000.0));
    put("A2", CellValue(500.0));
    put("A3", CellValue(700.0));
    put("B1", CellValue("2024-01-01"));
    put("B2", CellValue("2024-07-01"));
    put("B3", CellValue("2025-01-01"));

    const double rate = number("=XIRR(A1:A3, B1:B3)");
    EXPECT_GT(rate, 0.0);
    put("C1", CellValue(rate));
    EXPECT_NEAR(number("=XNPV(C1, A1:A3, B1:B3)"), 0.0, 1e-3);

    EXPECT_NEAR(number("=XNPV(0, A1:A3, B1:B3)"), 200.0, 1e-9);
    EXPECT_EQ(eval("=XNPV(0.1, A1:A3, B1:B2)"), error(FormulaError::Value));
}

class VentureFunctionsTest : public FormulaTestBase {
};

// 测试股权结构函数
TEST_F(VentureFunctionsTest, CapTable) {
    EXPECT_DOUBLE_EQ(number("=DILUTION(1000, 250, 1000)"), 0.2);
    EXPECT_DOUBLE_EQ(number("=OWNERSHIP(25, 100)"), 0.25);
    EXPECT_DOUBLE_EQ(number("=PRICEPERSHARE(1000000, 400000)"), 2.5);
    EXPECT_DOUBLE_EQ(number("=OPTIONPOOL(0.1, 50)"), 5.0);
}

// 测试清算优先与参与分配
TEST_F(VentureFunctionsTest, Liquidation) {
    EXPECT_DOUBLE_EQ(number("=LIQUIDPREF(10, 2)"), 20.0);
    EXPECT_DOUBLE_EQ(number("=LIQUIDPREF(10, 2, TRUE)"), 20.0);
    EXPECT_DOUBLE_EQ(number("=WATERFALL(100, 20, 60, 100)"), 48.0);
    EXPECT_DOUBLE_EQ(number("=WATERFALL(10, 20, 60, 100)"), 0.0);

    EXPECT_DOUBLE_EQ(number("=PARTICIPATING(100, 10, 1, 0.2)"), 28.0);
    EXPECT_DOUBLE_EQ(number("=PARTICIPATING(100, 10, 1, 0.2, 20)"), 20.0);
    EXPECT_DOUBLE_EQ(number("=PARTICIPATING(100, 10, 1, 0.2, \"uncapped\")"), 28.0);
    EXPECT_DOUBLE_EQ(number("=PARTICIPATING(5, 10, 1, 0.2)"), 5.0);

    EXPECT_DOUBLE_EQ(number("=DOWNROUND(100, 10, 2)"), 20.0);
    EXPECT_DOUBLE_EQ(number("=DOWNROUND(100, 10, 2, TRUE)"), 36.0);
    EXPECT_DOUBLE_EQ(number("=DOWNROUND(100, 10, 2, TRUE, 0.075)"), 26.0);
    EXPECT_DOUBLE_EQ(number("=DOWNROUND(15, 10, 2)"), 15.0);

    EXPECT_DOUBLE_EQ(number("=IPORATCHET(100, 110)"), 120.0);
    EXPECT_DOUBLE_EQ(number("=IPORATCHET(100, 150)"), 150.0);
    EXPECT_NEAR(number("=CUMULDIV(100, 0.08, 2)"), 116.64, 1e-9);
}

// 测试基金分成
TEST_F(VentureFunctionsTest, FundEconomics) {
    EXPECT_NEAR(number("=CATCHUP(150, 100, 0.2)"), 10.0, 1e-12);
    EXPECT_DOUBLE_EQ(number("=CARRIEDINT(80, 100, 0.2)"), 0.0);
    EXPECT_NEAR(number("=CARRIEDINT(300, 100, 0.2)"), 40.0, 1e-12);
}

// 测试情景与敏感性分析
TEST_F(VentureFunctionsTest, Scenarios) {
    EXPECT_DOUBLE_EQ(number("=SCENARIO(100, 150, 50, 0.5, 0.25, 0.25)"), 100.0);
    EXPECT_EQ(eval("=SCENARIO(100, 150, 50, 0.5, 0.5)"), error(FormulaError::Value));

    put("A1", CellValue(0.5));
    put("A2", CellValue(0.25));
    put("A3", CellValue(0.25));
    EXPECT_DOUBLE_EQ(number("=SCENARIO(100, 150, 50, A1:A3)"), 100.0);

    EXPECT_DOUBLE_EQ(number("=SENSITIVITY(100, 0.1, 2)"), 120.0);
    EXPECT_DOUBLE_EQ(number("=BREAKEVEN(1000, 50)"), 20.0);
    EXPECT_DOUBLE_EQ(number("=BREAKEVEN(1000, 50, 0)"), 20.0);
    EXPECT_DOUBLE_EQ(number("=BREAKEVEN(1000, 100, 4)"), 40.0);
}
