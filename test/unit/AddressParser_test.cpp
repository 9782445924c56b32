#include <gtest/gtest.h>
#include "fingrid/utils/AddressParser.hpp"

using namespace fingrid::core;
using fingrid::utils::AddressParser;

class AddressParserTest : public ::testing::Test {
};

// 测试列字母与列号互转
TEST_F(AddressParserTest, ColumnLetters) {
    EXPECT_EQ(AddressParser::toIndex("A").value(), 1);
    EXPECT_EQ(AddressParser::toIndex("Z").value(), 26);
    EXPECT_EQ(AddressParser::toIndex("AA").value(), 27);
    EXPECT_EQ(AddressParser::toIndex("xfd").value(), 16384);
    EXPECT_FALSE(AddressParser::toIndex("XFE").hasValue());
    EXPECT_FALSE(AddressParser::toIndex("").hasValue());

    EXPECT_EQ(AddressParser::toLetters(1), "A");
    EXPECT_EQ(AddressParser::toLetters(28), "AB");
    EXPECT_EQ(AddressParser::toLetters(702), "ZZ");
    EXPECT_EQ(AddressParser::toLetters(16384), "XFD");
}

// 测试单元格地址解析
TEST_F(AddressParserTest, ParseAddress) {
    auto a1 = AddressParser::parseAddress("A1");
    ASSERT_TRUE(a1.hasValue());
    EXPECT_EQ(a1.value(), CellAddress(1, 1));

    auto absolute = AddressParser::parseAddress("$C$12");
    ASSERT_TRUE(absolute.hasValue());
    EXPECT_EQ(absolute.value(), CellAddress(12, 3));

    EXPECT_FALSE(AddressParser::parseAddress("A0").hasValue());
    EXPECT_FALSE(AddressParser::parseAddress("1A").hasValue());
    EXPECT_FALSE(AddressParser::parseAddress("A1048577").hasValue());
    EXPECT_EQ(AddressParser::parseAddress("??").error().code, ErrorCode::InvalidCellReference);
}

// 测试范围解析与规范化
TEST_F(AddressParserTest, ParseRange) {
    auto range = AddressParser::parseRange("C3:A1");
    ASSERT_TRUE(range.hasValue());
    EXPECT_EQ(range.value().first, CellAddress(1, 1));
    EXPECT_EQ(range.value().last, CellAddress(3, 3));
    EXPECT_EQ(range.value().size(), 9u);

    auto single = AddressParser::parseRange("B2");
    ASSERT_TRUE(single.hasValue());
    EXPECT_TRUE(single.value().isSingleCell());

    EXPECT_EQ(AddressParser::parseRange("A1:").error().code, ErrorCode::InvalidRange);

    auto expanded = AddressParser::expandRange("A1:B2");
    ASSERT_TRUE(expanded.hasValue());
    ASSERT_EQ(expanded.value().size(), 4u);
    EXPECT_EQ(expanded.value()[1], CellAddress(1, 2));
    EXPECT_EQ(expanded.value()[2], CellAddress(2, 1));

    auto whole_sheet = AddressParser::expandRange("A1:XFD1048576");
    ASSERT_FALSE(whole_sheet.hasValue());
    EXPECT_EQ(whole_sheet.error().code, ErrorCode::InvalidRange);
    EXPECT_TRUE(AddressParser::expandRange("A1:A1000").hasValue());
}

// 测试工作表限定引用
TEST_F(AddressParserTest, QualifiedReferences) {
    auto plain = AddressParser::splitQualified("A1:B2");
    ASSERT_TRUE(plain.hasValue());
    EXPECT_FALSE(plain.value().hasSheet());
    EXPECT_EQ(plain.value().local, "A1:B2");

    auto qualified = AddressParser::splitQualified("Inputs!B3");
    ASSERT_TRUE(qualified.hasValue());
    EXPECT_EQ(qualified.value().first_sheet, "Inputs");
    EXPECT_EQ(qualified.value().local, "B3");

    auto quoted = AddressParser::splitQualified("'Cap Table''s'!A1");
    ASSERT_TRUE(quoted.hasValue());
    EXPECT_EQ(quoted.value().first_sheet, "Cap Table's");

    auto span = AddressParser::splitQualified("Q1:Q4!B2");
    ASSERT_TRUE(span.hasValue());
    EXPECT_TRUE(span.value().isSheetSpan());
    EXPECT_EQ(span.value().first_sheet, "Q1");
    EXPECT_EQ(span.value().last_sheet, "Q4");

    EXPECT_FALSE(AddressParser::splitQualified("!A1").hasValue());
    EXPECT_FALSE(AddressParser::splitQualified("'Open!A1").hasValue());
}

// 测试引用文本生成
TEST_F(AddressParserTest, Formatting) {
    EXPECT_EQ(AddressParser::toString(CellAddress(10, 27)), "AA10");
    EXPECT_EQ(AddressParser::toString(CellRange(CellAddress(1, 1), CellAddress(5, 2))), "A1:B5");
    EXPECT_EQ(AddressParser::toString(CellRange(CellAddress(4, 4))), "D4");

    EXPECT_EQ(AddressParser::qualify("Model", "A1"), "Model!A1");
    EXPECT_EQ(AddressParser::qualify("Cap Table", "A1"), "'Cap Table'!A1");
    EXPECT_EQ(AddressParser::qualify("", "A1"), "A1");

    EXPECT_TRUE(AddressParser::looksLikeAddress("$AB$12"));
    EXPECT_FALSE(AddressParser::looksLikeAddress("Revenue"));
    EXPECT_FALSE(AddressParser::looksLikeAddress("A"));
}
