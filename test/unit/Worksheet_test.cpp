#include "FormulaTestSupport.hpp"

using namespace fingrid::core;

class WorksheetTest : public FormulaTestBase {
};

// 测试字面量写入与类型推断
TEST_F(WorksheetTest, WriteLiterals) {
    put("A1", CellValue("$1,250"));
    put("A2", CellValue(42.0));
    put("A3", CellValue("https://example.com"));

    EXPECT_EQ(sheet->read(at("A1"))->getType(), CellType::Currency);
    EXPECT_EQ(sheet->read(at("A2"))->getType(), CellType::Number);
    EXPECT_EQ(sheet->read(at("A3"))->getType(), CellType::Link);
    EXPECT_EQ(sheet->read(at("Z9")), nullptr);
    EXPECT_TRUE(sheet->readValue(at("Z9")).isEmpty());

    WriteOptions options;
    options.link = "https://example.com/deck";
    options.source = "Board deck p.4";
    ASSERT_TRUE(sheet->write(at("B1"), CellValue("Deck"), options).hasValue());
    const Cell* cell = sheet->read(at("B1"));
    ASSERT_NE(cell, nullptr);
    EXPECT_EQ(cell->getType(), CellType::Link);
    EXPECT_EQ(cell->getLink(), "https://example.com/deck");
    EXPECT_EQ(cell->getSourceAnnotation(), "Board deck p.4");

    auto bad = sheet->write(CellAddress(0, 1), CellValue(1.0));
    ASSERT_FALSE(bad.hasValue());
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidCellReference);
    EXPECT_FALSE(sheet->write(CellAddress(1, Constants::kMaxColumns + 1), CellValue(1.0)).hasValue());
}

// 每次写入记录写入前的值
TEST_F(WorksheetTest, History) {
    put("A1", CellValue(1.0));
    put("A1", CellValue(2.0));
    formula("A1", "=3");

    const auto& history = sheet->read(at("A1"))->getHistory();
    ASSERT_EQ(history.size(), 3u);
    EXPECT_TRUE(history[0].value.isEmpty());
    EXPECT_EQ(history[1].value, CellValue(1.0));
    EXPECT_EQ(history[2].value, CellValue(2.0));
    EXPECT_FALSE(history[2].timestamp.empty());
}

// 测试编辑器式输入
TEST_F(WorksheetTest, EnterText) {
    ASSERT_TRUE(sheet->enterText(at("A1"), "42").hasValue());
    ASSERT_TRUE(sheet->enterText(at("A2"), "true").hasValue());
    ASSERT_TRUE(sheet->enterText(at("A3"), "=A1/2").hasValue());
    ASSERT_TRUE(sheet->enterText(at("A4"), "Series A").hasValue());

    EXPECT_EQ(value("A1"), CellValue(42.0));
    EXPECT_EQ(value("A2"), CellValue(true));
    EXPECT_EQ(value("A3"), CellValue(21.0));
    EXPECT_TRUE(sheet->read(at("A3"))->hasFormula());
    EXPECT_EQ(value("A4"), CellValue("Series A"));

    // 文本两端的空白被去掉
    ASSERT_TRUE(sheet->enterText(at("A5"), "  Series B  ").hasValue());
    ASSERT_TRUE(sheet->enterText(at("A6"), "\t12 \n").hasValue());
    EXPECT_EQ(value("A5"), CellValue("Series B"));
    EXPECT_EQ(value("A6"), CellValue(12.0));
}

// 测试批量写入与清除
TEST_F(WorksheetTest, WriteAndClearRange) {
    ValueMatrix matrix = {
        {CellValue(1.0), CellValue("=A1*2"), CellValue(99.0)},
        {CellValue("x")},
    };
    ASSERT_TRUE(sheet->writeRange(at("A1"), at("B2"), matrix).hasValue());

    EXPECT_EQ(value("A1"), CellValue(1.0));
    EXPECT_EQ(value("B1"), CellValue(2.0));
    EXPECT_EQ(value("A2"), CellValue("x"));
    // 超出范围的列与矩阵未覆盖的位置都不写入
    EXPECT_FALSE(sheet->hasCellAt(at("C1")));
    EXPECT_FALSE(sheet->hasCellAt(at("B2")));
    EXPECT_EQ(sheet->getCellCount(), 3u);

    auto used = sheet->getUsedRange();
    EXPECT_EQ(used.first, 2);
    EXPECT_EQ(used.second, 2);

    ASSERT_TRUE(sheet->clearRange(at("A2"), at("A1")).hasValue());
    EXPECT_FALSE(sheet->hasCellAt(at("A1")));
    EXPECT_EQ(value("B1"), CellValue(0.0));
    EXPECT_EQ(sheet->getCellCount(), 1u);
}

// 测试样式、批注与链接
TEST_F(WorksheetTest, StylesAndAnnotations) {
    ASSERT_TRUE(sheet->styleCell(at("A1"), {{"fontWeight", "bold"}}).hasValue());
    ASSERT_TRUE(sheet->styleRange(CellRange(at("A1"), at("B2")), {{"color", "blue"}}).hasValue());
    EXPECT_EQ(sheet->getCellCount(), 4u);

    const CellStyle& style = sheet->read(at("A1"))->getStyle();
    EXPECT_EQ(style.at("fontWeight"), "bold");
    EXPECT_EQ(style.at("color"), "blue");

    ASSERT_TRUE(sheet->setComment(at("C3"), "check with CFO").hasValue());
    ASSERT_TRUE(sheet->setLink(at("C4"), "https://example.com").hasValue());
    ASSERT_TRUE(sheet->setSourceAnnotation(at("C5"), "S-1 filing").hasValue());
    EXPECT_EQ(sheet->read(at("C3"))->getComment(), "check with CFO");
    EXPECT_EQ(sheet->read(at("C4"))->getLink(), "https://example.com");
    EXPECT_EQ(sheet->read(at("C5"))->getSourceAnnotation(), "S-1 filing");
    EXPECT_TRUE(sheet->readValue(at("C3")).isEmpty());
}

// 测试工作表元数据
TEST_F(WorksheetTest, Metadata) {
    EXPECT_EQ(sheet->getRowCount(), Constants::kDefaultRows);
    EXPECT_EQ(sheet->getColumnCount(), Constants::kDefaultColumns);
    EXPECT_EQ(sheet->getMetadata().frozen_rows, 1);

    put("AB150", CellValue(1.0));
    EXPECT_EQ(sheet->getRowCount(), 150);
    EXPECT_EQ(sheet->getColumnCount(), 28);

    ASSERT_TRUE(sheet->setDimensions(500, 40).hasValue());
    EXPECT_FALSE(sheet->setDimensions(0, 40).hasValue());
    ASSERT_TRUE(sheet->setFrozenPanes(2, 3).hasValue());
    EXPECT_FALSE(sheet->setFrozenPanes(-1, 0).hasValue());
    EXPECT_EQ(sheet->getMetadata().frozen_columns, 3);

    ASSERT_TRUE(sheet->setRowHidden(5).hasValue());
    ASSERT_TRUE(sheet->setColumnHidden(2).hasValue());
    EXPECT_TRUE(sheet->isRowHidden(5));
    EXPECT_TRUE(sheet->isColumnHidden(2));
    ASSERT_TRUE(sheet->setRowHidden(5, false).hasValue());
    EXPECT_FALSE(sheet->isRowHidden(5));

    ASSERT_TRUE(sheet->setRowHeight(1, 24.0).hasValue());
    ASSERT_TRUE(sheet->setColumnWidth(1, 18.5).hasValue());
    EXPECT_DOUBLE_EQ(sheet->getRowHeight(1).value_or(0.0), 24.0);
    EXPECT_DOUBLE_EQ(sheet->getColumnWidth(1).value_or(0.0), 18.5);
    EXPECT_FALSE(sheet->getRowHeight(2).has_value());

    auto bad_width = sheet->setColumnWidth(1, 0.0);
    ASSERT_FALSE(bad_width.hasValue());
    EXPECT_EQ(bad_width.error().code, ErrorCode::InvalidArgument);
}

// 测试合并区域
TEST_F(WorksheetTest, MergedRanges) {
    ASSERT_TRUE(sheet->mergeRange(CellRange(at("A1"), at("C1"))).hasValue());

    auto single = sheet->mergeRange(CellRange(at("D4")));
    ASSERT_FALSE(single.hasValue());
    EXPECT_EQ(single.error().code, ErrorCode::InvalidRange);

    auto overlap = sheet->mergeRange(CellRange(at("B1"), at("B3")));
    ASSERT_FALSE(overlap.hasValue());
    EXPECT_EQ(overlap.error().code, ErrorCode::InvalidRange);

    ASSERT_TRUE(sheet->unmergeRange(CellRange(at("A1"), at("C1"))).hasValue());
    EXPECT_TRUE(sheet->getMetadata().merged_ranges.empty());
    EXPECT_FALSE(sheet->unmergeRange(CellRange(at("A1"), at("C1"))).hasValue());
}

// 测试命名范围的校验
TEST_F(WorksheetTest, NameValidation) {
    EXPECT_TRUE(Worksheet::isValidName("Revenue"));
    EXPECT_TRUE(Worksheet::isValidName("_tax.rate2"));
    EXPECT_FALSE(Worksheet::isValidName("A1"));
    EXPECT_FALSE(Worksheet::isValidName("TRUE"));
    EXPECT_FALSE(Worksheet::isValidName("2020Revenue"));
    EXPECT_FALSE(Worksheet::isValidName("net revenue"));
    EXPECT_FALSE(Worksheet::isValidName(""));

    ASSERT_TRUE(sheet->defineName("Revenue", CellRange(at("B2"), at("B5"))).hasValue());
    auto found = sheet->findName("REVENUE");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->name, "Revenue");
    EXPECT_EQ(found->range, CellRange(at("B2"), at("B5")));

    auto bad = sheet->defineName("B2", CellRange(at("A1")));
    ASSERT_FALSE(bad.hasValue());
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidArgument);
    EXPECT_FALSE(sheet->removeName("Missing").hasValue());
}

class ConditionalFormatTest : public FormulaTestBase {
protected:
    ConditionalFormat rule(const std::string& range, ConditionKind kind, const CellValue& value,
                           const CellStyle& style, const CellValue& value2 = CellValue()) {
        ConditionalFormat format;
        format.range = fingrid::utils::AddressParser::parseRange(range).value();
        format.condition = kind;
        format.value = value;
        format.value2 = value2;
        format.style = style;
        return format;
    }

    bool highlighted(const std::string& ref) const {
        return sheet->getFormatOverlay().count(at(ref)) > 0;
    }
};

// 测试比较类条件
TEST_F(ConditionalFormatTest, Comparisons) {
    put("A1", CellValue(5.0));
    put("A2", CellValue(15.0));
    put("A3", CellValue("15"));
    put("A4", CellValue("n/a"));

    auto id = sheet->addConditionalFormat(rule("A1:A5", ConditionKind::Greater, CellValue(10.0),
                                               {{"background", "green"}}));
    ASSERT_TRUE(id.hasValue());
    EXPECT_EQ(id.value(), "cf1");

    EXPECT_FALSE(highlighted("A1"));
    EXPECT_TRUE(highlighted("A2"));
    EXPECT_TRUE(highlighted("A3"));
    EXPECT_FALSE(highlighted("A4"));
    EXPECT_FALSE(highlighted("A5"));

    // 写入后规则结果随之更新
    put("A1", CellValue(50.0));
    EXPECT_TRUE(highlighted("A1"));

    ASSERT_TRUE(sheet->removeConditionalFormat(id.value()).hasValue());
    EXPECT_TRUE(sheet->getFormatOverlay().empty());
    EXPECT_FALSE(sheet->removeConditionalFormat(id.value()).hasValue());
}

// 测试区间、包含与相等
TEST_F(ConditionalFormatTest, BetweenContainsEquals) {
    put("B1", CellValue(3.0));
    put("B2", CellValue(7.0));
    put("B3", CellValue("Series A Preferred"));
    put("B4", CellValue("series a"));

    ASSERT_TRUE(sheet->addConditionalFormat(rule("B1:B2", ConditionKind::Between, CellValue(10.0),
                                                 {{"color", "red"}}, CellValue(5.0))).hasValue());
    ASSERT_TRUE(sheet->addConditionalFormat(rule("B3:B4", ConditionKind::Contains, CellValue("Series"),
                                                 {{"fontWeight", "bold"}})).hasValue());
    ASSERT_TRUE(sheet->addConditionalFormat(rule("B1:B2", ConditionKind::Equals, CellValue("3"),
                                                 {{"color", "blue"}})).hasValue());

    EXPECT_EQ(sheet->effectiveStyle(at("B1")).at("color"), "blue");
    EXPECT_EQ(sheet->effectiveStyle(at("B2")).at("color"), "red");
    EXPECT_TRUE(highlighted("B3"));
    EXPECT_FALSE(highlighted("B4"));
}

// 测试重复值与唯一值
TEST_F(ConditionalFormatTest, DuplicateAndUnique) {
    put("C1", CellValue(1.0));
    put("C2", CellValue(2.0));
    put("C3", CellValue(1.0));
    put("C4", CellValue("1"));

    ASSERT_TRUE(sheet->addConditionalFormat(rule("C1:C4", ConditionKind::Duplicate, CellValue(),
                                                 {{"background", "yellow"}})).hasValue());
    ASSERT_TRUE(sheet->addConditionalFormat(rule("C1:C4", ConditionKind::Unique, CellValue(),
                                                 {{"border", "thin"}})).hasValue());

    EXPECT_EQ(sheet->effectiveStyle(at("C1")).count("background"), 1u);
    EXPECT_EQ(sheet->effectiveStyle(at("C3")).count("background"), 1u);
    EXPECT_EQ(sheet->effectiveStyle(at("C2")).count("border"), 1u);
    EXPECT_EQ(sheet->effectiveStyle(at("C4")).count("border"), 1u);
    EXPECT_EQ(sheet->effectiveStyle(at("C2")).count("background"), 0u);
}

// 单元格样式与条件格式叠加，后者优先
TEST_F(ConditionalFormatTest, EffectiveStyleAndIds) {
    put("D1", CellValue(100.0));
    ASSERT_TRUE(sheet->styleCell(at("D1"), {{"color", "black"}, {"fontSize", "11"}}).hasValue());

    ConditionalFormat custom = rule("D1", ConditionKind::Equals, CellValue(100.0), {{"color", "red"}});
    custom.id = "big-round";
    ASSERT_TRUE(sheet->addConditionalFormat(custom).hasValue());

    CellStyle style = sheet->effectiveStyle(at("D1"));
    EXPECT_EQ(style.at("color"), "red");
    EXPECT_EQ(style.at("fontSize"), "11");
    EXPECT_EQ(sheet->read(at("D1"))->getStyle().at("color"), "black");

    auto duplicate = sheet->addConditionalFormat(custom);
    ASSERT_FALSE(duplicate.hasValue());
    EXPECT_EQ(duplicate.error().code, ErrorCode::InvalidArgument);

    EXPECT_FALSE(sheet->addConditionalFormat(rule("A1", ConditionKind::Less, CellValue(0.0), {})).value().empty());
    EXPECT_EQ(sheet->getConditionalFormats().size(), 2u);
}
