#include "FormulaTestSupport.hpp"
#include "fingrid/xml/StateSerializer.hpp"
#include <cstdio>

using namespace fingrid::core;
using fingrid::xml::StateSerializer;

class StateSerializerTest : public FormulaTestBase {
protected:
    // 覆盖所有可序列化字段的工作簿
    void buildModel() {
        put("A1", CellValue("Revenue"));
        put("B1", CellValue(1250000.5));
        put("B1", CellValue(1300000.0));
        put("C1", CellValue(true));
        put("D1", CellValue("say \"hi\" & <bye>\nnext"));
        formula("B2", "=B1*0.2");
        formula("B3", "=1/0");
        ASSERT_TRUE(sheet->styleCell(at("A1"), {{"fontWeight", "bold"}, {"color", "#333"}}).hasValue());
        ASSERT_TRUE(sheet->setComment(at("B1"), "audited").hasValue());
        ASSERT_TRUE(sheet->setLink(at("A1"), "https://example.com/q?a=1&b=2").hasValue());
        ASSERT_TRUE(sheet->setSourceAnnotation(at("B1"), "10-K p.42").hasValue());

        ASSERT_TRUE(sheet->setFrozenPanes(2, 1).hasValue());
        ASSERT_TRUE(sheet->setRowHidden(4).hasValue());
        ASSERT_TRUE(sheet->setColumnHidden(6).hasValue());
        ASSERT_TRUE(sheet->setRowHeight(1, 24.5).hasValue());
        ASSERT_TRUE(sheet->setColumnWidth(1, 18.0).hasValue());
        ASSERT_TRUE(sheet->mergeRange(CellRange(at("E1"), at("F2"))).hasValue());
        ASSERT_TRUE(sheet->defineName("Revenue", CellRange(at("B1"))).hasValue());

        ConditionalFormat rule;
        rule.range = CellRange(at("B1"), at("B3"));
        rule.condition = ConditionKind::Between;
        rule.value = CellValue(100.0);
        rule.value2 = CellValue(500000.0);
        rule.style = {{"background", "yellow"}};
        ASSERT_TRUE(sheet->addConditionalFormat(rule).hasValue());

        auto second = workbook->createSheet("Cap Table");
        ASSERT_TRUE(second.hasValue());
        auto cap = workbook->getSheet(second.value());
        ASSERT_TRUE(cap->setFormula(at("A1"), "=Sheet1!B2+1").hasValue());
        ASSERT_TRUE(cap->write(at("A2"), CellValue(FormulaError::NotAvailable)).hasValue());
        ASSERT_TRUE(workbook->switchSheet(second.value()).hasValue());
    }
};

// 导出的 XML 再解析得到相同的状态
TEST_F(StateSerializerTest, RoundTrip) {
    buildModel();
    WorkbookState state = workbook->exportState();

    std::string xml = StateSerializer::toXML(state);
    EXPECT_NE(xml.find("<workbook version=\"1\""), std::string::npos);
    EXPECT_NE(xml.find("condition=\"between\""), std::string::npos);

    auto parsed = StateSerializer::fromXML(xml);
    ASSERT_TRUE(parsed.hasValue()) << parsed.error().fullMessage();
    EXPECT_EQ(parsed.value(), state);

    // 导入到新工作簿后公式继续可用
    auto restored = Workbook::create();
    ASSERT_TRUE(restored->importState(parsed.value()).hasValue());
    EXPECT_EQ(restored->getActiveSheet()->getName(), "Cap Table");
    EXPECT_EQ(restored->getSheet("Cap Table")->readValue(at("A1")), CellValue(260001.0));
    auto history = restored->getSheet("Sheet1")->read(at("B1"))->getHistory();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_TRUE(history[0].value.isEmpty());
    EXPECT_EQ(history[1].value, CellValue(1250000.5));
}

// 测试文件读写
TEST_F(StateSerializerTest, FileRoundTrip) {
    buildModel();
    WorkbookState state = workbook->exportState();
    const std::string path = ::testing::TempDir() + "fingrid_state.xml";
    ASSERT_TRUE(StateSerializer::saveToFile(state, path).hasValue());

    auto loaded = StateSerializer::loadFromFile(path);
    ASSERT_TRUE(loaded.hasValue());
    EXPECT_EQ(loaded.value(), state);
    std::remove(path.c_str());

    auto missing = StateSerializer::loadFromFile(path + ".missing");
    ASSERT_FALSE(missing.hasValue());
    EXPECT_EQ(missing.error().code, ErrorCode::FileNotFound);
}

// 结构错误分别报告
TEST_F(StateSerializerTest, RejectsMalformedDocuments) {
    auto broken = StateSerializer::fromXML("<workbook version=\"1\"");
    ASSERT_FALSE(broken.hasValue());
    EXPECT_EQ(broken.error().code, ErrorCode::XmlParseError);

    auto wrong_root = StateSerializer::fromXML("<sheets/>");
    ASSERT_FALSE(wrong_root.hasValue());
    EXPECT_EQ(wrong_root.error().code, ErrorCode::XmlMissingElement);

    auto newer = StateSerializer::fromXML("<workbook version=\"2\" activeSheet=\"1\"/>");
    ASSERT_FALSE(newer.hasValue());
    EXPECT_EQ(newer.error().code, ErrorCode::InvalidFormat);

    auto no_sheets = StateSerializer::fromXML("<workbook version=\"1\" activeSheet=\"1\"/>");
    ASSERT_FALSE(no_sheets.hasValue());
    EXPECT_EQ(no_sheets.error().code, ErrorCode::XmlMissingElement);

    auto missing_attr = StateSerializer::fromXML(
        "<workbook version=\"1\" activeSheet=\"1\"><sheet id=\"1\" name=\"S\" rows=\"10\" cols=\"5\" frozenRows=\"0\"/></workbook>");
    ASSERT_FALSE(missing_attr.hasValue());
    EXPECT_EQ(missing_attr.error().code, ErrorCode::XmlMissingElement);
}

// 单元格级错误带上位置上下文
TEST_F(StateSerializerTest, RejectsInvalidCells) {
    const std::string prefix =
        "<workbook version=\"1\" activeSheet=\"1\">"
        "<sheet id=\"1\" name=\"Model\" rows=\"100\" cols=\"26\" frozenRows=\"0\" frozenCols=\"0\">";
    const std::string suffix = "</sheet></workbook>";

    auto bad_number = StateSerializer::fromXML(prefix + "<cell ref=\"A1\" type=\"number\" kind=\"number\" v=\"abc\"/>" + suffix);
    ASSERT_FALSE(bad_number.hasValue());
    EXPECT_EQ(bad_number.error().code, ErrorCode::InvalidFormat);
    EXPECT_EQ(bad_number.error().context, "Model!A1");

    auto bad_kind = StateSerializer::fromXML(prefix + "<cell ref=\"A1\" type=\"text\" kind=\"blob\" v=\"x\"/>" + suffix);
    EXPECT_FALSE(bad_kind.hasValue());

    auto bad_type = StateSerializer::fromXML(prefix + "<cell ref=\"A1\" type=\"chart\" kind=\"empty\"/>" + suffix);
    EXPECT_FALSE(bad_type.hasValue());

    auto bad_ref = StateSerializer::fromXML(prefix + "<cell ref=\"1A\" type=\"text\" kind=\"empty\"/>" + suffix);
    EXPECT_FALSE(bad_ref.hasValue());

    auto duplicate = StateSerializer::fromXML(prefix +
                                              "<cell ref=\"A1\" type=\"text\" kind=\"text\" v=\"a\"/>"
                                              "<cell ref=\"A1\" type=\"text\" kind=\"text\" v=\"b\"/>" + suffix);
    EXPECT_FALSE(duplicate.hasValue());

    auto ok = StateSerializer::fromXML(prefix + "<cell ref=\"B2\" type=\"boolean\" kind=\"boolean\" v=\"TRUE\"/>" + suffix);
    ASSERT_TRUE(ok.hasValue());
    EXPECT_EQ(ok->sheets[0].cells.at(at("B2")).getValue(), CellValue(true));
}
