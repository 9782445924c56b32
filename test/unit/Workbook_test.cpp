#include "FormulaTestSupport.hpp"
#include "fingrid/core/WorksheetManager.hpp"

using namespace fingrid::core;

class WorkbookTest : public FormulaTestBase {
};

// 新工作簿带一个默认工作表
TEST_F(WorkbookTest, DefaultSheet) {
    EXPECT_EQ(workbook->getSheetCount(), 1u);
    EXPECT_EQ(sheet->getName(), "Sheet1");
    EXPECT_EQ(workbook->getActiveSheetId(), sheet->getSheetId());
    EXPECT_FALSE(workbook->canUndo());
    EXPECT_FALSE(workbook->canRedo());
}

// 测试新建与自动命名
TEST_F(WorkbookTest, CreateSheets) {
    auto second = workbook->createSheet();
    ASSERT_TRUE(second.hasValue());
    EXPECT_EQ(workbook->getSheet(second.value())->getName(), "Sheet2");

    auto named = workbook->createSheet("Cap Table");
    ASSERT_TRUE(named.hasValue());
    EXPECT_NE(named.value(), second.value());

    std::vector<std::string> expected = {"Sheet1", "Sheet2", "Cap Table"};
    EXPECT_EQ(workbook->getSheetNames(), expected);

    // 名称不区分大小写
    auto duplicate = workbook->createSheet("cap table");
    ASSERT_FALSE(duplicate.hasValue());
    EXPECT_EQ(duplicate.error().code, ErrorCode::DuplicateWorksheet);
    EXPECT_EQ(workbook->getSheet("CAP TABLE")->getSheetId(), named.value());

    for (const char* bad : {"Q1/Q2", "a:b", "[x]", "what?", "star*", "back\\slash"}) {
        auto result = workbook->createSheet(bad);
        ASSERT_FALSE(result.hasValue()) << bad;
        EXPECT_EQ(result.error().code, ErrorCode::InvalidWorksheet) << bad;
    }
    EXPECT_FALSE(workbook->createSheet(std::string(32, 'x')).hasValue());
    EXPECT_TRUE(workbook->createSheet(std::string(31, 'x')).hasValue());
}

// 测试工作表数量上限
TEST_F(WorkbookTest, SheetLimit) {
    WorkbookOptions options;
    options.max_sheets = 2;
    auto small = Workbook::create(options);
    ASSERT_TRUE(small->createSheet().hasValue());

    auto third = small->createSheet();
    ASSERT_FALSE(third.hasValue());
    EXPECT_EQ(third.error().code, ErrorCode::WorksheetLimitReached);

    auto copy = small->copySheet(small->getActiveSheetId());
    ASSERT_FALSE(copy.hasValue());
    EXPECT_EQ(copy.error().code, ErrorCode::WorksheetLimitReached);
}

// 测试重命名
TEST_F(WorkbookTest, RenameSheet) {
    auto id = workbook->createSheet("Inputs");
    ASSERT_TRUE(id.hasValue());

    ASSERT_TRUE(workbook->renameSheet(id.value(), "Assumptions").hasValue());
    EXPECT_EQ(workbook->getSheet("Inputs"), nullptr);
    EXPECT_EQ(workbook->getSheet("Assumptions")->getSheetId(), id.value());

    // 只改大小写不算重名
    EXPECT_TRUE(workbook->renameSheet(id.value(), "ASSUMPTIONS").hasValue());

    auto taken = workbook->renameSheet(id.value(), "sheet1");
    ASSERT_FALSE(taken.hasValue());
    EXPECT_EQ(taken.error().code, ErrorCode::DuplicateWorksheet);

    EXPECT_FALSE(workbook->renameSheet(id.value(), "").hasValue());
    EXPECT_FALSE(workbook->renameSheet(999, "Other").hasValue());
}

// 测试复制工作表
TEST_F(WorkbookTest, CopySheet) {
    put("A1", CellValue(10.0));
    formula("A2", "=A1*3");
    ASSERT_TRUE(sheet->defineName("Base", CellRange(at("A1"))).hasValue());
    ASSERT_TRUE(sheet->setColumnWidth(1, 20.0).hasValue());

    auto copy_id = workbook->copySheet(sheet->getSheetId());
    ASSERT_TRUE(copy_id.hasValue());
    auto copy = workbook->getSheet(copy_id.value());
    EXPECT_EQ(copy->getName(), "Sheet1 (2)");
    EXPECT_EQ(copy->readValue(at("A2")), CellValue(30.0));
    EXPECT_TRUE(copy->findName("Base").has_value());
    EXPECT_DOUBLE_EQ(copy->getColumnWidth(1).value_or(0.0), 20.0);

    // 副本与原表互不影响
    ASSERT_TRUE(copy->write(at("A1"), CellValue(1.0)).hasValue());
    EXPECT_EQ(copy->readValue(at("A2")), CellValue(3.0));
    EXPECT_EQ(value("A2"), CellValue(30.0));

    auto again = workbook->copySheet(sheet->getSheetId());
    ASSERT_TRUE(again.hasValue());
    EXPECT_EQ(workbook->getSheet(again.value())->getName(), "Sheet1 (3)");

    EXPECT_FALSE(workbook->copySheet(999).hasValue());
}

// 测试删除工作表与活动工作表的移动
TEST_F(WorkbookTest, DeleteSheet) {
    auto last = workbook->deleteSheet(sheet->getSheetId());
    ASSERT_FALSE(last.hasValue());
    EXPECT_EQ(last.error().code, ErrorCode::LastWorksheet);

    const int first = sheet->getSheetId();
    const int second = workbook->createSheet("B").value();
    const int third = workbook->createSheet("C").value();

    // 删除活动的中间工作表，活动指针移到同位置的下一个
    ASSERT_TRUE(workbook->switchSheet(second).hasValue());
    ASSERT_TRUE(workbook->deleteSheet(second).hasValue());
    EXPECT_EQ(workbook->getActiveSheetId(), third);

    // 删除末尾的活动工作表，活动指针移到前一个
    ASSERT_TRUE(workbook->deleteSheet(third).hasValue());
    EXPECT_EQ(workbook->getActiveSheetId(), first);

    // 删除非活动工作表不影响活动指针
    const int fourth = workbook->createSheet("D").value();
    ASSERT_TRUE(workbook->switchSheet("d").hasValue());
    ASSERT_TRUE(workbook->deleteSheet(first).hasValue());
    EXPECT_EQ(workbook->getActiveSheetId(), fourth);
    EXPECT_EQ(workbook->getSheetCount(), 1u);

    auto missing = workbook->deleteSheet(first);
    ASSERT_FALSE(missing.hasValue());
    EXPECT_EQ(missing.error().code, ErrorCode::InvalidWorksheet);
}

// 测试切换活动工作表
TEST_F(WorkbookTest, SwitchSheet) {
    const int id = workbook->createSheet("Model").value();
    EXPECT_EQ(workbook->getActiveSheetId(), sheet->getSheetId());

    ASSERT_TRUE(workbook->switchSheet("MODEL").hasValue());
    EXPECT_EQ(workbook->getActiveSheetId(), id);
    ASSERT_TRUE(workbook->switchSheet(sheet->getSheetId()).hasValue());
    EXPECT_EQ(workbook->getActiveSheet()->getName(), "Sheet1");

    EXPECT_FALSE(workbook->switchSheet("Missing").hasValue());
    EXPECT_FALSE(workbook->switchSheet(42).hasValue());
}

// 测试工作表名称校验
TEST_F(WorkbookTest, NameRules) {
    EXPECT_TRUE(WorksheetManager::validateName("FY2024 Plan").hasValue());
    EXPECT_TRUE(WorksheetManager::validateName("Cap Table's").hasValue());
    EXPECT_FALSE(WorksheetManager::validateName("").hasValue());
    EXPECT_FALSE(WorksheetManager::validateName("a/b").hasValue());
}

// 测试状态导出与导入
TEST_F(WorkbookTest, StateRoundTrip) {
    put("A1", CellValue(2.0));
    formula("A2", "=A1^2");
    const int model = workbook->createSheet("Model").value();
    ASSERT_TRUE(workbook->getSheet(model)->setFormula(at("B1"), "=Sheet1!A2+1").hasValue());
    ASSERT_TRUE(workbook->switchSheet(model).hasValue());

    WorkbookState state = workbook->exportState();
    ASSERT_EQ(state.sheets.size(), 2u);
    EXPECT_EQ(state.active_sheet_id, model);

    auto restored = Workbook::create();
    ASSERT_TRUE(restored->importState(state).hasValue());
    EXPECT_EQ(restored->getSheetCount(), 2u);
    EXPECT_EQ(restored->getActiveSheetId(), model);
    EXPECT_EQ(restored->getSheet("Model")->readValue(at("B1")), CellValue(5.0));
    EXPECT_FALSE(restored->canUndo());

    // 导入后新建的工作表不与已有 ID 冲突
    auto next = restored->createSheet();
    ASSERT_TRUE(next.hasValue());
    EXPECT_GT(next.value(), model);

    EXPECT_EQ(restored->exportState().sheets[0].cells, state.sheets[0].cells);
}

// 无效快照被整体拒绝，工作簿保持不变
TEST_F(WorkbookTest, ImportRejectsInvalidState) {
    put("A1", CellValue(1.0));

    WorkbookState empty;
    auto no_sheets = workbook->importState(empty);
    ASSERT_FALSE(no_sheets.hasValue());
    EXPECT_EQ(no_sheets.error().code, ErrorCode::InvalidWorkbook);

    WorkbookState state = workbook->exportState();
    state.sheets.push_back(state.sheets.front());
    auto duplicate = workbook->importState(state);
    ASSERT_FALSE(duplicate.hasValue());
    EXPECT_EQ(duplicate.error().code, ErrorCode::InvalidWorkbook);

    WorkbookState bad_active = workbook->exportState();
    bad_active.active_sheet_id = 77;
    EXPECT_FALSE(workbook->importState(bad_active).hasValue());

    WorkbookState bad_cell = workbook->exportState();
    bad_cell.sheets[0].cells[CellAddress(0, 3)] = Cell(CellValue(1.0));
    auto out_of_range = workbook->importState(bad_cell);
    ASSERT_FALSE(out_of_range.hasValue());
    EXPECT_EQ(out_of_range.error().code, ErrorCode::InvalidCellReference);

    EXPECT_EQ(workbook->getSheetCount(), 1u);
    EXPECT_EQ(value("A1"), CellValue(1.0));
}
