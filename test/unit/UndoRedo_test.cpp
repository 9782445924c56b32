#include "FormulaTestSupport.hpp"
#include "fingrid/tracking/UndoRedoManager.hpp"

using namespace fingrid::core;
using fingrid::tracking::UndoRedoManager;
using fingrid::tracking::WorkbookSnapshot;

class UndoRedoTest : public FormulaTestBase {
};

// 撤销与重做在相邻状态间切换
TEST_F(UndoRedoTest, StepsThroughStates) {
    put("A1", CellValue(1.0));
    put("A1", CellValue(2.0));
    put("A1", CellValue(3.0));

    ASSERT_TRUE(workbook->undo());
    EXPECT_EQ(value("A1"), CellValue(2.0));
    ASSERT_TRUE(workbook->undo());
    EXPECT_EQ(value("A1"), CellValue(1.0));
    ASSERT_TRUE(workbook->undo());
    EXPECT_FALSE(sheet->hasCellAt(at("A1")));
    EXPECT_FALSE(workbook->undo());

    ASSERT_TRUE(workbook->redo());
    EXPECT_EQ(value("A1"), CellValue(1.0));
    ASSERT_TRUE(workbook->redo());
    ASSERT_TRUE(workbook->redo());
    EXPECT_EQ(value("A1"), CellValue(3.0));
    EXPECT_FALSE(workbook->redo());
}

// 新的写入清空重做记录
TEST_F(UndoRedoTest, NewWriteClearsRedo) {
    put("A1", CellValue(1.0));
    put("A1", CellValue(2.0));
    ASSERT_TRUE(workbook->undo());
    EXPECT_TRUE(workbook->canRedo());

    put("B1", CellValue(9.0));
    EXPECT_FALSE(workbook->canRedo());
    EXPECT_EQ(value("A1"), CellValue(1.0));
    EXPECT_EQ(value("B1"), CellValue(9.0));
}

// 撤销后公式结果随之恢复
TEST_F(UndoRedoTest, RestoresComputedValues) {
    put("A1", CellValue(10.0));
    formula("B1", "=A1*2");
    put("A1", CellValue(50.0));
    EXPECT_EQ(value("B1"), CellValue(100.0));

    ASSERT_TRUE(workbook->undo());
    EXPECT_EQ(value("A1"), CellValue(10.0));
    EXPECT_EQ(value("B1"), CellValue(20.0));

    ASSERT_TRUE(workbook->undo());
    EXPECT_FALSE(sheet->hasCellAt(at("B1")));
}

// 跨工作表的写入按提交顺序撤销
TEST_F(UndoRedoTest, MultipleSheets) {
    const int other_id = workbook->createSheet("Other").value();
    auto other = workbook->getSheet(other_id);

    put("A1", CellValue(1.0));
    ASSERT_TRUE(other->write(at("A1"), CellValue(2.0)).hasValue());
    formula("A2", "=Other!A1+A1");
    EXPECT_EQ(value("A2"), CellValue(3.0));

    ASSERT_TRUE(workbook->undo());
    EXPECT_FALSE(sheet->hasCellAt(at("A2")));
    ASSERT_TRUE(workbook->undo());
    EXPECT_FALSE(other->hasCellAt(at("A1")));
    EXPECT_EQ(value("A1"), CellValue(1.0));
}

// 样式与批注可撤销，元数据变更不进入历史
TEST_F(UndoRedoTest, ScopeOfHistory) {
    ASSERT_TRUE(sheet->styleCell(at("A1"), {{"color", "red"}}).hasValue());
    ASSERT_TRUE(sheet->setComment(at("A1"), "note").hasValue());
    ASSERT_TRUE(workbook->undo());
    EXPECT_TRUE(sheet->read(at("A1"))->getComment().empty());
    EXPECT_EQ(sheet->read(at("A1"))->getStyle().at("color"), "red");

    workbook->resetHistory();
    ASSERT_TRUE(sheet->setColumnWidth(2, 30.0).hasValue());
    ASSERT_TRUE(sheet->setFrozenPanes(0, 0).hasValue());
    EXPECT_FALSE(workbook->canUndo());
    EXPECT_FALSE(workbook->undo());
    EXPECT_DOUBLE_EQ(sheet->getColumnWidth(2).value_or(0.0), 30.0);
}

// 超过最大深度时丢弃最旧的记录
TEST_F(UndoRedoTest, DepthLimit) {
    WorkbookOptions options;
    options.max_undo_depth = 3;
    auto small = Workbook::create(options);
    auto ws = small->getActiveSheet();

    for (int i = 1; i <= 5; ++i) {
        ASSERT_TRUE(ws->write(at("A1"), CellValue(static_cast<double>(i))).hasValue());
    }

    int steps = 0;
    while (small->undo()) {
        ++steps;
    }
    EXPECT_EQ(steps, 3);
    EXPECT_EQ(ws->readValue(at("A1")), CellValue(2.0));
}

// 直接测试管理器的 past/present/future 结构
TEST(UndoRedoManagerTest, PastPresentFuture) {
    UndoRedoManager manager(2);
    WorkbookSnapshot initial;
    initial.label = "initial";
    manager.reset(initial);
    EXPECT_FALSE(manager.canUndo());

    for (const char* label : {"one", "two", "three"}) {
        WorkbookSnapshot state;
        state.label = label;
        manager.commit(state);
    }
    EXPECT_EQ(manager.undoCount(), 2u);
    EXPECT_EQ(manager.present().label, "three");

    auto back = manager.undo();
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->label, "two");
    EXPECT_EQ(manager.redoCount(), 1u);

    auto forward = manager.redo();
    ASSERT_TRUE(forward.has_value());
    EXPECT_EQ(forward->label, "three");
    EXPECT_FALSE(manager.redo().has_value());
    EXPECT_EQ(manager.getMaxDepth(), 2u);
}
