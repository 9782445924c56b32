#pragma once

#include <cstddef>

namespace fingrid {
namespace core {

struct Constants {
    // 网格上限（与 Excel 一致），超出即 #REF!
    static constexpr int kMaxRows = 1048576;
    static constexpr int kMaxColumns = 16384;

    // 新工作表的默认尺寸与冻结窗格
    static constexpr int kDefaultRows = 100;
    static constexpr int kDefaultColumns = 26;
    static constexpr int kDefaultFrozenRows = 1;
    static constexpr int kDefaultFrozenColumns = 1;

    static constexpr int kMaxSheetNameLength = 31;
    static constexpr size_t kDefaultMaxSheets = 255;
    static constexpr size_t kDefaultUndoDepth = 100;

    // IRR/RATE/XIRR 牛顿迭代参数
    static constexpr int kIrrMaxIterations = 100;
    static constexpr double kIrrTolerance = 1e-5;
    static constexpr double kIrrInitialGuess = 0.1;

    // 引用递归深度上限
    static constexpr int kMaxEvalDepth = 1024;

    // 公式文本长度与括号、一元运算的嵌套上限
    static constexpr size_t kMaxFormulaLength = 8192;
    static constexpr int kMaxFormulaNesting = 256;

    // 需要逐个地址展开的范围（设置样式、展开地址列表）的单元格上限
    static constexpr size_t kMaxExpandedCells = 1000000;
};

}} // namespace fingrid::core
