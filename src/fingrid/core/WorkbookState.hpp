#pragma once

#include "fingrid/core/SheetMetadata.hpp"
#include "fingrid/core/Worksheet.hpp"
#include <string>
#include <vector>

namespace fingrid {
namespace core {

/**
 * @brief 单个工作表的可序列化状态
 */
struct SheetState {
    int id = 0;
    std::string name;
    SheetMetadata metadata;
    CellMap cells;

    bool operator==(const SheetState& other) const {
        return id == other.id && name == other.name && metadata == other.metadata && cells == other.cells;
    }
};

/**
 * @brief 工作簿快照：按创建顺序的工作表与活动工作表 ID
 */
struct WorkbookState {
    int active_sheet_id = 0;
    std::vector<SheetState> sheets;

    bool operator==(const WorkbookState& other) const {
        return active_sheet_id == other.active_sheet_id && sheets == other.sheets;
    }
    bool operator!=(const WorkbookState& other) const { return !(*this == other); }
};

}} // namespace fingrid::core
