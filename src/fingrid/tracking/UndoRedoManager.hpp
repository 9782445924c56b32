#pragma once

#include "fingrid/core/Constants.hpp"
#include "fingrid/core/Worksheet.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fingrid {
namespace tracking {

/**
 * @brief 单个工作表单元格映射的不可变快照
 *
 * revision 与工作表的修订号对应；修订号未变的工作表在相邻快照间共享同一份映射。
 */
struct SheetSnapshot {
    int sheet_id = 0;
    uint64_t revision = 0;
    std::shared_ptr<const core::CellMap> cells;
};

/**
 * @brief 一次提交后的工作簿状态
 */
struct WorkbookSnapshot {
    std::vector<SheetSnapshot> sheets;
    std::string label;  // 产生该状态的操作

    const SheetSnapshot* find(int sheet_id) const;
};

/**
 * @brief 撤销/重做管理器
 *
 * past / present / future 三段结构。提交把当前状态压入 past 并清空 future；
 * past 超过最大深度时丢弃最旧的记录。
 */
class UndoRedoManager {
public:
    explicit UndoRedoManager(size_t max_depth = core::Constants::kDefaultUndoDepth);
    ~UndoRedoManager() = default;

    // 禁用拷贝，支持移动
    UndoRedoManager(const UndoRedoManager&) = delete;
    UndoRedoManager& operator=(const UndoRedoManager&) = delete;
    UndoRedoManager(UndoRedoManager&&) = default;
    UndoRedoManager& operator=(UndoRedoManager&&) = default;

    /**
     * @brief 清空历史并以给定状态作为当前状态
     */
    void reset(WorkbookSnapshot present);

    /**
     * @brief 提交新状态
     */
    void commit(WorkbookSnapshot state);

    /**
     * @brief 撤销一步
     * @return 需要恢复的状态；没有可撤销的记录时为空
     */
    std::optional<WorkbookSnapshot> undo();

    /**
     * @brief 重做一步
     * @return 需要恢复的状态；没有可重做的记录时为空
     */
    std::optional<WorkbookSnapshot> redo();

    bool canUndo() const { return !past_.empty(); }
    bool canRedo() const { return !future_.empty(); }
    size_t undoCount() const { return past_.size(); }
    size_t redoCount() const { return future_.size(); }

    const WorkbookSnapshot& present() const { return present_; }

    /**
     * @brief 修订号未变的工作表复用 present 中的映射
     */
    std::shared_ptr<const core::CellMap> reuse(int sheet_id, uint64_t revision) const;

    size_t getMaxDepth() const { return max_depth_; }

private:
    std::deque<WorkbookSnapshot> past_;
    WorkbookSnapshot present_;
    std::vector<WorkbookSnapshot> future_;
    size_t max_depth_;
};

}} // namespace fingrid::tracking
