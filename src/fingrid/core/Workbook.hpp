#pragma once

#include "fingrid/calc/Recalculator.hpp"
#include "fingrid/core/Expected.hpp"
#include "fingrid/core/WorkbookState.hpp"
#include "fingrid/core/WorkbookTypes.hpp"
#include "fingrid/core/Worksheet.hpp"
#include "fingrid/core/WorksheetManager.hpp"
#include "fingrid/tracking/UndoRedoManager.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace fingrid {
namespace core {

/**
 * @brief Workbook类 - 工作簿
 *
 * 按创建顺序持有工作表，且至少有一个工作表。每次提交的写入都在返回前完成
 * 重算、条件格式刷新和撤销快照。单线程使用，调用方负责串行化写入。
 */
class Workbook {
    friend class Worksheet;

public:
    explicit Workbook(const WorkbookOptions& options = WorkbookOptions());
    ~Workbook();

    Workbook(const Workbook&) = delete;
    Workbook& operator=(const Workbook&) = delete;

    /**
     * @brief 创建带一个默认工作表 "Sheet1" 的工作簿
     */
    static std::unique_ptr<Workbook> create(const WorkbookOptions& options = WorkbookOptions());

    const WorkbookOptions& getOptions() const { return options_; }

    // ========== 工作表管理 ==========

    /**
     * @brief 新建工作表
     * @param name 名称，为空时自动生成唯一的 Sheet<N>
     * @return 新工作表的 ID
     */
    Result<int> createSheet(const std::string& name = "");

    VoidResult switchSheet(int sheet_id);
    VoidResult switchSheet(const std::string& name);

    /**
     * @brief 重命名工作表；公式中的旧名称不会改写，之后解析为 #REF!
     */
    VoidResult renameSheet(int sheet_id, const std::string& new_name);

    /**
     * @brief 复制工作表（单元格与元数据深拷贝）
     * @return 副本的 ID
     */
    Result<int> copySheet(int sheet_id);

    /**
     * @brief 删除工作表；只剩一个时拒绝
     */
    VoidResult deleteSheet(int sheet_id);

    std::shared_ptr<Worksheet> getSheet(int sheet_id) const;
    std::shared_ptr<Worksheet> getSheet(const std::string& name) const;
    std::shared_ptr<Worksheet> getActiveSheet() const;
    int getActiveSheetId() const;

    /**
     * @brief 全部工作表，按创建顺序
     */
    const std::vector<std::shared_ptr<Worksheet>>& getSheets() const { return manager_.getAll(); }
    size_t getSheetCount() const { return manager_.count(); }
    std::vector<std::string> getSheetNames() const;

    // ========== 撤销/重做 ==========

    /**
     * @brief 撤销最近一次提交；没有可撤销的记录时返回 false
     */
    bool undo();
    bool redo();
    bool canUndo() const { return undo_.canUndo(); }
    bool canRedo() const { return undo_.canRedo(); }

    /**
     * @brief 清空历史并以当前状态重新开始
     */
    void resetHistory();

    // ========== 状态导出/导入 ==========

    WorkbookState exportState() const;

    /**
     * @brief 用快照替换全部内容，之后全量重算并重置撤销历史
     *
     * 快照先整体校验，校验失败时工作簿保持不变。
     */
    VoidResult importState(const WorkbookState& state);

    // ========== 计算 ==========

    void recalculateAll();

    /**
     * @brief 在指定工作表上下文中求值公式，不修改任何单元格
     */
    CellValue evaluate(int sheet_id, const std::string& formula);

    calc::Recalculator& getRecalculator() { return recalculator_; }

private:
    // ========== 供 Worksheet 回调 ==========

    uint64_t nextRevision() { return ++revision_counter_; }

    /**
     * @brief 写入提交：增量重算、刷新条件格式、记录撤销快照
     */
    void onCellsChanged(Worksheet& sheet, const std::vector<CellAddress>& changed, const std::string& label);

    /**
     * @brief 命名范围变化：全量重算并刷新条件格式，不进入撤销历史
     */
    void onNamesChanged();

    void onFormatsChanged(Worksheet& sheet);

    // ========== 内部 ==========

    void afterStructureChange();
    void refreshConditionalFormats();
    tracking::WorkbookSnapshot captureSnapshot(const std::string& label) const;
    void restoreSnapshot(const tracking::WorkbookSnapshot& snapshot);
    static VoidResult validateState(const WorkbookState& state);

    WorkbookOptions options_;
    uint64_t revision_counter_ = 0;
    WorksheetManager manager_;
    calc::Recalculator recalculator_;
    tracking::UndoRedoManager undo_;
};

}} // namespace fingrid::core
