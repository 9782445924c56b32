#pragma once

#include "fingrid/core/Expected.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fingrid {
namespace core {

// 前向声明
class Worksheet;
class Workbook;

/**
 * @brief 工作表管理器 - 负责管理所有工作表
 *
 * 按创建顺序保存工作表，名称（不区分大小写）与 ID 各有一份索引。
 * 任何时刻恰有一个活动工作表。
 */
class WorksheetManager {
public:
    using WorksheetPtr = std::shared_ptr<Worksheet>;

    // 配置
    struct Configuration {
        size_t max_sheets = 255;                  // 最大工作表数
        std::string default_name_prefix = "Sheet"; // 默认名称前缀
    };

    // 统计信息
    struct Statistics {
        size_t total_created = 0;
        size_t total_deleted = 0;
        size_t total_renamed = 0;
    };

private:
    std::vector<WorksheetPtr> worksheets_;               // 有序列表
    std::unordered_map<std::string, size_t> name_index_; // 大写名称索引
    std::unordered_map<int, size_t> id_index_;           // ID索引

    Workbook& workbook_;
    int next_sheet_id_ = 1;
    size_t active_index_ = 0;

    Configuration config_;
    Statistics stats_;

public:
    WorksheetManager(Workbook& workbook, const Configuration& config);
    ~WorksheetManager() = default;

    WorksheetManager(const WorksheetManager&) = delete;
    WorksheetManager& operator=(const WorksheetManager&) = delete;

    // 创建

    /**
     * @brief 创建新工作表
     * @param name 工作表名称，为空时自动生成 Sheet<N>
     * @return 新工作表；名称非法为 InvalidWorksheet，重名为 DuplicateWorksheet，
     *         数量达到上限为 WorksheetLimitReached
     */
    Result<WorksheetPtr> createWorksheet(const std::string& name = "");

    /**
     * @brief 以指定 ID 重建工作表（状态导入）
     */
    Result<WorksheetPtr> restoreWorksheet(int id, const std::string& name);

    /**
     * @brief 复制工作表（单元格与元数据深拷贝），新名称为 "<name> (2)"
     */
    Result<WorksheetPtr> copy(int source_id);

    // 查找和访问

    WorksheetPtr getByName(const std::string& name) const;
    WorksheetPtr getById(int id) const;
    WorksheetPtr getByIndex(size_t index) const;

    /**
     * @brief 所有工作表，按创建顺序
     */
    const std::vector<WorksheetPtr>& getAll() const { return worksheets_; }

    std::optional<size_t> indexOf(int id) const;
    std::optional<size_t> indexOfName(const std::string& name) const;

    // 删除

    /**
     * @brief 删除工作表；只剩一个时返回 LastWorksheet
     *
     * 删除活动工作表时，活动指针移到原位置上的下一个工作表（已是末尾则取前一个）。
     */
    VoidResult removeById(int id);

    /**
     * @brief 清空全部工作表（状态导入前使用），ID 计数器不重置
     */
    void clear();

    // 重命名

    VoidResult rename(int id, const std::string& new_name);

    // 活动工作表管理

    VoidResult setActiveById(int id);
    VoidResult setActive(const std::string& name);
    WorksheetPtr getActive() const;
    size_t getActiveIndex() const { return active_index_; }

    // 查询和统计

    size_t count() const { return worksheets_.size(); }
    bool empty() const { return worksheets_.empty(); }
    bool exists(const std::string& name) const;

    const Statistics& getStatistics() const { return stats_; }
    const Configuration& getConfiguration() const { return config_; }

    // 验证和工具

    /**
     * @brief 验证工作表名称：1 到 31 个字符，不含 []:*?/\
     */
    static VoidResult validateName(const std::string& name);

    /**
     * @brief 生成唯一的工作表名称
     * @param prefix 前缀，为空时使用配置的默认前缀
     */
    std::string generateUniqueName(const std::string& prefix = "") const;

private:
    VoidResult checkNewName(const std::string& name, int ignore_id = 0) const;
    Result<WorksheetPtr> insert(int id, const std::string& name);
    void rebuildIndexes();
    std::string copyName(const std::string& source_name) const;
};

}} // namespace fingrid::core
