#pragma once

#include "fingrid/core/Cell.hpp"
#include "fingrid/core/CellAddress.hpp"
#include "fingrid/core/CSVProcessor.hpp"
#include "fingrid/core/Expected.hpp"
#include "fingrid/core/SheetMetadata.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fingrid {
namespace calc {
class Recalculator;
}
namespace core {

// 前向声明
class Workbook;
class WorksheetManager;
class WorksheetCSVHandler;

using CellMap = std::map<CellAddress, Cell>;
using StyleOverlay = std::map<CellAddress, CellStyle>;
using ValueMatrix = std::vector<std::vector<CellValue>>;

/**
 * @brief 字面量写入的附加信息
 */
struct WriteOptions {
    std::optional<std::string> source;
    std::optional<std::string> link;
};

/**
 * @brief Worksheet类 - 单个工作表
 *
 * 持有单元格映射与元数据。每次成功写入后立即通知所属工作簿，
 * 由工作簿完成重算、条件格式刷新和撤销快照，返回时状态已一致。
 */
class Worksheet {
    friend class Workbook;
    friend class WorksheetManager;
    friend class WorksheetCSVHandler;
    friend class calc::Recalculator;

public:
    Worksheet(const std::string& name, Workbook& workbook, int sheet_id);
    ~Worksheet() = default;

    Worksheet(const Worksheet&) = delete;
    Worksheet& operator=(const Worksheet&) = delete;

    // ========== 基本信息 ==========

    const std::string& getName() const { return name_; }
    int getSheetId() const { return sheet_id_; }
    Workbook& getWorkbook() const { return workbook_; }

    /**
     * @brief 单元格映射的修订号，映射发生任何变化都会递增
     */
    uint64_t getRevision() const { return revision_; }

    // ========== 单元格写入 ==========

    /**
     * @brief 写入字面量，清除原有公式；带链接时分类为 link，否则按值推断
     */
    VoidResult write(const CellAddress& addr, const CellValue& value, const WriteOptions& options = WriteOptions());

    /**
     * @brief 写入公式并在返回前完成求值
     * @param formula 公式文本，缺少前导 = 时自动补上
     */
    VoidResult setFormula(const CellAddress& addr, const std::string& formula);

    /**
     * @brief 编辑器式输入
     *
     * 先去掉前后空白；= 开头为公式，TRUE/FALSE 为布尔，数值文本为数值，其余为文本。
     */
    VoidResult enterText(const CellAddress& addr, const std::string& text);

    /**
     * @brief 删除范围内的单元格
     */
    VoidResult clearRange(const CellAddress& start, const CellAddress& end);

    /**
     * @brief 按行优先把矩阵写入 start..end，以 = 开头的文本作为公式
     *
     * 矩阵比范围小的部分不写入，超出范围的部分忽略。
     */
    VoidResult writeRange(const CellAddress& start, const CellAddress& end, const ValueMatrix& matrix);

    // ========== 样式与附加信息 ==========

    VoidResult styleCell(const CellAddress& addr, const CellStyle& style);
    VoidResult styleRange(const CellRange& range, const CellStyle& style);

    VoidResult setComment(const CellAddress& addr, const std::string& comment);
    VoidResult setLink(const CellAddress& addr, const std::string& url);
    VoidResult setSourceAnnotation(const CellAddress& addr, const std::string& source);

    // ========== 读取 ==========

    /**
     * @brief 读取单元格，不存在时返回 nullptr
     */
    const Cell* read(const CellAddress& addr) const;

    /**
     * @brief 读取物化值，不存在时为空值
     */
    CellValue readValue(const CellAddress& addr) const;

    bool hasCellAt(const CellAddress& addr) const { return cells_.find(addr) != cells_.end(); }
    size_t getCellCount() const { return cells_.size(); }
    const CellMap& getCells() const { return cells_; }

    /**
     * @brief 已使用区域的最大行号与最大列号，空表为 (0, 0)
     */
    std::pair<int, int> getUsedRange() const;

    // ========== 元数据 ==========

    const SheetMetadata& getMetadata() const { return metadata_; }

    int getRowCount() const { return metadata_.rows; }
    int getColumnCount() const { return metadata_.columns; }
    VoidResult setDimensions(int rows, int columns);

    VoidResult setFrozenPanes(int rows, int columns);

    VoidResult setRowHidden(int row, bool hidden = true);
    VoidResult setColumnHidden(int column, bool hidden = true);
    bool isRowHidden(int row) const { return metadata_.hidden_rows.count(row) > 0; }
    bool isColumnHidden(int column) const { return metadata_.hidden_columns.count(column) > 0; }

    VoidResult setRowHeight(int row, double height);
    VoidResult setColumnWidth(int column, double width);
    std::optional<double> getRowHeight(int row) const;
    std::optional<double> getColumnWidth(int column) const;

    /**
     * @brief 合并区域；与已有合并区域重叠时失败
     */
    VoidResult mergeRange(const CellRange& range);
    VoidResult unmergeRange(const CellRange& range);

    // ========== 条件格式 ==========

    /**
     * @brief 添加条件格式规则
     * @return 规则 id；rule.id 为空时自动生成 "cf<N>"
     */
    Result<std::string> addConditionalFormat(ConditionalFormat rule);
    VoidResult removeConditionalFormat(const std::string& id);
    const std::vector<ConditionalFormat>& getConditionalFormats() const { return metadata_.conditional_formats; }

    /**
     * @brief 条件格式计算结果（地址到合并后的样式）
     */
    const StyleOverlay& getFormatOverlay() const { return overlay_; }

    /**
     * @brief 单元格自身样式叠加条件格式结果
     */
    CellStyle effectiveStyle(const CellAddress& addr) const;

    // ========== 命名范围 ==========

    /**
     * @brief 定义或覆盖命名范围，名称不区分大小写
     *
     * 名称须以字母或下划线开头，由字母、数字、下划线和点组成，
     * 且不能是单元格地址或 TRUE/FALSE。
     */
    VoidResult defineName(const std::string& name, const CellRange& range);
    VoidResult removeName(const std::string& name);
    std::optional<NamedRange> findName(const std::string& name) const;

    static bool isValidName(const std::string& name);

    // ========== CSV ==========

    std::string toCSVString(const CSVOptions& options = CSVOptions()) const;
    VoidResult saveAsCSV(const std::string& filepath, const CSVOptions& options = CSVOptions()) const;

    /**
     * @brief 用 CSV 内容替换本表的全部单元格
     */
    Result<CSVParseInfo> loadFromCSVString(const std::string& content, const CSVOptions& options = CSVOptions());
    Result<CSVParseInfo> loadFromCSV(const std::string& filepath, const CSVOptions& options = CSVOptions());

private:
    // ========== 供工作簿、管理器与重算控制器使用 ==========

    void setName(const std::string& name) { name_ = name; }

    /**
     * @brief 回写重算结果，值未变化时不递增修订号
     */
    void setComputedValue(const CellAddress& addr, const CellValue& value);

    Cell* findCell(const CellAddress& addr);

    void replaceCells(CellMap cells);
    void restoreCells(const CellMap& cells, uint64_t revision);
    void setMetadata(const SheetMetadata& metadata) { metadata_ = metadata; }
    void setFormatOverlay(StyleOverlay overlay) { overlay_ = std::move(overlay); }

    /**
     * @brief 深拷贝单元格与元数据到新工作表
     */
    std::shared_ptr<Worksheet> clone(const std::string& name, int sheet_id) const;

    // ========== 内部 ==========

    VoidResult checkAddress(const CellAddress& addr) const;
    VoidResult checkRange(const CellRange& range) const;
    void ensureDimensions(const CellAddress& addr);

    /**
     * @brief 取得（必要时创建）单元格并记录写入前的值
     */
    Cell& prepareWrite(const CellAddress& addr, const std::string& timestamp);

    void touch();
    void commit(const std::vector<CellAddress>& changed, const std::string& label);

    std::string name_;
    Workbook& workbook_;
    int sheet_id_;
    uint64_t revision_ = 0;

    CellMap cells_;
    SheetMetadata metadata_;
    StyleOverlay overlay_;
    int next_format_id_ = 1;
};

}} // namespace fingrid::core
