#pragma once

#include "fingrid/core/CSVProcessor.hpp"
#include "fingrid/core/CellValue.hpp"
#include "fingrid/core/ConditionalFormat.hpp"
#include "fingrid/core/Expected.hpp"
#include "fingrid/core/Workbook.hpp"
#include "fingrid/core/WorkbookState.hpp"
#include "fingrid/core/Worksheet.hpp"
#include <string>
#include <utility>

namespace fingrid {
namespace api {

/**
 * @brief 无界面的表格操作接口
 *
 * 绑定到一个工作簿，以文本地址驱动写入与读取，供自动化调用方使用。
 * 地址可带工作表限定（Sheet2!B3、'My Sheet'!A1），不带时指向活动工作表。
 * 非法输入一律以错误结果返回，不抛出异常。
 */
class GridApi {
public:
    explicit GridApi(core::Workbook& workbook) : workbook_(workbook) {}

    core::Workbook& getWorkbook() const { return workbook_; }

    // ========== 写入 ==========

    core::VoidResult write(const std::string& address, const core::CellValue& value,
                           const core::WriteOptions& options = core::WriteOptions());
    core::VoidResult setFormula(const std::string& address, const std::string& formula);
    core::VoidResult styleCell(const std::string& address, const core::CellStyle& style);

    /**
     * @brief 删除 start..end 内的单元格；end 为空时只删除 start
     */
    core::VoidResult clearRange(const std::string& start, const std::string& end = "");
    core::VoidResult writeRange(const std::string& start, const std::string& end, const core::ValueMatrix& values);

    /**
     * @brief 写入带链接的文本，分类为 link
     */
    core::VoidResult link(const std::string& address, const std::string& text, const std::string& url);

    // ========== 读取 ==========

    /**
     * @brief 读取物化值，未写入的单元格为空值
     */
    core::Result<core::CellValue> readValue(const std::string& address) const;

    /**
     * @brief 在活动工作表上下文中求值公式，不修改任何单元格
     */
    core::CellValue evaluate(const std::string& formula);

    // ========== 布局与格式 ==========

    core::VoidResult setColumnWidth(int column, double width);
    core::VoidResult setRowHeight(int row, double height);

    /**
     * @brief 在 range（可带工作表限定）上添加条件格式
     * @return 规则 id
     */
    core::Result<std::string> addConditionalFormat(const std::string& range, core::ConditionalFormat rule);

    /**
     * @brief 在 range 所在工作表上定义命名范围
     */
    core::VoidResult defineName(const std::string& name, const std::string& range);

    // ========== 状态与交换 ==========

    core::WorkbookState exportState() const { return workbook_.exportState(); }
    core::VoidResult importState(const core::WorkbookState& state);

    std::string exportXml() const;
    core::VoidResult importXml(const std::string& xml);

    /**
     * @brief 导出工作表为CSV文本，sheet 为空时为活动工作表
     */
    core::Result<std::string> exportCsv(const std::string& sheet = "",
                                        const core::CSVOptions& options = core::CSVOptions()) const;
    core::Result<core::CSVParseInfo> importCsv(const std::string& content, const std::string& sheet = "",
                                               const core::CSVOptions& options = core::CSVOptions());

private:
    struct Target {
        core::Worksheet* sheet;
        core::CellRange range;
    };

    core::Result<core::Worksheet*> resolveSheet(const std::string& name) const;

    /**
     * @brief 解析（可带工作表限定的）地址或范围；不允许跨表范围
     */
    core::Result<Target> resolve(const std::string& reference) const;
    core::Result<std::pair<core::Worksheet*, core::CellAddress>> resolveCell(const std::string& address) const;

    core::Workbook& workbook_;
};

}} // namespace fingrid::api
