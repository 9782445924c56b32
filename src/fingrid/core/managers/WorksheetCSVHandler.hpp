#pragma once

#include "fingrid/core/CellAddress.hpp"
#include "fingrid/core/CellValue.hpp"
#include "fingrid/core/CSVProcessor.hpp"
#include "fingrid/core/Expected.hpp"
#include <string>

namespace fingrid {
namespace core {

// 前向声明
class Worksheet;

/**
 * @brief 工作表与 CSV 之间的转换
 *
 * 导出到最后一个有值的行和列，字段为显示文本；导入时按文本形状推断值。
 */
class WorksheetCSVHandler {
public:
    explicit WorksheetCSVHandler(Worksheet& worksheet);

    // CSV导入
    Result<CSVParseInfo> loadFromCSV(const std::string& filepath, const CSVOptions& options = CSVOptions());
    Result<CSVParseInfo> loadFromCSVString(const std::string& csv_content, const CSVOptions& options = CSVOptions());

    // CSV导出
    static std::string toCSVString(const Worksheet& worksheet, const CSVOptions& options = CSVOptions());
    static VoidResult saveAsCSV(const Worksheet& worksheet, const std::string& filepath,
                                const CSVOptions& options = CSVOptions());

    /**
     * @brief 字段转值：数值文本为数值，TRUE/FALSE 为布尔，错误哨兵为错误值，其余保持文本
     */
    static CellValue inferValue(const std::string& field);

    static std::string getCellDisplayValue(const Worksheet& worksheet, const CellAddress& addr);

private:
    Worksheet& worksheet_;
};

}} // namespace fingrid::core
