#pragma once

#include "fingrid/core/CellAddress.hpp"
#include "fingrid/core/ConditionalFormat.hpp"
#include "fingrid/core/Constants.hpp"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace fingrid {
namespace core {

/**
 * @brief 命名范围，名称不区分大小写
 */
struct NamedRange {
    std::string name;
    CellRange range;

    bool operator==(const NamedRange& other) const {
        return name == other.name && range == other.range;
    }
};

/**
 * @brief 工作表元数据：尺寸、冻结窗格、隐藏行列、行高列宽、合并区域、
 *        条件格式与命名范围
 */
struct SheetMetadata {
    int rows = Constants::kDefaultRows;
    int columns = Constants::kDefaultColumns;
    int frozen_rows = Constants::kDefaultFrozenRows;
    int frozen_columns = Constants::kDefaultFrozenColumns;

    std::set<int> hidden_rows;
    std::set<int> hidden_columns;
    std::map<int, double> row_heights;
    std::map<int, double> column_widths;

    std::vector<CellRange> merged_ranges;
    std::vector<ConditionalFormat> conditional_formats;

    // 键为大写名称
    std::map<std::string, NamedRange> named_ranges;

    bool operator==(const SheetMetadata& other) const {
        return rows == other.rows && columns == other.columns &&
               frozen_rows == other.frozen_rows && frozen_columns == other.frozen_columns &&
               hidden_rows == other.hidden_rows && hidden_columns == other.hidden_columns &&
               row_heights == other.row_heights && column_widths == other.column_widths &&
               merged_ranges == other.merged_ranges &&
               conditional_formats == other.conditional_formats &&
               named_ranges == other.named_ranges;
    }
    bool operator!=(const SheetMetadata& other) const { return !(*this == other); }
};

}} // namespace fingrid::core
