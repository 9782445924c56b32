#pragma once

#include "fingrid/core/Constants.hpp"
#include <cstddef>
#include <string>

namespace fingrid {
namespace core {

/**
 * @file WorkbookTypes.hpp
 * @brief 工作簿相关的类型定义
 */

/**
 * @brief 工作簿选项配置结构体
 */
struct WorkbookOptions {
    // 撤销历史
    size_t max_undo_depth = Constants::kDefaultUndoDepth;  // 可撤销的最大步数

    // 新工作表默认值
    int default_rows = Constants::kDefaultRows;
    int default_columns = Constants::kDefaultColumns;
    int default_frozen_rows = Constants::kDefaultFrozenRows;
    int default_frozen_columns = Constants::kDefaultFrozenColumns;

    // 工作表管理
    size_t max_sheets = Constants::kDefaultMaxSheets;
    std::string sheet_name_prefix = "Sheet";  // 自动命名前缀

    // 计算选项
    int irr_max_iterations = Constants::kIrrMaxIterations;
    double irr_tolerance = Constants::kIrrTolerance;
    double irr_initial_guess = Constants::kIrrInitialGuess;
    int max_eval_depth = Constants::kMaxEvalDepth;  // 单次递归的深度上限，更深的链分轮求值
};

}} // namespace fingrid::core
