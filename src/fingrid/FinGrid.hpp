#pragma once

// FinGrid - 面向投融资模型的无界面表格计算引擎

#include <memory>
#include <string>

#include "fingrid/api/GridApi.hpp"
#include "fingrid/core/CSVProcessor.hpp"
#include "fingrid/core/CellAddress.hpp"
#include "fingrid/core/CellValue.hpp"
#include "fingrid/core/Exception.hpp"
#include "fingrid/core/Expected.hpp"
#include "fingrid/core/Workbook.hpp"
#include "fingrid/core/WorkbookState.hpp"
#include "fingrid/core/WorkbookTypes.hpp"
#include "fingrid/core/Worksheet.hpp"
#include "fingrid/utils/AddressParser.hpp"
#include "fingrid/utils/Logger.hpp"
#include "fingrid/xml/StateSerializer.hpp"

// 版本信息
#define FINGRID_VERSION_MAJOR 1
#define FINGRID_VERSION_MINOR 0
#define FINGRID_VERSION_PATCH 0
#define FINGRID_VERSION_STRING "1.0.0"

namespace fingrid {

inline std::string getVersion() {
    return FINGRID_VERSION_STRING;
}

/**
 * @brief 初始化FinGrid库（日志系统）
 * @param log_file_path 日志文件路径，为空时只输出到控制台
 * @param enable_console 是否启用控制台日志
 * @param level 日志级别
 * @return 初始化是否成功
 */
bool initialize(const std::string& log_file_path = "logs/fingrid.log",
                bool enable_console = true,
                Logger::Level level = Logger::Level::INFO);

/**
 * @brief 清理FinGrid库资源
 */
void cleanup();

/**
 * @brief 创建带默认工作表的工作簿
 */
std::unique_ptr<core::Workbook> createWorkbook(const core::WorkbookOptions& options = core::WorkbookOptions());

} // namespace fingrid
