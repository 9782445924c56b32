#include "fingrid/FinGrid.hpp"
#include <iostream>

namespace fingrid {

bool initialize(const std::string& log_file_path, bool enable_console, Logger::Level level) {
    try {
        Logger::getInstance().initialize(log_file_path, level, enable_console);
        Logger::getInstance().setLevel(level);
        FINGRID_LOG_INFO("FinGrid library initialized, version {}", getVersion());
        return true;
    } catch (const std::exception& e) {
        if (enable_console) {
            std::cerr << "Failed to initialize FinGrid: " << e.what() << std::endl;
        }
        return false;
    }
}

void cleanup() {
    FINGRID_LOG_INFO("FinGrid library cleanup completed");
    Logger::getInstance().shutdown();
}

std::unique_ptr<core::Workbook> createWorkbook(const core::WorkbookOptions& options) {
    return core::Workbook::create(options);
}

} // namespace fingrid
