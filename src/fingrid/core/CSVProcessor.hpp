#pragma once

#include "fingrid/core/Expected.hpp"
#include <string>
#include <vector>

namespace fingrid {
namespace core {

struct CSVOptions {
    char delimiter = ',';
    char quote_char = '"';
    bool has_header = false;        // 首行为标题：导入时跳过，导出时不额外生成
    bool skip_empty_lines = true;
    bool trim_whitespace = true;
    std::string line_terminator = "\n";

    static CSVOptions standard() {
        return CSVOptions{};
    }

    CSVOptions() = default;
};

// CSV解析结果信息
struct CSVParseInfo {
    int rows_parsed = 0;
    int columns_detected = 0;
    bool has_header_row = false;
    std::vector<std::string> column_names;
};

using CSVTable = std::vector<std::vector<std::string>>;

/**
 * @brief RFC 4180 CSV 读写
 *
 * 引号内允许出现分隔符、换行和成对的引号；\r\n 与 \n 都作为行结束。
 */
class CSVProcessor {
public:
    CSVProcessor() = default;
    explicit CSVProcessor(const CSVOptions& options) : options_(options) {}

    void setOptions(const CSVOptions& options) {
        options_ = options;
    }
    const CSVOptions& getOptions() const { return options_; }

    /**
     * @brief 解析整段内容
     * @return 行列表；引号未闭合时返回 InvalidFormat
     */
    Result<CSVTable> parseString(const std::string& content) const;

    std::string formatRow(const std::vector<std::string>& row) const;
    std::string formatTable(const CSVTable& table) const;

    std::string escapeField(const std::string& field) const;
    bool needsQuoting(const std::string& field) const;

private:
    CSVOptions options_;
};

// 文件读写
Result<std::string> readTextFile(const std::string& filepath);
VoidResult writeTextFile(const std::string& filepath, const std::string& content);

/**
 * @brief 按候选分隔符出现次数猜测分隔符
 */
char detectDelimiter(const std::string& sample);

bool isCSVFile(const std::string& filepath);

}} // namespace fingrid::core
