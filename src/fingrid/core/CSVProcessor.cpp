#include "fingrid/core/CSVProcessor.hpp"
#include "fingrid/utils/ModuleLoggers.hpp"
#include "fingrid/utils/TextUtils.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>
#include <unordered_map>

namespace fingrid {
namespace core {

Result<CSVTable> CSVProcessor::parseString(const std::string& content) const {
    CSVTable result;
    if (content.empty()) {
        return result;
    }

    std::vector<std::string> row;
    std::string field;
    bool in_quotes = false;
    bool field_quoted = false;

    auto finishField = [&]() {
        row.push_back(options_.trim_whitespace && !field_quoted ? utils::TextUtils::trim(field) : field);
        field.clear();
        field_quoted = false;
    };
    auto finishRow = [&]() {
        finishField();
        const bool empty_line = row.size() == 1 && row[0].empty();
        if (!(empty_line && options_.skip_empty_lines)) {
            result.push_back(std::move(row));
        }
        row.clear();
    };

    const size_t length = content.size();
    for (size_t i = 0; i < length; ++i) {
        const char c = content[i];
        if (in_quotes) {
            if (c == options_.quote_char) {
                if (i + 1 < length && content[i + 1] == options_.quote_char) {
                    field += c;
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        if (c == options_.quote_char) {
            // 字段开头的引号开启引用，之前的空白丢弃
            if (utils::TextUtils::trim(field).empty()) {
                field.clear();
                in_quotes = true;
                field_quoted = true;
            } else {
                field += c;
            }
        } else if (c == options_.delimiter) {
            finishField();
        } else if (c == '\r') {
            if (i + 1 < length && content[i + 1] == '\n') {
                ++i;
            }
            finishRow();
        } else if (c == '\n') {
            finishRow();
        } else {
            field += c;
        }
    }

    if (in_quotes) {
        return makeError(ErrorCode::InvalidFormat, "Unterminated quoted field in CSV content");
    }
    if (!field.empty() || field_quoted || !row.empty()) {
        finishRow();
    }
    return result;
}

bool CSVProcessor::needsQuoting(const std::string& field) const {
    return field.find(options_.delimiter) != std::string::npos ||
           field.find(options_.quote_char) != std::string::npos ||
           field.find('\n') != std::string::npos ||
           field.find('\r') != std::string::npos;
}

std::string CSVProcessor::escapeField(const std::string& field) const {
    if (!needsQuoting(field)) {
        return field;
    }
    std::string escaped(1, options_.quote_char);
    for (char c : field) {
        if (c == options_.quote_char) {
            escaped += options_.quote_char;
        }
        escaped += c;
    }
    escaped += options_.quote_char;
    return escaped;
}

std::string CSVProcessor::formatRow(const std::vector<std::string>& row) const {
    std::ostringstream oss;
    for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) {
            oss << options_.delimiter;
        }
        oss << escapeField(row[i]);
    }
    return oss.str();
}

std::string CSVProcessor::formatTable(const CSVTable& table) const {
    std::string result;
    for (size_t i = 0; i < table.size(); ++i) {
        if (i > 0) {
            result += options_.line_terminator;
        }
        result += formatRow(table[i]);
    }
    return result;
}

Result<std::string> readTextFile(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        return makeError(ErrorCode::FileNotFound, "Cannot open file for reading", filepath);
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return makeError(ErrorCode::FileReadError, "Failed to read file", filepath);
    }
    return content;
}

VoidResult writeTextFile(const std::string& filepath, const std::string& content) {
    std::ofstream file(filepath, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return makeError(ErrorCode::FileWriteError, "Cannot open file for writing", filepath);
    }
    file << content;
    if (!file) {
        return makeError(ErrorCode::FileWriteError, "Failed to write file", filepath);
    }
    CORE_DEBUG("Wrote {} bytes to {}", content.size(), filepath);
    return success();
}

char detectDelimiter(const std::string& sample) {
    // 统计各种分隔符出现的频率
    std::unordered_map<char, int> counts;
    const std::vector<char> candidates = {',', ';', '\t', '|'};

    for (char delimiter : candidates) {
        counts[delimiter] = static_cast<int>(std::count(sample.begin(), sample.end(), delimiter));
    }

    char best_delimiter = ',';
    int max_count = 0;
    for (char delimiter : candidates) {
        if (counts[delimiter] > max_count) {
            max_count = counts[delimiter];
            best_delimiter = delimiter;
        }
    }
    return best_delimiter;
}

bool isCSVFile(const std::string& filepath) {
    size_t dot_pos = filepath.find_last_of('.');
    if (dot_pos == std::string::npos) {
        return false;
    }

    std::string ext = filepath.substr(dot_pos + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return ext == "csv" || ext == "tsv" || ext == "txt";
}

}} // namespace fingrid::core
