#include "fingrid/utils/AddressParser.hpp"
#include "fingrid/core/Constants.hpp"
#include "fingrid/core/Exception.hpp"
#include <cctype>
#include <regex>

namespace fingrid {
namespace utils {

using core::CellAddress;
using core::CellRange;
using core::Constants;
using core::ErrorCode;
using core::makeError;

core::Result<int> AddressParser::toIndex(std::string_view letters) {
    if (letters.empty()) {
        return makeError(ErrorCode::InvalidCellReference, "Empty column letters");
    }

    int col = 0;
    for (char ch : letters) {
        if (!std::isalpha(static_cast<unsigned char>(ch))) {
            return makeError(ErrorCode::InvalidCellReference,
                             "Invalid column letters: " + std::string(letters));
        }
        col = col * 26 + (std::toupper(static_cast<unsigned char>(ch)) - 'A' + 1);
        if (col > Constants::kMaxColumns) {
            return makeError(ErrorCode::InvalidCellReference,
                             "Column out of range: " + std::string(letters));
        }
    }
    return col;
}

std::string AddressParser::toLetters(int column) {
    FINGRID_THROW_PARAM_IF(column < 1, "Column index must be >= 1", "column");

    std::string result;
    while (column > 0) {
        int rem = (column - 1) % 26;
        result.insert(result.begin(), static_cast<char>('A' + rem));
        column = (column - 1) / 26;
    }
    return result;
}

core::Result<CellAddress> AddressParser::parseAddress(std::string_view text) {
    static const std::regex addr_regex(R"(^\$?([A-Za-z]{1,3})\$?([0-9]{1,7})$)");

    std::string input(text);
    std::smatch matches;
    if (!std::regex_match(input, matches, addr_regex)) {
        return makeError(ErrorCode::InvalidCellReference, "Invalid address format: " + input);
    }

    auto col = toIndex(matches[1].str());
    if (!col) {
        return col.error();
    }

    long row = std::stol(matches[2].str());
    if (row < 1 || row > Constants::kMaxRows) {
        return makeError(ErrorCode::InvalidCellReference, "Row out of range: " + input);
    }

    return CellAddress(static_cast<int>(row), col.value());
}

core::Result<CellRange> AddressParser::parseRange(std::string_view text) {
    auto colon_pos = text.find(':');
    if (colon_pos == std::string_view::npos) {
        auto single = parseAddress(text);
        if (!single) {
            return single.error();
        }
        return CellRange(single.value());
    }

    auto start = parseAddress(text.substr(0, colon_pos));
    if (!start) {
        return makeError(ErrorCode::InvalidRange, "Invalid range start: " + std::string(text));
    }
    auto end = parseAddress(text.substr(colon_pos + 1));
    if (!end) {
        return makeError(ErrorCode::InvalidRange, "Invalid range end: " + std::string(text));
    }
    return CellRange(start.value(), end.value());
}

core::Result<std::vector<CellAddress>> AddressParser::expandRange(std::string_view text) {
    auto range = parseRange(text);
    if (!range) {
        return range.error();
    }
    if (range->size() > Constants::kMaxExpandedCells) {
        return makeError(ErrorCode::InvalidRange, "Range too large to expand: " + std::string(text));
    }
    return range->addresses();
}

core::Result<QualifiedReference> AddressParser::splitQualified(std::string_view text) {
    QualifiedReference ref;

    auto bang = text.rfind('!');
    if (bang == std::string_view::npos) {
        ref.local = std::string(text);
        return ref;
    }

    std::string_view sheet_part = text.substr(0, bang);
    ref.local = std::string(text.substr(bang + 1));
    if (sheet_part.empty() || ref.local.empty()) {
        return makeError(ErrorCode::InvalidCellReference, "Invalid qualified reference: " + std::string(text));
    }

    // 'My Sheet'!A1：引号内 '' 表示一个单引号
    if (sheet_part.front() == '\'') {
        if (sheet_part.size() < 2 || sheet_part.back() != '\'') {
            return makeError(ErrorCode::InvalidCellReference, "Unterminated sheet quote: " + std::string(text));
        }
        std::string name;
        for (size_t i = 1; i + 1 < sheet_part.size(); ++i) {
            name += sheet_part[i];
            if (sheet_part[i] == '\'' && i + 2 < sheet_part.size() && sheet_part[i + 1] == '\'') {
                ++i;
            }
        }
        ref.first_sheet = name;
        return ref;
    }

    auto colon = sheet_part.find(':');
    if (colon != std::string_view::npos) {
        ref.first_sheet = std::string(sheet_part.substr(0, colon));
        ref.last_sheet = std::string(sheet_part.substr(colon + 1));
        if (ref.first_sheet.empty() || ref.last_sheet.empty()) {
            return makeError(ErrorCode::InvalidCellReference, "Invalid sheet span: " + std::string(text));
        }
    } else {
        ref.first_sheet = std::string(sheet_part);
    }
    return ref;
}

std::string AddressParser::toString(const CellAddress& addr) {
    return toLetters(addr.col) + std::to_string(addr.row);
}

std::string AddressParser::toString(const CellRange& range) {
    if (range.isSingleCell()) {
        return toString(range.first);
    }
    return toString(range.first) + ":" + toString(range.last);
}

bool AddressParser::needsQuoting(const std::string& sheet_name) {
    if (sheet_name.empty()) {
        return false;
    }
    if (std::isdigit(static_cast<unsigned char>(sheet_name.front()))) {
        return true;
    }
    for (char ch : sheet_name) {
        if (!std::isalnum(static_cast<unsigned char>(ch)) && ch != '_' && ch != '.') {
            return true;
        }
    }
    return false;
}

std::string AddressParser::qualify(const std::string& sheet_name, const std::string& local) {
    if (sheet_name.empty()) {
        return local;
    }
    if (!needsQuoting(sheet_name)) {
        return sheet_name + "!" + local;
    }
    std::string quoted = "'";
    for (char ch : sheet_name) {
        quoted += ch;
        if (ch == '\'') {
            quoted += '\'';
        }
    }
    return quoted + "'!" + local;
}

bool AddressParser::looksLikeAddress(std::string_view text) {
    size_t i = 0;
    if (i < text.size() && text[i] == '$') ++i;
    size_t letters_start = i;
    while (i < text.size() && std::isalpha(static_cast<unsigned char>(text[i]))) ++i;
    if (i == letters_start) return false;
    if (i < text.size() && text[i] == '$') ++i;
    size_t digits_start = i;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) ++i;
    return i == text.size() && i > digits_start;
}

}} // namespace fingrid::utils
