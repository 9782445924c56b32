#include "fingrid/utils/NumberUtils.hpp"
#include <fast_float/fast_float.h>
#include <fmt/format.h>
#include <cctype>
#include <cmath>

namespace fingrid {
namespace utils {

std::string_view NumberUtils::trim(std::string_view text) {
    const char* ws = " \t\r\n";
    size_t start = text.find_first_not_of(ws);
    if (start == std::string_view::npos) {
        return {};
    }
    size_t end = text.find_last_not_of(ws);
    return text.substr(start, end - start + 1);
}

std::optional<double> NumberUtils::parseNumber(std::string_view text) {
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }

    bool negative = false;
    if (text.front() == '+' || text.front() == '-') {
        negative = text.front() == '-';
        text.remove_prefix(1);
        if (text.empty() || text.front() == '+' || text.front() == '-') {
            return std::nullopt;
        }
    }

    // 排除 inf/nan 等非数字开头的写法
    if (!(std::isdigit(static_cast<unsigned char>(text.front())) || text.front() == '.')) {
        return std::nullopt;
    }

    double value = 0.0;
    auto result = fast_float::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return negative ? -value : value;
}

std::optional<double> NumberUtils::parseLooseNumber(std::string_view text) {
    text = trim(text);
    if (auto strict = parseNumber(text)) {
        return strict;
    }

    bool negative = false;
    if (!text.empty() && text.front() == '-') {
        negative = true;
        text.remove_prefix(1);
    }

    bool percent = false;
    if (!text.empty() && text.back() == '%') {
        percent = true;
        text.remove_suffix(1);
    }

    std::string cleaned;
    cleaned.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char ch = text[i];
        if (ch == '$' && i == 0) {
            continue;
        }
        if (ch == ',') {
            continue;
        }
        cleaned += ch;
    }

    auto value = parseNumber(cleaned);
    if (!value) {
        return std::nullopt;
    }
    double result = percent ? *value / 100.0 : *value;
    return negative ? -result : result;
}

std::string NumberUtils::formatNumber(double value) {
    if (value == 0.0) {
        return "0";  // 包括 -0
    }
    if (std::fabs(value) < 1e15 && value == std::trunc(value)) {
        return fmt::format("{:.0f}", value);
    }
    return fmt::format("{:.15g}", value);
}

std::string NumberUtils::formatFixed(double value, int decimals) {
    if (decimals < 0) {
        decimals = 0;
    }
    return fmt::format("{:.{}f}", value, decimals);
}

}} // namespace fingrid::utils
