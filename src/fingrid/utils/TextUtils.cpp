#include "fingrid/utils/TextUtils.hpp"
#include <utf8.h>
#include <algorithm>
#include <cctype>

namespace fingrid {
namespace utils {

namespace {

char asciiUpper(char ch) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
}

char asciiLower(char ch) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
}

bool isValidUtf8(const std::string& text) {
    return utf8::is_valid(text.begin(), text.end());
}

} // namespace

size_t TextUtils::byteOffset(const std::string& text, size_t code_points) {
    if (!isValidUtf8(text)) {
        return std::min(code_points, text.size());
    }
    auto it = text.begin();
    for (size_t i = 0; i < code_points && it != text.end(); ++i) {
        utf8::next(it, text.end());
    }
    return static_cast<size_t>(it - text.begin());
}

size_t TextUtils::length(const std::string& text) {
    if (!isValidUtf8(text)) {
        return text.size();
    }
    return static_cast<size_t>(utf8::distance(text.begin(), text.end()));
}

std::string TextUtils::substr(const std::string& text, size_t start, size_t count) {
    size_t begin = byteOffset(text, start);
    if (begin >= text.size()) {
        return {};
    }
    std::string tail = text.substr(begin);
    return tail.substr(0, byteOffset(tail, count));
}

std::string TextUtils::left(const std::string& text, size_t count) {
    return text.substr(0, byteOffset(text, count));
}

std::string TextUtils::right(const std::string& text, size_t count) {
    size_t total = length(text);
    if (count >= total) {
        return text;
    }
    return substr(text, total - count, count);
}

std::string TextUtils::toUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), asciiUpper);
    return text;
}

std::string TextUtils::toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), asciiLower);
    return text;
}

std::string TextUtils::proper(const std::string& text) {
    std::string result = text;
    bool word_start = true;
    for (char& ch : result) {
        if (std::isalpha(static_cast<unsigned char>(ch))) {
            ch = word_start ? asciiUpper(ch) : asciiLower(ch);
            word_start = false;
        } else {
            word_start = !(static_cast<unsigned char>(ch) >= 0x80 ||
                           std::isdigit(static_cast<unsigned char>(ch)));
        }
    }
    return result;
}

std::string TextUtils::trim(const std::string& text) {
    const char* ws = " \t\r\n";
    size_t start = text.find_first_not_of(ws);
    if (start == std::string::npos) {
        return {};
    }
    size_t end = text.find_last_not_of(ws);
    return text.substr(start, end - start + 1);
}

std::optional<size_t> TextUtils::find(const std::string& haystack, const std::string& needle,
                                      size_t from, bool ignore_case) {
    size_t from_byte = byteOffset(haystack, from);
    if (from_byte > haystack.size()) {
        return std::nullopt;
    }

    size_t pos = std::string::npos;
    if (ignore_case) {
        pos = toLower(haystack).find(toLower(needle), from_byte);
    } else {
        pos = haystack.find(needle, from_byte);
    }
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    return length(haystack.substr(0, pos));
}

std::string TextUtils::substitute(const std::string& text, const std::string& old_text,
                                  const std::string& new_text, size_t instance) {
    if (old_text.empty()) {
        return text;
    }

    std::string result;
    size_t pos = 0;
    size_t occurrence = 0;
    while (true) {
        size_t found = text.find(old_text, pos);
        if (found == std::string::npos) {
            break;
        }
        ++occurrence;
        result.append(text, pos, found - pos);
        if (instance == 0 || occurrence == instance) {
            result += new_text;
        } else {
            result += old_text;
        }
        pos = found + old_text.size();
    }
    result.append(text, pos, std::string::npos);
    return result;
}

std::string TextUtils::replace(const std::string& text, size_t start, size_t count,
                               const std::string& replacement) {
    size_t begin = byteOffset(text, start);
    if (begin >= text.size()) {
        return text + replacement;
    }
    std::string tail = text.substr(begin);
    size_t removed = byteOffset(tail, count);
    return text.substr(0, begin) + replacement + tail.substr(removed);
}

bool TextUtils::equalsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (asciiLower(a[i]) != asciiLower(b[i])) {
            return false;
        }
    }
    return true;
}

bool TextUtils::containsIgnoreCase(std::string_view haystack, std::string_view needle) {
    if (needle.empty()) {
        return true;
    }
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) { return asciiLower(a) == asciiLower(b); });
    return it != haystack.end();
}

}} // namespace fingrid::utils
