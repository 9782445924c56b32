#include "fingrid/formula/functions/FunctionHelpers.hpp"
#include <fmt/format.h>
#include <cmath>

namespace fingrid {
namespace formula {

using core::CellValue;
using core::FormulaError;
using namespace helpers;
using utils::TextUtils;

namespace {

constexpr size_t kVariadic = FunctionSpec::kVariadic;
constexpr size_t kMaxTextLength = 32767;

template<typename F>
CellValue textTransform(FunctionArgs& args, F&& func) {
    auto text = args.text(0);
    if (!text) {
        return text.error();
    }
    return func(*text);
}

std::string groupThousands(const std::string& digits) {
    std::string result;
    const size_t length = digits.size();
    for (size_t i = 0; i < length; ++i) {
        result += digits[i];
        const size_t remaining = length - i - 1;
        if (remaining > 0 && remaining % 3 == 0) {
            result += ',';
        }
    }
    return result;
}

/**
 * @brief TEXT(value, format) 支持的格式子集
 *
 * yyyy-mm-dd 输出日期；小数位数取小数点后的 0/# 个数；"," 启用千分位；
 * "%" 乘以 100 并追加百分号；"$" 加货币前缀。
 */
CellValue formatText(FunctionArgs& args) {
    CellValue value = args.value(0);
    if (value.isError()) {
        return value;
    }
    auto format = args.text(1);
    if (!format) {
        return format.error();
    }

    const std::string lower = TextUtils::toLower(*format);
    if (lower.find("yyyy") != std::string::npos) {
        auto serial = dateSerial(value);
        if (!serial) {
            return serial.error();
        }
        return utils::TimeUtils::formatISODate(*serial);
    }

    auto number = toNumber(value);
    if (!number) {
        return value.isText() ? value : CellValue(number.error());
    }

    const bool percent = format->find('%') != std::string::npos;
    const bool currency = format->find('$') != std::string::npos;
    const bool thousands = format->find(',') != std::string::npos;

    int decimals = 0;
    size_t dot = format->find('.');
    if (dot != std::string::npos) {
        for (size_t i = dot + 1; i < format->size() && ((*format)[i] == '0' || (*format)[i] == '#'); ++i) {
            ++decimals;
        }
    }

    double x = percent ? *number * 100.0 : *number;
    std::string body = utils::NumberUtils::formatFixed(std::fabs(x), decimals);
    if (thousands) {
        size_t point = body.find('.');
        std::string integer = body.substr(0, point);
        std::string fraction = point == std::string::npos ? std::string() : body.substr(point);
        body = groupThousands(integer) + fraction;
    }

    std::string result;
    if (x < 0 && body.find_first_not_of("0.,") != std::string::npos) {
        result += '-';
    }
    if (currency) {
        result += '$';
    }
    result += body;
    if (percent) {
        result += '%';
    }
    return result;
}

CellValue findText(FunctionArgs& args, bool ignore_case) {
    auto needle = args.text(0);
    if (!needle) {
        return needle.error();
    }
    auto haystack = args.text(1);
    if (!haystack) {
        return haystack.error();
    }
    auto start = countArg(args, 2, 1);
    if (!start) {
        return start.error();
    }
    if (*start < 1) {
        return FormulaError::Value;
    }
    auto position = TextUtils::find(*haystack, *needle, *start - 1, ignore_case);
    if (!position) {
        return FormulaError::Value;
    }
    return static_cast<double>(*position + 1);
}

} // namespace

void registerTextFunctions(FunctionLibrary& library) {
    const auto family = FunctionFamily::Text;

    library.add("CONCATENATE", family, 1, kVariadic, [](FunctionArgs& args) -> CellValue {
        std::string result;
        for (size_t i = 0; i < args.size(); ++i) {
            auto text = args.text(i);
            if (!text) {
                return text.error();
            }
            result += *text;
        }
        return result;
    });

    // CONCAT 会展开范围参数
    library.add("CONCAT", family, 1, kVariadic, [](FunctionArgs& args) -> CellValue {
        std::string result;
        for (size_t i = 0; i < args.size(); ++i) {
            for (const RangeValues::Entry& entry : args.range(i).entries) {
                if (entry.value.isError()) {
                    return entry.value;
                }
                result += entry.value.toDisplayString();
            }
        }
        return result;
    });

    library.add("LEN", family, 1, 1, [](FunctionArgs& args) {
        return textTransform(args, [](const std::string& s) {
            return CellValue(static_cast<double>(TextUtils::length(s)));
        });
    });

    library.add("UPPER", family, 1, 1, [](FunctionArgs& args) {
        return textTransform(args, [](const std::string& s) { return CellValue(TextUtils::toUpper(s)); });
    });

    library.add("LOWER", family, 1, 1, [](FunctionArgs& args) {
        return textTransform(args, [](const std::string& s) { return CellValue(TextUtils::toLower(s)); });
    });

    library.add("TRIM", family, 1, 1, [](FunctionArgs& args) {
        return textTransform(args, [](const std::string& s) { return CellValue(TextUtils::trim(s)); });
    });

    library.add("PROPER", family, 1, 1, [](FunctionArgs& args) {
        return textTransform(args, [](const std::string& s) { return CellValue(TextUtils::proper(s)); });
    });

    library.add("LEFT", family, 1, 2, [](FunctionArgs& args) -> CellValue {
        auto text = args.text(0);
        if (!text) {
            return text.error();
        }
        auto count = countArg(args, 1, 1);
        if (!count) {
            return count.error();
        }
        return TextUtils::left(*text, *count);
    });

    library.add("RIGHT", family, 1, 2, [](FunctionArgs& args) -> CellValue {
        auto text = args.text(0);
        if (!text) {
            return text.error();
        }
        auto count = countArg(args, 1, 1);
        if (!count) {
            return count.error();
        }
        return TextUtils::right(*text, *count);
    });

    // MID(text, start, count)，start 从 1 开始
    library.add("MID", family, 3, 3, [](FunctionArgs& args) -> CellValue {
        auto text = args.text(0);
        if (!text) {
            return text.error();
        }
        auto start = countArg(args, 1, 1);
        if (!start) {
            return start.error();
        }
        auto count = countArg(args, 2, 0);
        if (!count) {
            return count.error();
        }
        if (*start < 1) {
            return FormulaError::Value;
        }
        return TextUtils::substr(*text, *start - 1, *count);
    });

    library.add("FIND", family, 2, 3, [](FunctionArgs& args) { return findText(args, false); });
    library.add("SEARCH", family, 2, 3, [](FunctionArgs& args) { return findText(args, true); });

    // SUBSTITUTE(text, old, new, [instance])，省略 instance 替换全部
    library.add("SUBSTITUTE", family, 3, 4, [](FunctionArgs& args) -> CellValue {
        auto text = args.text(0);
        if (!text) {
            return text.error();
        }
        auto old_text = args.text(1);
        if (!old_text) {
            return old_text.error();
        }
        auto new_text = args.text(2);
        if (!new_text) {
            return new_text.error();
        }
        auto instance = countArg(args, 3, 0);
        if (!instance) {
            return instance.error();
        }
        if (args.has(3) && *instance < 1) {
            return FormulaError::Value;
        }
        return TextUtils::substitute(*text, *old_text, *new_text, *instance);
    });

    // REPLACE(text, start, count, new_text)
    library.add("REPLACE", family, 4, 4, [](FunctionArgs& args) -> CellValue {
        auto text = args.text(0);
        if (!text) {
            return text.error();
        }
        auto start = countArg(args, 1, 1);
        if (!start) {
            return start.error();
        }
        auto count = countArg(args, 2, 0);
        if (!count) {
            return count.error();
        }
        auto replacement = args.text(3);
        if (!replacement) {
            return replacement.error();
        }
        if (*start < 1) {
            return FormulaError::Value;
        }
        return TextUtils::replace(*text, *start - 1, *count, *replacement);
    });

    library.add("REPT", family, 2, 2, [](FunctionArgs& args) -> CellValue {
        auto text = args.text(0);
        if (!text) {
            return text.error();
        }
        auto times = countArg(args, 1, 0);
        if (!times) {
            return times.error();
        }
        if (text->empty()) {
            return std::string();
        }
        if (*times > kMaxTextLength / text->size()) {
            return FormulaError::Value;
        }
        std::string result;
        result.reserve(text->size() * *times);
        for (size_t i = 0; i < *times; ++i) {
            result += *text;
        }
        return result;
    });

    library.add("TEXT", family, 2, 2, formatText);

    // VALUE 接受货币符号、千分位和百分号
    library.add("VALUE", family, 1, 1, [](FunctionArgs& args) -> CellValue {
        CellValue value = args.value(0);
        if (value.isError() || value.isNumber()) {
            return value;
        }
        if (!value.isText()) {
            return FormulaError::Value;
        }
        if (auto number = utils::NumberUtils::parseLooseNumber(value.asText())) {
            return *number;
        }
        return FormulaError::Value;
    });
}

}} // namespace fingrid::formula
