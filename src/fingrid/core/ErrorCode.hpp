#pragma once

#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace fingrid {
namespace core {

/**
 * @brief FinGrid 库级错误码
 *
 * 单元格求值错误（#REF!、#N/A 等）不走这里，它们是单元格的值，
 * 见 CellValue.hpp。这里只描述 API 调用本身的失败。
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArgument = 1,
    InternalError = 3,

    // 文件操作错误 (20-39)
    FileNotFound = 20,
    FileWriteError = 23,
    FileReadError = 24,

    // 工作簿/工作表错误 (40-59)
    InvalidWorkbook = 40,
    InvalidWorksheet = 41,
    InvalidCellReference = 42,
    InvalidFormat = 43,
    InvalidFormula = 44,
    InvalidRange = 45,
    DuplicateWorksheet = 46,
    LastWorksheet = 47,
    WorksheetLimitReached = 48,

    // XML处理错误 (60-79)
    XmlParseError = 61,
    XmlMissingElement = 63
};

/**
 * @brief 错误信息结构
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;  // 额外上下文信息

    Error() : code(ErrorCode::Ok) {}

    explicit Error(ErrorCode c);

    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}

    Error(ErrorCode c, const std::string& msg, const std::string& ctx)
        : code(c), message(msg), context(ctx) {}

    bool isOk() const noexcept { return code == ErrorCode::Ok; }
    bool isError() const noexcept { return code != ErrorCode::Ok; }

    std::string fullMessage() const {
        if (context.empty()) {
            return message;
        }
        return fmt::format("{} (Context: {})", message, context);
    }
};

/**
 * @brief 错误码转字符串
 */
const char* toString(ErrorCode code) noexcept;

inline Error makeError(ErrorCode code) {
    return Error(code);
}

inline Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

inline Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    return Error(code, message, context);
}

/**
 * @brief 按错误码抛出对应的异常类型，实现在 Exception.cpp
 */
[[noreturn]] void throwError(const Error& error);

}} // namespace fingrid::core
