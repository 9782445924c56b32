/**
 * @file Exception.cpp
 * @brief FinGrid异常类实现
 */

#include "fingrid/core/Exception.hpp"
#include <fmt/format.h>

namespace fingrid {
namespace core {

FinGridException::FinGridException(const std::string& message,
                                   ErrorCode code,
                                   const char* file,
                                   int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string FinGridException::getDetailedMessage() const {
    std::string detailed = fmt::format("[{}] {}", toString(error_code_), what());

    if (file_ && line_ > 0) {
        detailed += fmt::format(" (at {}:{})", file_, line_);
    }

    if (!context_.empty()) {
        detailed += "\nContext:";
        for (const auto& ctx : context_) {
            detailed += "\n  - " + ctx;
        }
    }

    return detailed;
}

void FinGridException::addContext(const std::string& context) {
    context_.push_back(context);
}

FileException::FileException(const std::string& message, const std::string& filename,
                             ErrorCode code, const char* file, int line)
    : FinGridException(filename.empty() ? message : fmt::format("{} (file: {})", message, filename),
                       code, file, line)
    , filename_(filename) {
}

ParameterException::ParameterException(const std::string& message,
                                       const std::string& parameter_name,
                                       const char* file, int line)
    : FinGridException(parameter_name.empty() ? message
                                              : fmt::format("{} (parameter: {})", message, parameter_name),
                       ErrorCode::InvalidArgument, file, line)
    , parameter_name_(parameter_name) {
}

WorksheetException::WorksheetException(const std::string& message,
                                       const std::string& worksheet_name,
                                       ErrorCode code, const char* file, int line)
    : FinGridException(worksheet_name.empty() ? message
                                              : fmt::format("{} (worksheet: {})", message, worksheet_name),
                       code, file, line)
    , worksheet_name_(worksheet_name) {
}

CellException::CellException(const std::string& message,
                             const std::string& reference,
                             ErrorCode code, const char* file, int line)
    : FinGridException(reference.empty() ? message
                                         : fmt::format("{} (cell: {})", message, reference),
                       code, file, line)
    , reference_(reference) {
}

XMLException::XMLException(const std::string& message,
                           int xml_line, const char* file, int line)
    : FinGridException(message, ErrorCode::XmlParseError, file, line)
    , xml_line_(xml_line) {
}

// Result -> 异常 的映射
void throwError(const Error& error) {
    switch (error.code) {
        case ErrorCode::FileNotFound:
        case ErrorCode::FileWriteError:
        case ErrorCode::FileReadError:
            throw FileException(error.fullMessage(), "", error.code);

        case ErrorCode::InvalidArgument:
            throw ParameterException(error.fullMessage());

        case ErrorCode::XmlParseError:
        case ErrorCode::XmlMissingElement:
            throw XMLException(error.fullMessage());

        case ErrorCode::InvalidWorkbook:
        case ErrorCode::InvalidWorksheet:
        case ErrorCode::DuplicateWorksheet:
        case ErrorCode::LastWorksheet:
        case ErrorCode::WorksheetLimitReached:
            throw WorksheetException(error.fullMessage(), "", error.code);

        case ErrorCode::InvalidCellReference:
        case ErrorCode::InvalidRange:
            throw CellException(error.fullMessage(), "", error.code);

        default:
            throw FinGridException(error.fullMessage(), error.code);
    }
}

}} // namespace fingrid::core
