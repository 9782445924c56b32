/**
 * @file Exception.hpp
 * @brief FinGrid异常类定义
 *
 * 库内部以 Result/VoidResult 返回错误；异常只在调用方显式要求时
 * （valueOrThrow、构造参数非法）抛出。
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include "fingrid/core/ErrorCode.hpp"

namespace fingrid {
namespace core {

/**
 * @brief FinGrid基础异常类
 */
class FinGridException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    FinGridException(const std::string& message,
                     ErrorCode code = ErrorCode::InternalError,
                     const char* file = nullptr,
                     int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }

    /**
     * @brief 获取带错误码、位置和上下文的详细信息
     */
    std::string getDetailedMessage() const;

    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    void addContext(const std::string& context);
    const std::vector<std::string>& getContext() const { return context_; }

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
    std::vector<std::string> context_;
};

/**
 * @brief 文件相关异常
 */
class FileException : public FinGridException {
public:
    FileException(const std::string& message, const std::string& filename,
                  ErrorCode code = ErrorCode::FileNotFound,
                  const char* file = nullptr, int line = 0);

    const std::string& getFilename() const { return filename_; }

private:
    std::string filename_;
};

/**
 * @brief 参数相关异常
 */
class ParameterException : public FinGridException {
public:
    ParameterException(const std::string& message,
                       const std::string& parameter_name = "",
                       const char* file = nullptr, int line = 0);

    const std::string& getParameterName() const { return parameter_name_; }

private:
    std::string parameter_name_;
};

/**
 * @brief 工作表相关异常
 */
class WorksheetException : public FinGridException {
public:
    WorksheetException(const std::string& message,
                       const std::string& worksheet_name = "",
                       ErrorCode code = ErrorCode::InvalidWorksheet,
                       const char* file = nullptr, int line = 0);

    const std::string& getWorksheetName() const { return worksheet_name_; }

private:
    std::string worksheet_name_;
};

/**
 * @brief 单元格引用相关异常
 */
class CellException : public FinGridException {
public:
    CellException(const std::string& message,
                  const std::string& reference = "",
                  ErrorCode code = ErrorCode::InvalidCellReference,
                  const char* file = nullptr, int line = 0);

    const std::string& getReference() const { return reference_; }

private:
    std::string reference_;
};

/**
 * @brief XML解析异常
 */
class XMLException : public FinGridException {
public:
    XMLException(const std::string& message,
                 int xml_line = -1,
                 const char* file = nullptr, int line = 0);

    int getXMLLine() const { return xml_line_; }

private:
    int xml_line_;
};

}} // namespace fingrid::core

// 便捷宏定义
#define FINGRID_THROW_PARAM(message, parameter_name) \
    throw fingrid::core::ParameterException(message, parameter_name, __FILE__, __LINE__)

#define FINGRID_THROW_PARAM_IF(condition, message, parameter_name) \
    do { if (condition) { FINGRID_THROW_PARAM(message, parameter_name); } } while(0)
