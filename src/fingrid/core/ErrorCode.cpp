#include "fingrid/core/ErrorCode.hpp"

namespace fingrid {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:                    return "Success";
        case ErrorCode::InvalidArgument:       return "Invalid argument";
        case ErrorCode::InternalError:         return "Internal error";
        case ErrorCode::FileNotFound:          return "File not found";
        case ErrorCode::FileWriteError:        return "File write error";
        case ErrorCode::FileReadError:         return "File read error";
        case ErrorCode::InvalidWorkbook:       return "Invalid workbook";
        case ErrorCode::InvalidWorksheet:      return "Invalid worksheet";
        case ErrorCode::InvalidCellReference:  return "Invalid cell reference";
        case ErrorCode::InvalidFormat:         return "Invalid format";
        case ErrorCode::InvalidFormula:        return "Invalid formula";
        case ErrorCode::InvalidRange:          return "Invalid range";
        case ErrorCode::DuplicateWorksheet:    return "Worksheet already exists";
        case ErrorCode::LastWorksheet:         return "Cannot remove the last worksheet";
        case ErrorCode::WorksheetLimitReached: return "Worksheet limit reached";
        case ErrorCode::XmlParseError:         return "XML parse error";
        case ErrorCode::XmlMissingElement:     return "Missing XML element";
    }
    return "Unknown error";
}

}} // namespace fingrid::core
