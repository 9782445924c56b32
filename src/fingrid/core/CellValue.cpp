#include "fingrid/core/CellValue.hpp"
#include "fingrid/utils/NumberUtils.hpp"

namespace fingrid {
namespace core {

const char* errorText(FormulaError error) noexcept {
    switch (error) {
        case FormulaError::Generic:      return "#ERROR!";
        case FormulaError::Ref:          return "#REF!";
        case FormulaError::NotAvailable: return "#N/A";
        case FormulaError::Circular:     return "#CIRCULAR!";
        case FormulaError::Value:        return "#VALUE!";
    }
    return "#ERROR!";
}

std::optional<FormulaError> parseErrorText(std::string_view text) noexcept {
    for (FormulaError error : {FormulaError::Generic, FormulaError::Ref, FormulaError::NotAvailable,
                               FormulaError::Circular, FormulaError::Value}) {
        if (text == errorText(error)) {
            return error;
        }
    }
    return std::nullopt;
}

double CellValue::asNumber() const noexcept {
    if (const double* number = std::get_if<double>(&data_)) {
        return *number;
    }
    if (const bool* boolean = std::get_if<bool>(&data_)) {
        return *boolean ? 1.0 : 0.0;
    }
    return 0.0;
}

const std::string& CellValue::asText() const noexcept {
    static const std::string empty;
    if (const std::string* text = std::get_if<std::string>(&data_)) {
        return *text;
    }
    return empty;
}

bool CellValue::asBoolean() const noexcept {
    if (const bool* boolean = std::get_if<bool>(&data_)) {
        return *boolean;
    }
    if (const double* number = std::get_if<double>(&data_)) {
        return *number != 0.0;
    }
    return false;
}

FormulaError CellValue::asError() const noexcept {
    if (const FormulaError* error = std::get_if<FormulaError>(&data_)) {
        return *error;
    }
    return FormulaError::Generic;
}

std::string CellValue::toDisplayString() const {
    switch (kind()) {
        case Kind::Empty:   return {};
        case Kind::Number:  return utils::NumberUtils::formatNumber(std::get<double>(data_));
        case Kind::Text:    return std::get<std::string>(data_);
        case Kind::Boolean: return std::get<bool>(data_) ? "TRUE" : "FALSE";
        case Kind::Error:   return errorText(std::get<FormulaError>(data_));
    }
    return {};
}

const char* kindName(CellValue::Kind kind) noexcept {
    switch (kind) {
        case CellValue::Kind::Empty:   return "empty";
        case CellValue::Kind::Number:  return "number";
        case CellValue::Kind::Text:    return "text";
        case CellValue::Kind::Boolean: return "boolean";
        case CellValue::Kind::Error:   return "error";
    }
    return "empty";
}

}} // namespace fingrid::core
