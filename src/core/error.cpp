/// @file src/core/error.cpp
/// @brief FinanceError construction and ErrorKind names.

#include "pfe/error.hpp"

namespace pfe {

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidAmount:        return "InvalidAmount";
        case ErrorKind::InvalidCategory:      return "InvalidCategory";
        case ErrorKind::InvalidDate:          return "InvalidDate";
        case ErrorKind::InvalidPeriod:        return "InvalidPeriod";
        case ErrorKind::InvalidTransactionType: return "InvalidTransactionType";
        case ErrorKind::NoProfileSet:         return "NoProfileSet";
        case ErrorKind::InvalidRiskTolerance: return "InvalidRiskTolerance";
        case ErrorKind::InvalidTaxSchedule:   return "InvalidTaxSchedule";
        case ErrorKind::UnknownAction:        return "UnknownAction";
        case ErrorKind::MissingArgument:      return "MissingArgument";
        case ErrorKind::StorageError:         return "StorageError";
    }
    return "Unknown";
}

FinanceError::FinanceError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message)
    , kind_(kind)
{}

}  // namespace pfe
