#pragma once

/// @file include/pfe/error.hpp
/// @brief Error kinds raised by the finance engine and its adapters.
///
/// Every failure is reported synchronously as a `FinanceError` at the point
/// of violation. Operations validate all inputs before mutating any store,
/// so a thrown error never leaves a partial change behind.

#include <stdexcept>
#include <string>
#include <string_view>

namespace pfe {

/// Classification of a `FinanceError`.
enum class ErrorKind {
    InvalidAmount,        ///< Negative, non-finite or non-numeric amount
    InvalidCategory,      ///< Empty or missing category
    InvalidDate,          ///< Impossible or unparseable calendar date
    InvalidPeriod,        ///< Month outside 1..12
    InvalidTransactionType, ///< Type other than income or expense
    NoProfileSet,         ///< Advice requested before a profile exists
    InvalidRiskTolerance, ///< Value outside {low, medium, high}
    InvalidTaxSchedule,   ///< Bracket schedule with gaps, overlaps or bad rates
    UnknownAction,        ///< Command name not recognised
    MissingArgument,      ///< Required command argument absent
    StorageError,         ///< Data file could not be read or written
};

/// Stable identifier for an error kind, e.g. "InvalidAmount".
[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

/// Exception type for all engine failures.
class FinanceError : public std::runtime_error {
public:
    FinanceError(ErrorKind kind, const std::string& message);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace pfe
