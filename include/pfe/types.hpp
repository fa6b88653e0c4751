#pragma once

/// @file include/pfe/types.hpp
/// @brief Shared value types for the Personal Finance Engine (PFE).
///
/// All modules include this file. Records are plain aggregates; validation
/// happens in the component that owns them.

#include <optional>
#include <string>
#include <string_view>

namespace pfe {

/// Parse a decimal number such as "12.50" or "3e2". Rejects trailing bytes,
/// empty text and non-finite results.
[[nodiscard]] std::optional<double> parse_number(std::string_view text) noexcept;

// ─── Date ─────────────────────────────────────────────────────────────────────

/// A calendar date. Month is 1-based, day is 1-based.
struct Date {
    int      year  = 1970;
    unsigned month = 1;
    unsigned day   = 1;

    friend bool operator==(const Date&, const Date&) = default;
    friend auto operator<=>(const Date&, const Date&) = default;

    /// True when the date exists in the proleptic Gregorian calendar.
    [[nodiscard]] bool valid() const noexcept;

    /// True when the date falls in the given month of the given year.
    [[nodiscard]] bool in_period(int y, unsigned m) const noexcept {
        return year == y && month == m;
    }

    /// Render as YYYY-MM-DD.
    [[nodiscard]] std::string to_string() const;

    /// Parse YYYY-MM-DD. Returns `nullopt` on bad shape or impossible dates.
    [[nodiscard]] static std::optional<Date> parse(std::string_view text) noexcept;

    /// Today's date in the local time zone.
    [[nodiscard]] static Date today();
};

// ─── Transaction ──────────────────────────────────────────────────────────────

enum class TransactionType {
    Income,
    Expense,
};

[[nodiscard]] std::string_view to_string(TransactionType type) noexcept;

/// Parse "income" / "expense" (case-insensitive).
[[nodiscard]] std::optional<TransactionType>
parse_transaction_type(std::string_view text);

/// A recorded ledger entry. Immutable once stored.
struct Transaction {
    double          amount;       ///< Non-negative amount
    std::string     category;     ///< Non-empty category name
    std::string     description;  ///< Free-form note
    TransactionType type;
    Date            date;

    friend bool operator==(const Transaction&, const Transaction&) = default;
};

// ─── Investment Profile ───────────────────────────────────────────────────────

enum class RiskTolerance {
    Low,
    Medium,
    High,
};

[[nodiscard]] std::string_view to_string(RiskTolerance risk) noexcept;

/// Parse "low" / "medium" / "high" (case-insensitive).
/// Throws `FinanceError(InvalidRiskTolerance)` for anything else.
[[nodiscard]] RiskTolerance parse_risk_tolerance(std::string_view text);

/// The user's declared investment stance.
struct InvestmentProfile {
    RiskTolerance risk_tolerance;
    std::string   goals;

    friend bool operator==(const InvestmentProfile&, const InvestmentProfile&) = default;
};

} // namespace pfe
