/// @file src/core/types.cpp
/// @brief Date handling and enum conversions for the shared value types.

#include "pfe/types.hpp"
#include "pfe/error.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <ctime>

namespace pfe {

namespace {

[[nodiscard]] constexpr bool is_leap(int y) noexcept {
    return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
}

[[nodiscard]] std::string lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/// Parse an all-digit field into `out`. Rejects signs and trailing bytes.
template <typename T>
[[nodiscard]] bool parse_digits(std::string_view field, T& out) noexcept {
    if (field.empty()) return false;
    for (char c : field) {
        if (c < '0' || c > '9') return false;
    }
    const auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), out);
    return ec == std::errc{} && ptr == field.data() + field.size();
}

}  // namespace

std::optional<double> parse_number(std::string_view text) noexcept {
    if (text.empty()) return std::nullopt;
    // from_chars does not accept a leading '+'.
    if (text.front() == '+') {
        text.remove_prefix(1);
        if (text.empty() || text.front() == '-') return std::nullopt;
    }

    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    if (!std::isfinite(value)) return std::nullopt;
    return value;
}

// ─── Date ─────────────────────────────────────────────────────────────────────

bool Date::valid() const noexcept {
    if (year < 1 || year > 9999) return false;
    if (month < 1 || month > 12)  return false;
    if (day < 1)                  return false;

    constexpr unsigned DAYS_IN_MONTH[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    unsigned limit = DAYS_IN_MONTH[month - 1];
    if (month == 2 && is_leap(year)) ++limit;
    return day <= limit;
}

std::string Date::to_string() const {
    return fmt::format("{:04d}-{:02d}-{:02d}", year, month, day);
}

std::optional<Date> Date::parse(std::string_view text) noexcept {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }

    Date d;
    if (!parse_digits(text.substr(0, 4), d.year))  return std::nullopt;
    if (!parse_digits(text.substr(5, 2), d.month)) return std::nullopt;
    if (!parse_digits(text.substr(8, 2), d.day))   return std::nullopt;

    if (!d.valid()) return std::nullopt;
    return d;
}

Date Date::today() {
    const std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    return Date{
        .year  = local.tm_year + 1900,
        .month = static_cast<unsigned>(local.tm_mon + 1),
        .day   = static_cast<unsigned>(local.tm_mday),
    };
}

// ─── TransactionType ──────────────────────────────────────────────────────────

std::string_view to_string(TransactionType type) noexcept {
    switch (type) {
        case TransactionType::Income:  return "income";
        case TransactionType::Expense: return "expense";
    }
    return "expense";
}

std::optional<TransactionType> parse_transaction_type(std::string_view text) {
    const std::string key = lower(text);
    if (key == "income")  return TransactionType::Income;
    if (key == "expense") return TransactionType::Expense;
    return std::nullopt;
}

// ─── RiskTolerance ────────────────────────────────────────────────────────────

std::string_view to_string(RiskTolerance risk) noexcept {
    switch (risk) {
        case RiskTolerance::Low:    return "low";
        case RiskTolerance::Medium: return "medium";
        case RiskTolerance::High:   return "high";
    }
    return "low";
}

RiskTolerance parse_risk_tolerance(std::string_view text) {
    const std::string key = lower(text);
    if (key == "low")    return RiskTolerance::Low;
    if (key == "medium") return RiskTolerance::Medium;
    if (key == "high")   return RiskTolerance::High;
    throw FinanceError(ErrorKind::InvalidRiskTolerance,
                       fmt::format("risk tolerance must be low, medium or high (got '{}')", text));
}

}  // namespace pfe
