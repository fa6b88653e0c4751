#pragma once

/// @file include/pfe/budget.hpp
/// @brief BudgetTracker: per-category spending limits and their status.
///
/// # Module: Budget Tracker
///
/// ## Responsibility
/// Hold one limit per category and compare a period's expense spending in
/// that category against it. Reads the Ledger; never writes it.
///
/// ## Status Formula
///   spent       = Σ expense amounts for (category, period)
///   remaining   = limit − spent            (negative when overspent)
///   over_budget = spent > limit
///
/// ## Guarantees
/// - Overwriting a category replaces its limit; no history is kept
/// - `status` lists budgeted categories only, ascending by name

#include "pfe/ledger.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pfe {

/// A stored limit for one category.
struct BudgetEntry {
    std::string category;
    double      limit;
};

/// Spending against a limit for one category and period.
struct BudgetStatus {
    std::string category;
    double      limit;
    double      spent;
    double      remaining;     ///< limit − spent
    bool        over_budget;   ///< spent > limit
    double      percent_used;  ///< spent / limit × 100, or 0 when limit is 0
};

class BudgetTracker {
public:
    /// Insert or overwrite the limit for `category`.
    ///
    /// # Errors
    /// - `InvalidAmount`   if `amount` is negative or non-finite
    /// - `InvalidCategory` if `category` is empty
    void set_budget(std::string category, double amount);

    /// Limit for `category`, or `nullopt` when none is set.
    [[nodiscard]] std::optional<double> limit(const std::string& category) const;

    /// All stored entries, ascending by category.
    [[nodiscard]] std::vector<BudgetEntry> entries() const;

    [[nodiscard]] std::size_t size() const noexcept { return limits_.size(); }

    /// Status of every budgeted category for the given month.
    [[nodiscard]] std::vector<BudgetStatus>
    status(const Ledger& ledger, int year, unsigned month) const;

private:
    std::map<std::string, double> limits_;
};

} // namespace pfe
