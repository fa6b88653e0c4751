#pragma once

/// @file include/pfe/ledger.hpp
/// @brief Transaction Ledger: the single source of transactional truth.
///
/// # Module: Ledger
///
/// ## Responsibility
/// Append-only store of income and expense transactions, queryable by
/// calendar month. Budget, tax and advice components read from it and never
/// mutate it.
///
/// ## Usage
/// ```cpp
/// Ledger ledger;
/// ledger.add_transaction(5000.0, "Income", "Salary",
///                        TransactionType::Income, Date{2024, 3, 1});
/// double in = ledger.total_income(2024, 3);   // 5000
/// ```
///
/// ## Guarantees
/// - Validation precedes mutation: a throwing `add_transaction` leaves the
///   ledger unchanged
/// - Period queries preserve insertion order
/// - An empty period yields zero totals, never an error

#include "pfe/types.hpp"

#include <cstddef>
#include <map>
#include <span>
#include <string>
#include <vector>

namespace pfe {

/// Per-category activity in one period (income and expense combined).
struct CategorySpending {
    std::string category;
    double      total;   ///< Sum of amounts
    std::size_t count;   ///< Number of transactions
};

class Ledger {
public:
    /// Record a transaction.
    ///
    /// # Errors
    /// - `InvalidAmount`   if `amount` is negative or non-finite
    /// - `InvalidCategory` if `category` is empty or whitespace-only
    /// - `InvalidDate`     if `date` is not a real calendar date
    void add_transaction(double amount,
                         std::string category,
                         std::string description,
                         TransactionType type,
                         Date date);

    /// All transactions dated in `month` of `year`, in insertion order.
    [[nodiscard]] std::vector<Transaction>
    transactions_in_period(int year, unsigned month) const;

    /// Sum of income amounts in the period; 0 if none.
    [[nodiscard]] double total_income(int year, unsigned month) const noexcept;

    /// Sum of expense amounts in the period; 0 if none.
    [[nodiscard]] double total_expenses(int year, unsigned month) const noexcept;

    /// Activity per category in the period, ascending by category name.
    [[nodiscard]] std::vector<CategorySpending>
    spending_by_category(int year, unsigned month) const;

    /// Expense totals per category in the period.
    [[nodiscard]] std::map<std::string, double>
    expenses_by_category(int year, unsigned month) const;

    /// Every recorded transaction, in insertion order.
    [[nodiscard]] std::span<const Transaction> transactions() const noexcept {
        return transactions_;
    }

    [[nodiscard]] std::size_t size() const noexcept { return transactions_.size(); }
    [[nodiscard]] bool empty() const noexcept { return transactions_.empty(); }

private:
    /// Sum of amounts of `type` in the period.
    [[nodiscard]] double total_of(TransactionType type,
                                  int year, unsigned month) const noexcept;

    std::vector<Transaction> transactions_;
};

/// Throws `InvalidAmount` unless `amount` is finite and non-negative.
void require_valid_amount(double amount);

/// Throws `InvalidCategory` if `category` is empty or only whitespace.
void require_valid_category(const std::string& category);

} // namespace pfe
