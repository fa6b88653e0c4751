/// @file src/ledger/ledger.cpp
/// @brief Transaction Ledger implementation.

#include "pfe/ledger.hpp"
#include "pfe/error.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <utility>

namespace pfe {

// ─── Validation ───────────────────────────────────────────────────────────────

void require_valid_amount(double amount) {
    if (!std::isfinite(amount)) {
        throw FinanceError(ErrorKind::InvalidAmount, "amount must be a finite number");
    }
    if (amount < 0.0) {
        throw FinanceError(ErrorKind::InvalidAmount,
                           fmt::format("amount must not be negative (got {})", amount));
    }
}

void require_valid_category(const std::string& category) {
    const bool blank = std::all_of(category.begin(), category.end(),
                                   [](unsigned char c) { return std::isspace(c) != 0; });
    if (blank) {
        throw FinanceError(ErrorKind::InvalidCategory, "category must not be empty");
    }
}

// ─── Ledger::add_transaction ──────────────────────────────────────────────────

void Ledger::add_transaction(double amount,
                             std::string category,
                             std::string description,
                             TransactionType type,
                             Date date) {
    require_valid_amount(amount);
    require_valid_category(category);
    if (!date.valid()) {
        throw FinanceError(ErrorKind::InvalidDate,
                           fmt::format("not a calendar date: {}", date.to_string()));
    }

    transactions_.push_back(Transaction{
        .amount      = amount,
        .category    = std::move(category),
        .description = std::move(description),
        .type        = type,
        .date        = date,
    });
}

// ─── Period queries ───────────────────────────────────────────────────────────

std::vector<Transaction>
Ledger::transactions_in_period(int year, unsigned month) const {
    std::vector<Transaction> out;
    std::copy_if(transactions_.begin(), transactions_.end(), std::back_inserter(out),
                 [&](const Transaction& t) { return t.date.in_period(year, month); });
    return out;
}

double Ledger::total_income(int year, unsigned month) const noexcept {
    return total_of(TransactionType::Income, year, month);
}

double Ledger::total_expenses(int year, unsigned month) const noexcept {
    return total_of(TransactionType::Expense, year, month);
}

double Ledger::total_of(TransactionType type, int year, unsigned month) const noexcept {
    double sum = 0.0;
    for (const auto& t : transactions_) {
        if (t.type == type && t.date.in_period(year, month)) {
            sum += t.amount;
        }
    }
    return sum;
}

std::vector<CategorySpending>
Ledger::spending_by_category(int year, unsigned month) const {
    // std::map keeps categories ordered for deterministic output.
    std::map<std::string, CategorySpending> by_category;
    for (const auto& t : transactions_) {
        if (!t.date.in_period(year, month)) continue;

        auto it = by_category.try_emplace(
            t.category, CategorySpending{.category = t.category, .total = 0.0, .count = 0}).first;
        it->second.total += t.amount;
        ++it->second.count;
    }

    std::vector<CategorySpending> out;
    out.reserve(by_category.size());
    for (auto& [name, spending] : by_category) {
        out.push_back(std::move(spending));
    }
    return out;
}

std::map<std::string, double>
Ledger::expenses_by_category(int year, unsigned month) const {
    std::map<std::string, double> out;
    for (const auto& t : transactions_) {
        if (t.type == TransactionType::Expense && t.date.in_period(year, month)) {
            out[t.category] += t.amount;
        }
    }
    return out;
}

}  // namespace pfe
