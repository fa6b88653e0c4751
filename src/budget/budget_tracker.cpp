/// @file src/budget/budget_tracker.cpp
/// @brief BudgetTracker implementation.

#include "pfe/budget.hpp"

#include <utility>

namespace pfe {

void BudgetTracker::set_budget(std::string category, double amount) {
    require_valid_amount(amount);
    require_valid_category(category);
    limits_[std::move(category)] = amount;
}

std::optional<double> BudgetTracker::limit(const std::string& category) const {
    const auto it = limits_.find(category);
    if (it == limits_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<BudgetEntry> BudgetTracker::entries() const {
    std::vector<BudgetEntry> out;
    out.reserve(limits_.size());
    for (const auto& [category, amount] : limits_) {
        out.push_back(BudgetEntry{.category = category, .limit = amount});
    }
    return out;
}

std::vector<BudgetStatus>
BudgetTracker::status(const Ledger& ledger, int year, unsigned month) const {
    const auto spent_by_category = ledger.expenses_by_category(year, month);

    std::vector<BudgetStatus> out;
    out.reserve(limits_.size());

    // limits_ is ordered by category, so the output is too.
    for (const auto& [category, cap] : limits_) {
        const auto it     = spent_by_category.find(category);
        const double spent = (it != spent_by_category.end()) ? it->second : 0.0;

        out.push_back(BudgetStatus{
            .category     = category,
            .limit        = cap,
            .spent        = spent,
            .remaining    = cap - spent,
            .over_budget  = spent > cap,
            .percent_used = (cap > 0.0) ? spent / cap * 100.0 : 0.0,
        });
    }
    return out;
}

}  // namespace pfe
