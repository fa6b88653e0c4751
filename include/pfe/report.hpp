#pragma once

/// @file include/pfe/report.hpp
/// @brief ReportGenerator: one period's financial report.
///
/// # Module: Report Generator
///
/// ## Responsibility
/// Compose the Ledger totals, budget status, tax estimate and investment
/// recommendations for one month into a `FinancialReport`.
///
/// ## Pipeline
///   Ledger totals → BudgetTracker::status → TaxEstimator::estimate(income)
///   → InvestmentAdvisor::recommend → supplementary advice
///
/// ## Usage
/// ```cpp
/// FinanceBook book = DataStore::load("financial_data").book;
/// auto report = ReportGenerator::generate(book.ledger, book.budgets,
///                                         TaxEstimator{}, InvestmentAdvisor{},
///                                         book.profile, 2024, 3);
/// fmt::print("{}", report.to_string());
/// ```
///
/// ## Guarantees
/// - Fail-fast: the first failing step's `FinanceError` propagates and no
///   partial report is returned
/// - Pure: output depends only on the arguments

#include "pfe/advisor.hpp"
#include "pfe/budget.hpp"
#include "pfe/ledger.hpp"
#include "pfe/tax.hpp"
#include "pfe/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace pfe {

/// Everything known about one month.
struct FinancialReport {
    std::string period;         ///< "YYYY-MM"
    int         year;
    unsigned    month;

    double total_income;
    double total_expenses;
    double net;                 ///< income − expenses
    double savings_rate;        ///< net / income × 100, or 0 when income is 0

    std::vector<CategorySpending> spending_by_category;
    std::vector<BudgetStatus>     budget_statuses;
    TaxEstimate                   tax_estimate;
    std::vector<std::string>      tax_advice;
    std::vector<std::string>      recommendations;  ///< From InvestmentAdvisor::recommend
    std::vector<std::string>      spending_advice;
    std::vector<std::string>      goal_advice;

    /// Multi-section text rendering for terminals.
    [[nodiscard]] std::string to_string() const;
};

class ReportGenerator {
public:
    /// Build the report for `month` of `year`.
    ///
    /// # Errors
    /// `InvalidPeriod` when `month` is outside 1..12. Otherwise whatever the
    /// first failing sub-call raises; notably `NoProfileSet` when `profile`
    /// is empty.
    [[nodiscard]] static FinancialReport
    generate(const Ledger& ledger,
             const BudgetTracker& budget_tracker,
             const TaxEstimator& tax_estimator,
             const InvestmentAdvisor& advisor,
             const std::optional<InvestmentProfile>& profile,
             int year,
             unsigned month);
};

} // namespace pfe
