/// @file src/report/report_generator.cpp
/// @brief ReportGenerator and FinancialReport rendering.

#include "pfe/report.hpp"
#include "pfe/error.hpp"

#include <fmt/format.h>

#include <cmath>
#include <cstddef>
#include <iterator>

namespace pfe {

namespace {

/// "$1,234.50" / "-$500.00".
[[nodiscard]] std::string money(double amount) {
    std::string digits = fmt::format("{:.2f}", std::abs(amount));
    const auto dot = digits.find('.');
    for (auto i = static_cast<std::ptrdiff_t>(dot) - 3; i > 0; i -= 3) {
        digits.insert(static_cast<std::size_t>(i), 1, ',');
    }
    return (amount < 0.0 ? "-$" : "$") + digits;
}

void append_list(std::string& out, const char* heading,
                 const std::vector<std::string>& lines) {
    if (lines.empty()) return;
    fmt::format_to(std::back_inserter(out), "\n{}:\n", heading);
    for (const auto& line : lines) {
        fmt::format_to(std::back_inserter(out), "- {}\n", line);
    }
}

}  // namespace

// ─── ReportGenerator::generate ────────────────────────────────────────────────

FinancialReport
ReportGenerator::generate(const Ledger& ledger,
                          const BudgetTracker& budget_tracker,
                          const TaxEstimator& tax_estimator,
                          const InvestmentAdvisor& advisor,
                          const std::optional<InvestmentProfile>& profile,
                          int year,
                          unsigned month) {
    if (month < 1 || month > 12) {
        throw FinanceError(ErrorKind::InvalidPeriod,
                           fmt::format("month {} outside 1..12", month));
    }

    const double income   = ledger.total_income(year, month);
    const double expenses = ledger.total_expenses(year, month);

    auto statuses        = budget_tracker.status(ledger, year, month);
    auto tax             = tax_estimator.estimate(income);
    auto recommendations = advisor.recommend(profile, income, expenses);

    // The remaining sections only run once every required step succeeded.
    const auto by_category = ledger.expenses_by_category(year, month);

    return FinancialReport{
        .period               = fmt::format("{:04d}-{:02d}", year, month),
        .year                 = year,
        .month                = month,
        .total_income         = income,
        .total_expenses       = expenses,
        .net                  = income - expenses,
        .savings_rate         = InvestmentAdvisor::savings_ratio(income, expenses) * 100.0,
        .spending_by_category = ledger.spending_by_category(year, month),
        .budget_statuses      = std::move(statuses),
        .tax_estimate         = std::move(tax),
        .tax_advice           = tax_estimator.advise(income, by_category),
        .recommendations      = std::move(recommendations),
        .spending_advice      = advisor.spending_advice(income, expenses, by_category),
        .goal_advice          = advisor.goal_advice(*profile),
    };
}

// ─── FinancialReport::to_string ───────────────────────────────────────────────

std::string FinancialReport::to_string() const {
    std::string out;
    auto it = std::back_inserter(out);

    fmt::format_to(it, "Financial Report\n{}\n", std::string(50, '-'));
    fmt::format_to(it, "Period: {}\n", period);

    fmt::format_to(it, "\nIncome Summary:\n");
    fmt::format_to(it, "Total Income: {}\n",   money(total_income));
    fmt::format_to(it, "Total Expenses: {}\n", money(total_expenses));
    fmt::format_to(it, "Net Income: {}\n",     money(net));
    fmt::format_to(it, "Savings Rate: {:.1f}%\n", savings_rate);

    if (!spending_by_category.empty()) {
        fmt::format_to(it, "\nSpending by Category:\n");
        for (const auto& c : spending_by_category) {
            fmt::format_to(it, "  {:<26} {:>14}  ({} transaction{})\n",
                           c.category, money(c.total), c.count, c.count == 1 ? "" : "s");
        }
    }

    if (!budget_statuses.empty()) {
        fmt::format_to(it, "\nBudget Status:\n");
        for (const auto& b : budget_statuses) {
            fmt::format_to(it, "\n{}:{}\n", b.category, b.over_budget ? "  (over budget)" : "");
            fmt::format_to(it, "  Budget: {}\n",    money(b.limit));
            fmt::format_to(it, "  Spent: {}\n",     money(b.spent));
            fmt::format_to(it, "  Remaining: {}\n", money(b.remaining));
            fmt::format_to(it, "  Used: {:.1f}%\n", b.percent_used);
        }
    }

    fmt::format_to(it, "\nTax Estimate:\n");
    fmt::format_to(it, "  Taxable Income: {}\n", money(tax_estimate.taxable_income));
    fmt::format_to(it, "  Estimated Tax: {}\n",  money(tax_estimate.tax_amount));
    for (const auto& d : tax_estimate.deductions_applied) {
        fmt::format_to(it, "  Deduction applied: {}\n", d);
    }

    append_list(out, "Recommendations", recommendations);
    append_list(out, "Goals", goal_advice);
    append_list(out, "Spending", spending_advice);
    append_list(out, "Tax Advice", tax_advice);
    return out;
}

}  // namespace pfe
