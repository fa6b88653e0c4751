#include <gtest/gtest.h>
#include "pfe/report.hpp"
#include "pfe/error.hpp"

#include <optional>
#include <string>

using namespace pfe;

// ─── Helpers ─────────────────────────────────────────────────────────────────

struct Fixture {
    Ledger            ledger;
    BudgetTracker     budgets;
    TaxEstimator      tax;
    InvestmentAdvisor advisor;
    std::optional<InvestmentProfile> profile;

    [[nodiscard]] FinancialReport report(int year = 2024, unsigned month = 3) const {
        return ReportGenerator::generate(ledger, budgets, tax, advisor, profile, year, month);
    }
};

/// Salary of 5000 and two rent payments totalling 3000 against a 2500 budget.
static Fixture rent_scenario() {
    Fixture f;
    f.ledger.add_transaction(5000.0, "Salary", "Monthly pay", TransactionType::Income,  Date{2024, 3, 1});
    f.ledger.add_transaction(2000.0, "rent",   "Rent",        TransactionType::Expense, Date{2024, 3, 2});
    f.ledger.add_transaction(1000.0, "rent",   "Parking",     TransactionType::Expense, Date{2024, 3, 9});
    f.budgets.set_budget("rent", 2500.0);
    f.profile = InvestmentProfile{.risk_tolerance = RiskTolerance::Medium, .goals = "retirement"};
    return f;
}

static bool has_line(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

// ─── generate ────────────────────────────────────────────────────────────────

TEST(ReportGenerator_Generate, RentOverBudget_TotalsAndStatus) {
    const auto r = rent_scenario().report();

    EXPECT_EQ(r.period, "2024-03");
    EXPECT_DOUBLE_EQ(r.total_income, 5000.0);
    EXPECT_DOUBLE_EQ(r.total_expenses, 3000.0);
    EXPECT_DOUBLE_EQ(r.net, 2000.0);
    EXPECT_DOUBLE_EQ(r.savings_rate, 40.0);

    ASSERT_EQ(r.budget_statuses.size(), 1u);
    EXPECT_EQ(r.budget_statuses[0].category, "rent");
    EXPECT_DOUBLE_EQ(r.budget_statuses[0].spent, 3000.0);
    EXPECT_DOUBLE_EQ(r.budget_statuses[0].remaining, -500.0);
    EXPECT_TRUE(r.budget_statuses[0].over_budget);
}

TEST(ReportGenerator_Generate, SectionsComeFromComponents) {
    const Fixture f = rent_scenario();
    const auto r = f.report();

    EXPECT_EQ(r.tax_estimate.tax_amount, f.tax.estimate(5000.0).tax_amount);
    EXPECT_EQ(r.recommendations, f.advisor.recommend(f.profile, 5000.0, 3000.0));
    EXPECT_EQ(r.goal_advice, f.advisor.goal_advice(*f.profile));
    EXPECT_TRUE(r.spending_advice.empty());
    ASSERT_EQ(r.spending_by_category.size(), 2u);
    EXPECT_EQ(r.spending_by_category[0].category, "Salary");
    EXPECT_EQ(r.spending_by_category[1].category, "rent");
    EXPECT_EQ(r.spending_by_category[1].count, 2u);
}

TEST(ReportGenerator_Generate, EmptyPeriod_ZeroTotals) {
    const auto r = rent_scenario().report(2024, 7);
    EXPECT_EQ(r.period, "2024-07");
    EXPECT_DOUBLE_EQ(r.total_income, 0.0);
    EXPECT_DOUBLE_EQ(r.total_expenses, 0.0);
    EXPECT_DOUBLE_EQ(r.savings_rate, 0.0);
    EXPECT_DOUBLE_EQ(r.tax_estimate.tax_amount, 0.0);
    ASSERT_EQ(r.budget_statuses.size(), 1u);
    EXPECT_DOUBLE_EQ(r.budget_statuses[0].remaining, 2500.0);
}

TEST(ReportGenerator_Generate, NoProfile_NoProfileSet) {
    Fixture f = rent_scenario();
    f.profile.reset();
    try {
        (void)f.report();
        FAIL() << "expected NoProfileSet";
    } catch (const FinanceError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NoProfileSet);
    }
}

TEST(ReportGenerator_Generate, MonthOutOfRange_InvalidPeriod) {
    const Fixture f = rent_scenario();
    for (unsigned month : {0u, 13u}) {
        try {
            (void)f.report(2024, month);
            FAIL() << "expected InvalidPeriod for month " << month;
        } catch (const FinanceError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::InvalidPeriod);
        }
    }
}

TEST(ReportGenerator_Generate, Deficit_LowRiskRow) {
    Fixture f;
    f.ledger.add_transaction(1000.0, "Salary", "", TransactionType::Income,  Date{2024, 3, 1});
    f.ledger.add_transaction(1050.0, "Food",   "", TransactionType::Expense, Date{2024, 3, 2});
    f.profile = InvestmentProfile{.risk_tolerance = RiskTolerance::Low, .goals = "retirement"};

    const auto r = f.report();
    EXPECT_DOUBLE_EQ(r.net, -50.0);
    EXPECT_EQ(r.recommendations,
              InvestmentAdvisor::recommendations_for(RiskTolerance::Low, SavingsBucket::Deficit));
    ASSERT_EQ(r.spending_advice.size(), 1u);
}

// ─── to_string ───────────────────────────────────────────────────────────────

TEST(FinancialReport_ToString, ContainsHeadlineFigures) {
    const auto text = rent_scenario().report().to_string();
    EXPECT_TRUE(has_line(text, "Period: 2024-03"));
    EXPECT_TRUE(has_line(text, "Total Income: $5,000.00"));
    EXPECT_TRUE(has_line(text, "Total Expenses: $3,000.00"));
    EXPECT_TRUE(has_line(text, "Net Income: $2,000.00"));
    EXPECT_TRUE(has_line(text, "Savings Rate: 40.0%"));
}

TEST(FinancialReport_ToString, BudgetSectionShowsOverspend) {
    const auto text = rent_scenario().report().to_string();
    EXPECT_TRUE(has_line(text, "rent:  (over budget)"));
    EXPECT_TRUE(has_line(text, "Remaining: -$500.00"));
    EXPECT_TRUE(has_line(text, "Used: 120.0%"));
}

TEST(FinancialReport_ToString, AdviceSectionsListed) {
    const auto text = rent_scenario().report().to_string();
    EXPECT_TRUE(has_line(text, "Recommendations:"));
    EXPECT_TRUE(has_line(text, "Goals:"));
    EXPECT_TRUE(has_line(text, "Tax Advice:"));
    EXPECT_FALSE(has_line(text, "Spending:\n"));
}
