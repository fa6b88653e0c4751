/// @file src/advisor/investment_advisor.cpp
/// @brief InvestmentAdvisor implementation and its recommendation table.

#include "pfe/advisor.hpp"
#include "pfe/error.hpp"

#include <fmt/format.h>

#include <utility>

namespace pfe {

namespace {

using TableKey = std::pair<RiskTolerance, SavingsBucket>;
using DecisionTable = std::map<TableKey, std::vector<std::string>>;

// ─── Recommendation table ─────────────────────────────────────────────────────

const DecisionTable& decision_table() {
    static const DecisionTable table{
        // ── Low risk ─────────────────────────────────────────────────────────
        {{RiskTolerance::Low, SavingsBucket::Deficit}, {
            "Your expenses exceed your income. Pause new investments until spending is back under control.",
            "Build an emergency fund in a high-yield savings account before investing.",
            "Review recurring expenses and cut non-essential spending.",
        }},
        {{RiskTolerance::Low, SavingsBucket::Low}, {
            "Focus on increasing your savings rate before making significant investments.",
            "Keep savings in a high-yield savings account or money market fund.",
        }},
        {{RiskTolerance::Low, SavingsBucket::Moderate}, {
            "Consider low-risk investments like high-yield savings accounts or government bonds.",
            "Certificates of deposit can lock in rates for money you will not need soon.",
        }},
        {{RiskTolerance::Low, SavingsBucket::High}, {
            "Consider low-risk investments like high-yield savings accounts or government bonds.",
            "A laddered portfolio of government bonds can provide steady income.",
            "Allocate a small share to a broad-market index fund for long-term growth.",
        }},

        // ── Medium risk ──────────────────────────────────────────────────────
        {{RiskTolerance::Medium, SavingsBucket::Deficit}, {
            "Your expenses exceed your income. Pause new investments until spending is back under control.",
            "Build an emergency fund covering three to six months of expenses.",
        }},
        {{RiskTolerance::Medium, SavingsBucket::Low}, {
            "Focus on increasing your savings rate before making significant investments.",
            "Start with small, regular contributions to a diversified index fund.",
        }},
        {{RiskTolerance::Medium, SavingsBucket::Moderate}, {
            "A balanced portfolio of stocks and bonds could be suitable for your risk tolerance.",
            "Automate monthly contributions to keep your allocation on track.",
        }},
        {{RiskTolerance::Medium, SavingsBucket::High}, {
            "A balanced portfolio of stocks and bonds could be suitable for your risk tolerance.",
            "Your savings rate leaves room to increase your equity allocation gradually.",
            "Rebalance annually to hold your target stock and bond mix.",
        }},

        // ── High risk ────────────────────────────────────────────────────────
        {{RiskTolerance::High, SavingsBucket::Deficit}, {
            "Your expenses exceed your income. Pause new investments until spending is back under control.",
            "Avoid leveraged or speculative positions while running a deficit.",
        }},
        {{RiskTolerance::High, SavingsBucket::Low}, {
            "Focus on increasing your savings rate before making significant investments.",
            "Limit speculative positions to a small share of your savings.",
        }},
        {{RiskTolerance::High, SavingsBucket::Moderate}, {
            "You might consider a stock-heavy portfolio or exploring alternative investments.",
            "Keep an emergency fund in cash before taking on concentrated positions.",
        }},
        {{RiskTolerance::High, SavingsBucket::High}, {
            "You might consider a stock-heavy portfolio or exploring alternative investments.",
            "Growth stocks and sector funds can fit a long investment horizon.",
            "Diversify across asset classes to manage the volatility you accept.",
        }},
    };
    return table;
}

}  // namespace

// ─── SavingsBucket ────────────────────────────────────────────────────────────

std::string_view to_string(SavingsBucket bucket) noexcept {
    switch (bucket) {
        case SavingsBucket::Deficit:  return "deficit";
        case SavingsBucket::Low:      return "low";
        case SavingsBucket::Moderate: return "moderate";
        case SavingsBucket::High:     return "high";
    }
    return "deficit";
}

// ─── InvestmentAdvisor ────────────────────────────────────────────────────────

InvestmentAdvisor::InvestmentAdvisor(AdvisorConfig config)
    : config_(std::move(config))
{}

double InvestmentAdvisor::savings_ratio(double total_income,
                                        double total_expenses) noexcept {
    if (total_income == 0.0) {
        return 0.0;
    }
    return (total_income - total_expenses) / total_income;
}

SavingsBucket InvestmentAdvisor::bucket_for(double ratio) noexcept {
    if (ratio < 0.0)                                  return SavingsBucket::Deficit;
    if (ratio < constants::LOW_BUCKET_CEILING)        return SavingsBucket::Low;
    if (ratio < constants::MODERATE_BUCKET_CEILING)   return SavingsBucket::Moderate;
    return SavingsBucket::High;
}

const std::vector<std::string>&
InvestmentAdvisor::recommendations_for(RiskTolerance risk, SavingsBucket bucket) {
    // Every (risk, bucket) pair has a row, so at() cannot miss.
    return decision_table().at({risk, bucket});
}

std::vector<std::string>
InvestmentAdvisor::recommend(const std::optional<InvestmentProfile>& profile,
                             double total_income,
                             double total_expenses) const {
    if (!profile) {
        throw FinanceError(ErrorKind::NoProfileSet,
                           "no investment profile set; run set_profile first");
    }

    const double ratio = savings_ratio(total_income, total_expenses);
    return recommendations_for(profile->risk_tolerance, bucket_for(ratio));
}

std::vector<std::string>
InvestmentAdvisor::goal_advice(const InvestmentProfile& profile) const {
    if (profile.goals == "retirement") {
        return {"For retirement, consider tax-advantaged accounts like 401(k)s or IRAs."};
    }
    if (profile.goals == "short_term") {
        return {"For short-term goals, focus on liquid and low-risk investments."};
    }
    return {};
}

std::vector<std::string>
InvestmentAdvisor::spending_advice(double total_income,
                                   double total_expenses,
                                   const std::map<std::string, double>& expenses_by_category) const {
    std::vector<std::string> advice;

    if (savings_ratio(total_income, total_expenses) < config_.savings_target) {
        advice.push_back(fmt::format(
            "Consider increasing your savings rate to at least {:.0f}% of income",
            config_.savings_target * 100.0));
    }

    const auto housing = expenses_by_category.find(config_.housing_category);
    if (housing != expenses_by_category.end() &&
        housing->second > total_income * config_.housing_share_limit) {
        advice.push_back(fmt::format(
            "Housing costs exceed {:.0f}% of income - consider ways to reduce housing expenses",
            config_.housing_share_limit * 100.0));
    }

    return advice;
}

}  // namespace pfe
