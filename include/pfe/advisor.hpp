#pragma once

/// @file include/pfe/advisor.hpp
/// @brief InvestmentAdvisor: rule-based recommendations from a risk profile.
///
/// # Module: Investment Advisor
///
/// ## Responsibility
/// Map a (risk tolerance, savings bucket) pair to a fixed, ordered list of
/// recommendations. The mapping is a data table, not branching logic.
///
/// ## Savings Ratio
///   ratio = (income − expenses) / income      (0 when income is 0)
///
///   ratio < 0           → Deficit
///   0    ≤ ratio < 0.1  → Low
///   0.1  ≤ ratio < 0.3  → Moderate
///   ratio ≥ 0.3         → High
///
/// ## Guarantees
/// - Deterministic: identical inputs give identical output, in table order
/// - Stateless: the profile is passed in, never stored

#include "pfe/constants.hpp"
#include "pfe/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pfe {

enum class SavingsBucket {
    Deficit,
    Low,
    Moderate,
    High,
};

[[nodiscard]] std::string_view to_string(SavingsBucket bucket) noexcept;

/// Thresholds for the spending advice attached to a report.
struct AdvisorConfig {
    /// Savings rate (fraction of income) below which the report nudges.
    double savings_target = constants::DEFAULT_SAVINGS_TARGET;

    /// Housing spend above this share of income triggers a warning.
    double housing_share_limit = constants::DEFAULT_HOUSING_SHARE_LIMIT;

    /// Category counted as housing.
    std::string housing_category = constants::DEFAULT_HOUSING_CATEGORY;
};

class InvestmentAdvisor {
public:
    explicit InvestmentAdvisor(AdvisorConfig config = AdvisorConfig{});

    /// Recommendations for the profile's risk tolerance and the period's
    /// savings bucket.
    ///
    /// # Errors
    /// `NoProfileSet` if `profile` is empty.
    [[nodiscard]] std::vector<std::string>
    recommend(const std::optional<InvestmentProfile>& profile,
              double total_income,
              double total_expenses) const;

    /// Guidance keyed on the profile's goals ("retirement", "short_term").
    /// Empty for other goals.
    [[nodiscard]] std::vector<std::string>
    goal_advice(const InvestmentProfile& profile) const;

    /// Savings-rate and housing-cost warnings for a period.
    [[nodiscard]] std::vector<std::string>
    spending_advice(double total_income,
                    double total_expenses,
                    const std::map<std::string, double>& expenses_by_category) const;

    /// (income − expenses) / income, or 0 when income is 0.
    [[nodiscard]] static double savings_ratio(double total_income,
                                              double total_expenses) noexcept;

    [[nodiscard]] static SavingsBucket bucket_for(double ratio) noexcept;

    /// The table row for one (risk, bucket) pair.
    [[nodiscard]] static const std::vector<std::string>&
    recommendations_for(RiskTolerance risk, SavingsBucket bucket);

    [[nodiscard]] const AdvisorConfig& config() const noexcept { return config_; }

private:
    AdvisorConfig config_;
};

} // namespace pfe
