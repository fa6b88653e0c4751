#pragma once

/// @file include/pfe/tax.hpp
/// @brief TaxEstimator: progressive bracket tax with rule-based deductions.
///
/// # Module: Tax Estimator
///
/// ## Responsibility
/// Estimate the tax liability of an income figure and list the deductions
/// that were applied, plus plain-language tax hints drawn from the period's
/// expense categories.
///
/// ## Computation
/// 1. Each deduction rule whose predicate holds on the gross income reduces
///    the taxable income (never below zero). Rules run in definition order
///    and their descriptions are recorded in that order.
/// 2. The taxable income is split across the brackets: the slice falling in
///    [lower, upper) is taxed at that bracket's rate.
///
///     tax = Σ_b rate_b · max(0, min(taxable, upper_b) − lower_b)
///
/// ## Default Figures
/// Seven brackets from 10% to 37% and a 12,550 standard deduction (see
/// `pfe/constants.hpp`). They are illustrative only.
///
/// ## Guarantees
/// - Deterministic: identical income gives identical output
/// - With the default rule set, tax is non-decreasing in income
/// - `estimate(0)` is zero tax with no deductions

#include "pfe/constants.hpp"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace pfe {

/// One slice of a progressive schedule: income in [lower_bound, upper_bound)
/// is taxed at `rate`.
struct TaxBracket {
    double lower_bound;
    double upper_bound;  ///< May be `constants::UNBOUNDED`
    double rate;         ///< In [0, 1]
};

/// A deduction that applies when `applies(gross_income)` holds.
struct DeductionRule {
    std::string                  description;
    std::function<bool(double)>  applies;
    double                       reduction;
};

/// Result of `TaxEstimator::estimate`.
struct TaxEstimate {
    double                   gross_income;
    double                   taxable_income;      ///< After deductions
    double                   tax_amount;
    double                   effective_rate;      ///< tax / gross, 0 when gross is 0
    std::vector<std::string> deductions_applied;  ///< In rule order
};

/// Knobs for the tax hints produced by `TaxEstimator::advise`.
struct TaxConfig {
    /// Medical spend above this share of income is flagged as deductible.
    double medical_expense_floor = constants::MEDICAL_EXPENSE_FLOOR;
};

class TaxEstimator {
public:
    /// Construct with the default schedule and deduction rules.
    TaxEstimator();

    /// Construct with a custom schedule and rule set.
    ///
    /// # Errors
    /// `InvalidTaxSchedule` unless the brackets start at 0, are contiguous and
    /// ascending, end at +infinity and carry rates in [0, 1]; or if any rule
    /// has a negative reduction or no predicate.
    TaxEstimator(std::vector<TaxBracket> brackets,
                 std::vector<DeductionRule> rules,
                 TaxConfig config = TaxConfig{});

    /// Estimate tax on `taxable_income`.
    ///
    /// # Errors
    /// `InvalidAmount` if the income is negative or non-finite.
    [[nodiscard]] TaxEstimate estimate(double taxable_income) const;

    /// Tax hints for a period, keyed on expense categories such as
    /// `mortgage_interest`, `charitable_contributions`, `medical_expenses`,
    /// `child_care` and `education`.
    ///
    /// # Errors
    /// `InvalidAmount` if the income is negative or non-finite.
    [[nodiscard]] std::vector<std::string>
    advise(double income, const std::map<std::string, double>& expenses) const;

    [[nodiscard]] const std::vector<TaxBracket>& brackets() const noexcept { return brackets_; }
    [[nodiscard]] const std::vector<DeductionRule>& rules() const noexcept { return rules_; }

    /// The default seven-bracket schedule.
    [[nodiscard]] static std::vector<TaxBracket> default_brackets();

    /// Standard deduction followed by the low-income allowance.
    [[nodiscard]] static std::vector<DeductionRule> default_rules();

private:
    /// Progressive tax over the bracket schedule.
    [[nodiscard]] double bracket_tax(double taxable) const noexcept;

    std::vector<TaxBracket>    brackets_;
    std::vector<DeductionRule> rules_;
    TaxConfig                  config_;
};

} // namespace pfe
