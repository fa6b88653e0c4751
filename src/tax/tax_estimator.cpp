/// @file src/tax/tax_estimator.cpp
/// @brief TaxEstimator implementation.

#include "pfe/tax.hpp"
#include "pfe/error.hpp"
#include "pfe/ledger.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace pfe {

namespace {

[[noreturn]] void bad_schedule(const std::string& why) {
    throw FinanceError(ErrorKind::InvalidTaxSchedule, "invalid tax schedule: " + why);
}

void validate_schedule(const std::vector<TaxBracket>& brackets) {
    if (brackets.empty()) {
        bad_schedule("no brackets");
    }
    if (brackets.front().lower_bound != 0.0) {
        bad_schedule("first bracket must start at 0");
    }
    if (!std::isinf(brackets.back().upper_bound) || brackets.back().upper_bound < 0.0) {
        bad_schedule("last bracket must be unbounded");
    }

    for (std::size_t i = 0; i < brackets.size(); ++i) {
        const auto& b = brackets[i];
        if (!std::isfinite(b.rate) || b.rate < 0.0 || b.rate > 1.0) {
            bad_schedule(fmt::format("bracket {} rate {} outside [0, 1]", i, b.rate));
        }
        if (!std::isfinite(b.lower_bound) || !(b.upper_bound > b.lower_bound)) {
            bad_schedule(fmt::format("bracket {} is empty or inverted", i));
        }
        if (i > 0 && b.lower_bound != brackets[i - 1].upper_bound) {
            bad_schedule(fmt::format("gap or overlap between brackets {} and {}", i - 1, i));
        }
    }
}

void validate_rules(const std::vector<DeductionRule>& rules) {
    for (const auto& r : rules) {
        if (!r.applies) {
            bad_schedule(fmt::format("deduction '{}' has no predicate", r.description));
        }
        if (!std::isfinite(r.reduction) || r.reduction < 0.0) {
            bad_schedule(fmt::format("deduction '{}' has a negative reduction", r.description));
        }
    }
}

[[nodiscard]] double expense_for(const std::map<std::string, double>& expenses,
                                 const std::string& category) {
    const auto it = expenses.find(category);
    return it != expenses.end() ? it->second : 0.0;
}

}  // namespace

// ─── Construction ─────────────────────────────────────────────────────────────

TaxEstimator::TaxEstimator()
    : TaxEstimator(default_brackets(), default_rules())
{}

TaxEstimator::TaxEstimator(std::vector<TaxBracket> brackets,
                           std::vector<DeductionRule> rules,
                           TaxConfig config)
    : brackets_(std::move(brackets))
    , rules_(std::move(rules))
    , config_(config)
{
    validate_schedule(brackets_);
    validate_rules(rules_);
}

std::vector<TaxBracket> TaxEstimator::default_brackets() {
    std::vector<TaxBracket> out;
    out.reserve(constants::TAX_BRACKET_COUNT);
    for (std::size_t i = 0; i < constants::TAX_BRACKET_COUNT; ++i) {
        out.push_back(TaxBracket{
            .lower_bound = constants::TAX_BRACKET_BOUNDS[i],
            .upper_bound = constants::TAX_BRACKET_BOUNDS[i + 1],
            .rate        = constants::TAX_BRACKET_RATES[i],
        });
    }
    return out;
}

std::vector<DeductionRule> TaxEstimator::default_rules() {
    return {
        DeductionRule{
            .description = "Standard deduction (single filer)",
            .applies     = [](double income) { return income > 0.0; },
            .reduction   = constants::STANDARD_DEDUCTION,
        },
        // Phases out above the threshold, so it never lowers tax as income grows.
        DeductionRule{
            .description = "Low-income earner allowance",
            .applies     = [](double income) {
                return income > 0.0 && income < constants::LOW_INCOME_THRESHOLD;
            },
            .reduction   = constants::LOW_INCOME_ALLOWANCE,
        },
    };
}

// ─── TaxEstimator::estimate ───────────────────────────────────────────────────

TaxEstimate TaxEstimator::estimate(double taxable_income) const {
    require_valid_amount(taxable_income);

    TaxEstimate out{
        .gross_income       = taxable_income,
        .taxable_income     = taxable_income,
        .tax_amount         = 0.0,
        .effective_rate     = 0.0,
        .deductions_applied = {},
    };

    for (const auto& rule : rules_) {
        if (rule.applies(taxable_income)) {
            out.taxable_income = std::max(0.0, out.taxable_income - rule.reduction);
            out.deductions_applied.push_back(rule.description);
        }
    }

    out.tax_amount = bracket_tax(out.taxable_income);
    if (taxable_income > 0.0) {
        out.effective_rate = out.tax_amount / taxable_income;
    }
    return out;
}

double TaxEstimator::bracket_tax(double taxable) const noexcept {
    double tax = 0.0;
    for (const auto& b : brackets_) {
        if (taxable <= b.lower_bound) break;
        tax += (std::min(taxable, b.upper_bound) - b.lower_bound) * b.rate;
    }
    return tax;
}

// ─── TaxEstimator::advise ─────────────────────────────────────────────────────

std::vector<std::string>
TaxEstimator::advise(double income, const std::map<std::string, double>& expenses) const {
    const TaxEstimate est = estimate(income);

    std::vector<std::string> advice;
    advice.push_back(fmt::format(
        "Based on your income of ${:.2f}, your estimated tax liability is ${:.2f}.",
        income, est.tax_amount));

    if (income > 0.0) {
        advice.push_back(fmt::format(
            "Your effective tax rate is approximately {:.2f}%.", est.effective_rate * 100.0));
    }

    if (expense_for(expenses, "mortgage_interest") > 0.0) {
        advice.emplace_back("You may be eligible for the mortgage interest deduction.");
    }
    if (expense_for(expenses, "charitable_contributions") > 0.0) {
        advice.emplace_back("Don't forget to claim your charitable contributions as deductions.");
    }
    if (expense_for(expenses, "medical_expenses") > config_.medical_expense_floor * income) {
        advice.push_back(fmt::format(
            "You may be eligible to deduct medical expenses exceeding {:.1f}% of your income.",
            config_.medical_expense_floor * 100.0));
    }
    if (expense_for(expenses, "child_care") > 0.0) {
        advice.emplace_back("Look into the Child and Dependent Care Credit.");
    }
    if (expense_for(expenses, "education") > 0.0) {
        advice.emplace_back(
            "You might be eligible for education-related tax credits like the "
            "American Opportunity Credit or Lifetime Learning Credit.");
    }

    advice.emplace_back("Keep all receipts and documentation for your deductions and credits.");
    advice.emplace_back("The deadline for filing your tax return is April 15th. Mark your calendar!");
    return advice;
}

}  // namespace pfe
