#pragma once

#include <cstddef>
#include <limits>

/// @file include/pfe/constants.hpp
/// @brief Reference figures for the Personal Finance Engine (PFE).
///
/// Tax figures are illustrative (2021 US single filer) and make no claim to
/// jurisdictional accuracy.

namespace pfe::constants {

// ─── Tax Schedule ─────────────────────────────────────────────────────────────

/// Upper bound of the top bracket.
static constexpr double UNBOUNDED = std::numeric_limits<double>::infinity();

/// Bracket boundaries of the default progressive schedule, ascending.
/// Bracket i covers [TAX_BRACKET_BOUNDS[i], TAX_BRACKET_BOUNDS[i + 1]).
static constexpr double TAX_BRACKET_BOUNDS[] = {
    0.0, 9'950.0, 40'525.0, 86'375.0, 164'925.0, 209'425.0, 523'600.0, UNBOUNDED,
};

/// Marginal rate of each default bracket.
static constexpr double TAX_BRACKET_RATES[] = {
    0.10, 0.12, 0.22, 0.24, 0.32, 0.35, 0.37,
};

static constexpr std::size_t TAX_BRACKET_COUNT =
    sizeof(TAX_BRACKET_RATES) / sizeof(TAX_BRACKET_RATES[0]);

/// Standard deduction applied to any positive income.
static constexpr double STANDARD_DEDUCTION = 12'550.0;

/// Gross income below which the low-income allowance applies.
static constexpr double LOW_INCOME_THRESHOLD = 40'000.0;

/// Extra reduction for incomes under LOW_INCOME_THRESHOLD.
static constexpr double LOW_INCOME_ALLOWANCE = 2'000.0;

/// Medical expenses above this share of income are flagged as deductible.
static constexpr double MEDICAL_EXPENSE_FLOOR = 0.075;

// ─── Savings Buckets ──────────────────────────────────────────────────────────

/// Savings ratio at or above which the bucket is "moderate".
static constexpr double LOW_BUCKET_CEILING = 0.10;

/// Savings ratio at or above which the bucket is "high".
static constexpr double MODERATE_BUCKET_CEILING = 0.30;

// ─── Report Defaults ──────────────────────────────────────────────────────────

/// Savings rate (fraction of income) the report nudges towards.
static constexpr double DEFAULT_SAVINGS_TARGET = 0.20;

/// Housing spend above this share of income triggers a warning.
static constexpr double DEFAULT_HOUSING_SHARE_LIMIT = 0.30;

/// Category name treated as housing.
static constexpr const char* DEFAULT_HOUSING_CATEGORY = "Housing";

// ─── Storage ──────────────────────────────────────────────────────────────────

/// Default data directory when neither flag nor environment names one.
static constexpr const char* DEFAULT_DATA_DIR = "financial_data";

/// Environment variable consulted for the data directory.
static constexpr const char* DATA_DIR_ENV = "PFE_DATA_DIR";

} // namespace pfe::constants
