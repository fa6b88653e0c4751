#pragma once

/// @file include/pfe/book.hpp
/// @brief FinanceBook: the mutable state one user works against.
///
/// Bundles the two mutable stores with the active investment profile. The
/// profile lives here rather than in a global so callers pass it explicitly
/// to `InvestmentAdvisor::recommend`.

#include "pfe/budget.hpp"
#include "pfe/ledger.hpp"
#include "pfe/types.hpp"

#include <optional>
#include <utility>

namespace pfe {

struct FinanceBook {
    Ledger                           ledger;
    BudgetTracker                    budgets;
    std::optional<InvestmentProfile> profile;  ///< At most one active profile

    /// Replace the active profile.
    void set_profile(InvestmentProfile p) { profile = std::move(p); }
};

} // namespace pfe
