/**
 * @file  fuzz_data_store.cpp
 * @brief libFuzzer target for the DataStore CSV parsers
 *
 * Build:
 *   cmake -DPFE_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_store
 *
 * Run for 60 seconds:
 *   ./fuzz_data_store -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no exception escapes the parsers.
 *   2. loaded + skipped never exceeds the number of input lines.
 *   3. Every loaded transaction has a non-negative finite amount, a
 *      non-empty category and a valid date.
 *   4. Re-serializing the loaded ledger or budgets and parsing them again
 *      reproduces them.
 *
 * Fuzzer strategy:
 *   The same bytes are fed to all three parsers, so header handling,
 *   quoting and per-row validation are all exercised with binary garbage,
 *   unterminated quotes, CR/LF mixes and numeric edge cases.
 */

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

#include "pfe/data_store.hpp"

using namespace pfe;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input(reinterpret_cast<const char*>(data), size);
    const auto lines = static_cast<std::size_t>(std::count(input.begin(), input.end(), '\n')) + 1;

    Ledger ledger;
    const auto tx_stats = DataStore::parse_transactions(input, ledger);
    assert(tx_stats.loaded + tx_stats.skipped <= lines);
    assert(tx_stats.loaded == ledger.size());

    for (const auto& t : ledger.transactions()) {
        assert(std::isfinite(t.amount) && t.amount >= 0.0);
        assert(!t.category.empty());
        assert(t.date.valid());
    }

    Ledger again;
    const auto again_stats =
        DataStore::parse_transactions(DataStore::serialize_transactions(ledger), again);
    assert(again_stats.skipped == 0);
    assert(again.size() == ledger.size());
    for (std::size_t i = 0; i < ledger.size(); ++i) {
        assert(again.transactions()[i] == ledger.transactions()[i]);
    }

    BudgetTracker budgets;
    const auto budget_stats = DataStore::parse_budgets(input, budgets);
    assert(budget_stats.loaded + budget_stats.skipped <= lines);
    for (const auto& e : budgets.entries()) {
        assert(std::isfinite(e.limit) && e.limit >= 0.0);
    }

    BudgetTracker budgets_again;
    const auto budgets_again_stats =
        DataStore::parse_budgets(DataStore::serialize_budgets(budgets), budgets_again);
    assert(budgets_again_stats.skipped == 0);
    assert(budgets_again.size() == budgets.size());
    for (const auto& e : budgets.entries()) {
        assert(budgets_again.limit(e.category) == e.limit);
    }

    std::optional<InvestmentProfile> profile;
    (void)DataStore::parse_profile(input, profile);

    return 0;
}
