/**
 * @file  bench/bench_ledger.cpp
 * @brief Google Benchmark suite for the ledger queries and report pipeline.
 *
 * Benchmarks
 * ----------
 *   BM_Ledger_TotalExpenses      - period filter + sum over N transactions
 *   BM_Ledger_SpendingByCategory - grouped totals over N transactions
 *   BM_BudgetTracker_Status      - status rows for 10 budgets
 *   BM_Report_Generate           - full report for one month
 *   BM_DataStore_ParseTransactions - CSV parse of N rows
 *
 * Build (CMake):
 *   cmake -DPFE_BENCH=ON ..
 *   cmake --build build --target bench_ledger
 *   ./build/bench_ledger --benchmark_format=json
 *
 * Throughput units: items/second (transactions processed).
 */

#include "benchmark/benchmark.h"

#include "pfe/data_store.hpp"
#include "pfe/report.hpp"

#include <array>
#include <cstddef>
#include <string>

using namespace pfe;

// ── Fixture helpers ────────────────────────────────────────────────────────────

static constexpr std::array<const char*, 10> CATEGORIES{
    "Housing", "Food", "Transportation", "Utilities", "Insurance",
    "Healthcare", "Entertainment", "Education", "Savings", "Other"};

/// N transactions spread over twelve months of 2024, one salary per month.
static FinanceBook make_book(std::size_t n) {
    FinanceBook book;
    for (unsigned m = 1; m <= 12; ++m) {
        book.ledger.add_transaction(5000.0, "Income", "Salary", TransactionType::Income,
                                    Date{2024, m, 1});
    }
    for (std::size_t i = 0; i < n; ++i) {
        book.ledger.add_transaction(
            static_cast<double>(i % 500) + 0.99,
            CATEGORIES[i % CATEGORIES.size()],
            "bench",
            TransactionType::Expense,
            Date{2024, static_cast<unsigned>(i % 12) + 1, static_cast<unsigned>(i % 28) + 1});
    }
    for (const char* c : CATEGORIES) {
        book.budgets.set_budget(c, 400.0);
    }
    book.set_profile(InvestmentProfile{.risk_tolerance = RiskTolerance::Medium,
                                       .goals          = "retirement"});
    return book;
}

// ── Ledger ─────────────────────────────────────────────────────────────────────

static void BM_Ledger_TotalExpenses(benchmark::State& state) {
    const auto book = make_book(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        benchmark::DoNotOptimize(book.ledger.total_expenses(2024, 6));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Ledger_TotalExpenses)->RangeMultiplier(10)->Range(100, 100'000);

static void BM_Ledger_SpendingByCategory(benchmark::State& state) {
    const auto book = make_book(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto rows = book.ledger.spending_by_category(2024, 6);
        benchmark::DoNotOptimize(rows.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Ledger_SpendingByCategory)->RangeMultiplier(10)->Range(100, 100'000);

// ── Budget / report ────────────────────────────────────────────────────────────

static void BM_BudgetTracker_Status(benchmark::State& state) {
    const auto book = make_book(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto rows = book.budgets.status(book.ledger, 2024, 6);
        benchmark::DoNotOptimize(rows.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_BudgetTracker_Status)->Arg(10'000);

static void BM_Report_Generate(benchmark::State& state) {
    const auto book = make_book(static_cast<std::size_t>(state.range(0)));
    const TaxEstimator      tax;
    const InvestmentAdvisor advisor;
    for (auto _ : state) {
        auto report = ReportGenerator::generate(book.ledger, book.budgets, tax, advisor,
                                                book.profile, 2024, 6);
        benchmark::DoNotOptimize(report.net);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Report_Generate)->Arg(1'000)->Arg(10'000);

// ── Persistence ────────────────────────────────────────────────────────────────

static void BM_DataStore_ParseTransactions(benchmark::State& state) {
    const auto book = make_book(static_cast<std::size_t>(state.range(0)));
    const std::string csv = DataStore::serialize_transactions(book.ledger);
    for (auto _ : state) {
        Ledger ledger;
        benchmark::DoNotOptimize(DataStore::parse_transactions(csv, ledger));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
    state.counters["bytes"] = static_cast<double>(csv.size());
}
BENCHMARK(BM_DataStore_ParseTransactions)->Arg(10'000);

BENCHMARK_MAIN();
