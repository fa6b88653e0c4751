#pragma once

/// @file include/pfe/data_store.hpp
/// @brief CSV persistence for a FinanceBook.
///
/// # Module: DataStore
///
/// ## Responsibility
/// Save a FinanceBook to a directory of CSV files and load it back. Loading
/// replays every row through the core operations, so a loaded book obeys
/// the same invariants as one built in memory.
///
/// ## Files
/// ```
/// transactions.csv   date,type,amount,category,description
/// budgets.csv        category,limit
/// profile.csv        risk_tolerance,goals
/// ```
/// The first line of each file is a header and is skipped, as are blank
/// lines and lines starting with '#'. Fields holding a comma, quote or
/// carriage return, or starting with '#', are wrapped in double quotes with
/// inner quotes doubled. Line feeds inside a field are written as spaces.
///
/// ## Guarantees
/// - Malformed rows are skipped and counted; the load itself does not fail
/// - A missing directory or file loads as empty
/// - Saving writes each file to a temporary name first, then renames it
/// - Unreadable or unwritable files raise `FinanceError(StorageError)`

#include "pfe/book.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pfe {

/// Row counts from one parse.
struct ParseStats {
    std::size_t loaded  = 0;
    std::size_t skipped = 0;

    ParseStats& operator+=(const ParseStats& other) noexcept {
        loaded  += other.loaded;
        skipped += other.skipped;
        return *this;
    }
};

/// A loaded book plus what was dropped on the way in.
struct LoadResult {
    FinanceBook book;
    ParseStats  stats;
};

class DataStore {
public:
    static constexpr const char* TRANSACTIONS_FILE = "transactions.csv";
    static constexpr const char* BUDGETS_FILE      = "budgets.csv";
    static constexpr const char* PROFILE_FILE      = "profile.csv";

    /// Load the book stored in `dir`.
    [[nodiscard]] static LoadResult load(const std::filesystem::path& dir);

    /// Write `book` into `dir`, creating the directory if needed.
    static void save(const FinanceBook& book, const std::filesystem::path& dir);

    // ── String-level codecs (used by load/save, exposed for tests) ────────────

    static ParseStats parse_transactions(const std::string& csv, Ledger& ledger);
    static ParseStats parse_budgets(const std::string& csv, BudgetTracker& budgets);
    static ParseStats parse_profile(const std::string& csv,
                                    std::optional<InvestmentProfile>& profile);

    [[nodiscard]] static std::string serialize_transactions(const Ledger& ledger);
    [[nodiscard]] static std::string serialize_budgets(const BudgetTracker& budgets);
    [[nodiscard]] static std::string
    serialize_profile(const std::optional<InvestmentProfile>& profile);

    /// Split one CSV line into fields, honouring double-quoted fields.
    /// Returns `nullopt` on an unterminated quote.
    [[nodiscard]] static std::optional<std::vector<std::string>>
    split_line(std::string_view line);

    /// Quote `field` if it holds a comma, quote or carriage return, or starts
    /// with '#'. Line feeds become spaces.
    [[nodiscard]] static std::string escape_field(std::string_view field);

private:
    /// Feed every data row (header skipped) of `csv` to `row_fn`.
    /// `row_fn` returns true when the row was accepted.
    template <typename RowFn>
    static ParseStats for_each_row(const std::string& csv, RowFn&& row_fn);

    [[nodiscard]] static std::string read_file(const std::filesystem::path& path);
    static void write_file(const std::filesystem::path& path, const std::string& contents);
};

} // namespace pfe
