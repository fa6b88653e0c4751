/// @file src/core/data_store.cpp
/// @brief CSV persistence for FinanceBook.

#include "pfe/data_store.hpp"
#include "pfe/error.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <sstream>
#include <system_error>

namespace pfe {

namespace fs = std::filesystem;

namespace {

/// Trim trailing carriage return (Windows line endings).
void chomp(std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

[[nodiscard]] std::string join_row(std::initializer_list<std::string_view> fields) {
    std::string out;
    bool first = true;
    for (auto f : fields) {
        if (!first) out += ',';
        out += DataStore::escape_field(f);
        first = false;
    }
    out += '\n';
    return out;
}

}  // namespace

// ─── Field codec ──────────────────────────────────────────────────────────────

std::optional<std::vector<std::string>>
DataStore::split_line(std::string_view line) {
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            fields.push_back(std::move(field));
            field.clear();
        } else {
            field += c;
        }
    }

    if (in_quotes) {
        return std::nullopt;  // unterminated quote
    }
    fields.push_back(std::move(field));
    return fields;
}

std::string DataStore::escape_field(std::string_view field) {
    std::string flat(field);
    std::replace(flat.begin(), flat.end(), '\n', ' ');

    // A leading '#' would read back as a comment line, and a trailing '\r'
    // would be stripped as a line ending.
    const bool needs_quotes = flat.find_first_of(",\"\r") != std::string::npos ||
                              (!flat.empty() && flat.front() == '#');
    if (!needs_quotes) {
        return flat;
    }

    std::string out = "\"";
    for (char c : flat) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

// ─── Row iteration ────────────────────────────────────────────────────────────

template <typename RowFn>
ParseStats DataStore::for_each_row(const std::string& csv, RowFn&& row_fn) {
    ParseStats stats;
    std::istringstream stream(csv);
    std::string line;
    bool header_skipped = false;

    while (std::getline(stream, line)) {
        chomp(line);

        if (!header_skipped) {
            // First non-empty, non-comment line is the header.
            if (!line.empty() && line[0] != '#') {
                header_skipped = true;
            }
            continue;
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto fields = split_line(line);
        if (fields && row_fn(*fields)) {
            ++stats.loaded;
        } else {
            ++stats.skipped;
        }
    }
    return stats;
}

// ─── Parsers ──────────────────────────────────────────────────────────────────

ParseStats DataStore::parse_transactions(const std::string& csv, Ledger& ledger) {
    return for_each_row(csv, [&](const std::vector<std::string>& f) {
        if (f.size() != 5) return false;

        const auto date   = Date::parse(f[0]);
        const auto type   = parse_transaction_type(f[1]);
        const auto amount = parse_number(f[2]);
        if (!date || !type || !amount) return false;

        try {
            ledger.add_transaction(*amount, f[3], f[4], *type, *date);
        } catch (const FinanceError&) {
            return false;
        }
        return true;
    });
}

ParseStats DataStore::parse_budgets(const std::string& csv, BudgetTracker& budgets) {
    return for_each_row(csv, [&](const std::vector<std::string>& f) {
        if (f.size() != 2) return false;

        const auto amount = parse_number(f[1]);
        if (!amount) return false;

        try {
            budgets.set_budget(f[0], *amount);
        } catch (const FinanceError&) {
            return false;
        }
        return true;
    });
}

ParseStats DataStore::parse_profile(const std::string& csv,
                                    std::optional<InvestmentProfile>& profile) {
    // A later valid row replaces an earlier one; only one profile is active.
    return for_each_row(csv, [&](const std::vector<std::string>& f) {
        if (f.size() != 2) return false;

        try {
            profile = InvestmentProfile{
                .risk_tolerance = parse_risk_tolerance(f[0]),
                .goals          = f[1],
            };
        } catch (const FinanceError&) {
            return false;
        }
        return true;
    });
}

// ─── Serializers ──────────────────────────────────────────────────────────────

std::string DataStore::serialize_transactions(const Ledger& ledger) {
    std::string out = "date,type,amount,category,description\n";
    for (const auto& t : ledger.transactions()) {
        out += join_row({
            t.date.to_string(),
            to_string(t.type),
            fmt::format("{}", t.amount),
            t.category,
            t.description,
        });
    }
    return out;
}

std::string DataStore::serialize_budgets(const BudgetTracker& budgets) {
    std::string out = "category,limit\n";
    for (const auto& e : budgets.entries()) {
        out += join_row({e.category, fmt::format("{}", e.limit)});
    }
    return out;
}

std::string DataStore::serialize_profile(const std::optional<InvestmentProfile>& profile) {
    std::string out = "risk_tolerance,goals\n";
    if (profile) {
        out += join_row({to_string(profile->risk_tolerance), profile->goals});
    }
    return out;
}

// ─── File I/O ─────────────────────────────────────────────────────────────────

std::string DataStore::read_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return {};
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw FinanceError(ErrorKind::StorageError,
                           fmt::format("cannot open '{}' for reading", path.string()));
    }
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

void DataStore::write_file(const fs::path& path, const std::string& contents) {
    fs::path tmp = path;
    tmp += ".tmp";

    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) {
            throw FinanceError(ErrorKind::StorageError,
                               fmt::format("cannot open '{}' for writing", tmp.string()));
        }
        file << contents;
        file.flush();
        if (!file) {
            throw FinanceError(ErrorKind::StorageError,
                               fmt::format("write to '{}' failed", tmp.string()));
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        throw FinanceError(ErrorKind::StorageError,
                           fmt::format("cannot replace '{}': {}", path.string(), ec.message()));
    }
}

// ─── DataStore::load / save ───────────────────────────────────────────────────

LoadResult DataStore::load(const fs::path& dir) {
    LoadResult result;
    result.stats += parse_transactions(read_file(dir / TRANSACTIONS_FILE), result.book.ledger);
    result.stats += parse_budgets(read_file(dir / BUDGETS_FILE), result.book.budgets);
    result.stats += parse_profile(read_file(dir / PROFILE_FILE), result.book.profile);
    return result;
}

void DataStore::save(const FinanceBook& book, const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw FinanceError(ErrorKind::StorageError,
                           fmt::format("cannot create '{}': {}", dir.string(), ec.message()));
    }

    write_file(dir / TRANSACTIONS_FILE, serialize_transactions(book.ledger));
    write_file(dir / BUDGETS_FILE,      serialize_budgets(book.budgets));
    write_file(dir / PROFILE_FILE,      serialize_profile(book.profile));
}

}  // namespace pfe
