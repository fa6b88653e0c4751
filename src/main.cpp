/// @file src/main.cpp
/// @brief PFE CLI entry point.
///
/// Usage:
///   pfe [--data-dir DIR] [--verbose] report YEAR MONTH
///   pfe [--data-dir DIR] add_transaction AMOUNT CATEGORY DESCRIPTION [income|expense] [YYYY-MM-DD]
///   pfe [--data-dir DIR] set_budget CATEGORY AMOUNT
///   pfe [--data-dir DIR] set_profile low|medium|high GOALS
///   pfe help
///
/// Exit codes: 0 success, 1 rejected input or storage failure, 2 usage error.

#include "pfe/advisor.hpp"
#include "pfe/book.hpp"
#include "pfe/command.hpp"
#include "pfe/constants.hpp"
#include "pfe/data_store.hpp"
#include "pfe/error.hpp"
#include "pfe/report.hpp"
#include "pfe/tax.hpp"

#include <fmt/core.h>

#include <cstdlib>
#include <filesystem>
#include <string>
#include <variant>
#include <vector>

namespace {

/// Settings resolved from flags and environment.
struct CliConfig {
    std::filesystem::path data_dir = pfe::constants::DEFAULT_DATA_DIR;
    bool                  verbose  = false;
};

/// Executes one parsed command against a loaded book.
/// Returns true when the book changed and must be saved.
class Dispatcher {
public:
    explicit Dispatcher(pfe::FinanceBook& book) : book_(book) {}

    bool operator()(const pfe::cli::ReportCommand& cmd) const {
        const pfe::TaxEstimator      tax;
        const pfe::InvestmentAdvisor advisor;
        const auto report = pfe::ReportGenerator::generate(
            book_.ledger, book_.budgets, tax, advisor, book_.profile, cmd.year, cmd.month);
        fmt::print("{}", report.to_string());
        return false;
    }

    bool operator()(const pfe::cli::AddTransactionCommand& cmd) const {
        const pfe::Date date = cmd.date.value_or(pfe::Date::today());
        book_.ledger.add_transaction(cmd.amount, cmd.category, cmd.description, cmd.type, date);
        fmt::print("Recorded {} of {:.2f} in '{}' on {}\n",
                   pfe::to_string(cmd.type), cmd.amount, cmd.category, date.to_string());
        return true;
    }

    bool operator()(const pfe::cli::SetBudgetCommand& cmd) const {
        book_.budgets.set_budget(cmd.category, cmd.amount);
        fmt::print("Budget for '{}' set to {:.2f}\n", cmd.category, cmd.amount);
        return true;
    }

    bool operator()(const pfe::cli::SetProfileCommand& cmd) const {
        book_.set_profile(cmd.profile);
        fmt::print("Investment profile set: risk tolerance {}, goals '{}'\n",
                   pfe::to_string(cmd.profile.risk_tolerance), cmd.profile.goals);
        return true;
    }

    bool operator()(const pfe::cli::HelpCommand&) const {
        fmt::print("{}", pfe::cli::usage());
        return false;
    }

private:
    pfe::FinanceBook& book_;
};

void debug(const CliConfig& config, const std::string& message) {
    if (config.verbose) {
        fmt::print(stderr, "[pfe] {}\n", message);
    }
}

/// Strip global flags from argv, filling `config`. Remaining words are the
/// action and its arguments.
std::vector<std::string> parse_global_flags(int argc, char* argv[], CliConfig& config) {
    if (const char* env = std::getenv(pfe::constants::DATA_DIR_ENV); env && *env) {
        config.data_dir = env;
    }

    std::vector<std::string> rest;
    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        if (!rest.empty()) {
            rest.push_back(arg);  // flags only before the action
        } else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        } else if (arg == "--data-dir") {
            if (i + 1 >= argc) {
                throw pfe::FinanceError(pfe::ErrorKind::MissingArgument,
                                        "--data-dir requires a directory");
            }
            config.data_dir = argv[++i];
        } else {
            rest.push_back(arg);
        }
    }
    return rest;
}

int run(int argc, char* argv[]) {
    CliConfig config;
    const auto args    = parse_global_flags(argc, argv, config);
    const auto command = pfe::cli::parse_command(args);

    // help never touches the data directory.
    pfe::LoadResult loaded;
    if (!std::holds_alternative<pfe::cli::HelpCommand>(command)) {
        debug(config, fmt::format("loading book from '{}'", config.data_dir.string()));
        loaded = pfe::DataStore::load(config.data_dir);
        if (loaded.stats.skipped > 0) {
            fmt::print(stderr, "[pfe] Skipped {} malformed rows in '{}'\n",
                       loaded.stats.skipped, config.data_dir.string());
        }
        debug(config, fmt::format("{} rows loaded; {} transactions, {} budgets, profile {}",
                                  loaded.stats.loaded,
                                  loaded.book.ledger.size(),
                                  loaded.book.budgets.size(),
                                  loaded.book.profile ? "set" : "unset"));
    }

    debug(config, fmt::format("dispatching {}", pfe::cli::action_name(command)));
    const bool changed = std::visit(Dispatcher(loaded.book), command);

    if (changed) {
        pfe::DataStore::save(loaded.book, config.data_dir);
        debug(config, fmt::format("saved book to '{}'", config.data_dir.string()));
    }
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        fmt::print("{}", pfe::cli::usage());
        return 2;
    }

    try {
        return run(argc, argv);
    } catch (const pfe::FinanceError& ex) {
        fmt::print(stderr, "Error: {}\n", ex.what());
        const auto kind = ex.kind();
        if (kind == pfe::ErrorKind::UnknownAction || kind == pfe::ErrorKind::MissingArgument) {
            fmt::print(stderr, "\n{}", pfe::cli::usage());
            return 2;
        }
        return 1;
    } catch (const std::exception& ex) {
        fmt::print(stderr, "[pfe] fatal: {}\n", ex.what());
        return 1;
    }
}
