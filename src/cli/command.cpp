/// @file src/cli/command.cpp
/// @brief Command-line action parsing.

#include "pfe/command.hpp"
#include "pfe/error.hpp"
#include "pfe/ledger.hpp"

#include <fmt/format.h>

#include <cmath>

namespace pfe::cli {

namespace {

/// Fetch argument `index` or raise MissingArgument naming it.
const std::string& require_arg(std::span<const std::string> args,
                               std::size_t index,
                               std::string_view action,
                               std::string_view what) {
    if (index >= args.size()) {
        throw FinanceError(ErrorKind::MissingArgument,
                           fmt::format("{} requires {}", action, what));
    }
    return args[index];
}

[[nodiscard]] double parse_amount(const std::string& text) {
    const auto value = parse_number(text);
    if (!value) {
        throw FinanceError(ErrorKind::InvalidAmount,
                           fmt::format("'{}' is not a number", text));
    }
    require_valid_amount(*value);
    return *value;
}

ReportCommand parse_report(std::span<const std::string> args) {
    const auto& year_text  = require_arg(args, 1, "report", "a YEAR");
    const auto& month_text = require_arg(args, 2, "report", "a MONTH");

    const auto year  = parse_number(year_text);
    const auto month = parse_number(month_text);
    if (!year || *year < 1 || *year > 9999 || *year != std::floor(*year)) {
        throw FinanceError(ErrorKind::InvalidPeriod,
                           fmt::format("year must be a whole number in 1..9999 (got '{}')", year_text));
    }
    if (!month || *month < 1 || *month > 12 || *month != std::floor(*month)) {
        throw FinanceError(ErrorKind::InvalidPeriod,
                           fmt::format("month must be a whole number in 1..12 (got '{}')", month_text));
    }
    return ReportCommand{
        .year  = static_cast<int>(*year),
        .month = static_cast<unsigned>(*month),
    };
}

AddTransactionCommand parse_add_transaction(std::span<const std::string> args) {
    constexpr std::string_view action = "add_transaction";
    AddTransactionCommand cmd{
        .amount      = parse_amount(require_arg(args, 1, action, "an AMOUNT")),
        .category    = require_arg(args, 2, action, "a CATEGORY"),
        .description = require_arg(args, 3, action, "a DESCRIPTION"),
    };
    require_valid_category(cmd.category);

    // The optional trailing arguments may come in either order.
    for (std::size_t i = 4; i < args.size(); ++i) {
        if (auto type = parse_transaction_type(args[i])) {
            cmd.type = *type;
        } else if (auto date = Date::parse(args[i])) {
            cmd.date = *date;
        } else if (args[i].find('-') != std::string::npos) {
            throw FinanceError(ErrorKind::InvalidDate,
                               fmt::format("not a valid YYYY-MM-DD date: '{}'", args[i]));
        } else {
            throw FinanceError(ErrorKind::InvalidTransactionType,
                               fmt::format("type must be income or expense (got '{}')", args[i]));
        }
    }
    return cmd;
}

SetBudgetCommand parse_set_budget(std::span<const std::string> args) {
    SetBudgetCommand cmd{
        .category = require_arg(args, 1, "set_budget", "a CATEGORY"),
        .amount   = parse_amount(require_arg(args, 2, "set_budget", "an AMOUNT")),
    };
    require_valid_category(cmd.category);
    return cmd;
}

SetProfileCommand parse_set_profile(std::span<const std::string> args) {
    const auto& risk  = require_arg(args, 1, "set_profile", "a RISK_TOLERANCE");
    const auto& goals = require_arg(args, 2, "set_profile", "GOALS");
    return SetProfileCommand{
        .profile = InvestmentProfile{
            .risk_tolerance = parse_risk_tolerance(risk),
            .goals          = goals,
        },
    };
}

/// Maps each alternative to the action word that produces it.
struct ActionName {
    std::string_view operator()(const ReportCommand&) const noexcept         { return "report"; }
    std::string_view operator()(const AddTransactionCommand&) const noexcept { return "add_transaction"; }
    std::string_view operator()(const SetBudgetCommand&) const noexcept      { return "set_budget"; }
    std::string_view operator()(const SetProfileCommand&) const noexcept     { return "set_profile"; }
    std::string_view operator()(const HelpCommand&) const noexcept           { return "help"; }
};

}  // namespace

// ─── parse_command ────────────────────────────────────────────────────────────

Command parse_command(std::span<const std::string> args) {
    if (args.empty()) {
        throw FinanceError(ErrorKind::UnknownAction, "no action given");
    }

    const std::string& action = args[0];
    if (action == "report")          return parse_report(args);
    if (action == "add_transaction") return parse_add_transaction(args);
    if (action == "set_budget")      return parse_set_budget(args);
    if (action == "set_profile")     return parse_set_profile(args);
    if (action == "help" || action == "--help" || action == "-h") return HelpCommand{};

    throw FinanceError(ErrorKind::UnknownAction, fmt::format("unknown action '{}'", action));
}

std::string_view action_name(const Command& command) {
    return std::visit(ActionName{}, command);
}

std::string usage() {
    return
        "Usage:\n"
        "  pfe [--data-dir DIR] [--verbose] <action> [args...]\n"
        "\n"
        "Actions:\n"
        "  report YEAR MONTH                         Financial report for one month\n"
        "  add_transaction AMOUNT CATEGORY DESCRIPTION [income|expense] [YYYY-MM-DD]\n"
        "                                            Record a transaction (default: expense, today)\n"
        "  set_budget CATEGORY AMOUNT                Set a monthly budget limit\n"
        "  set_profile low|medium|high GOALS         Set the investment profile\n"
        "  help                                      Show this help\n"
        "\n"
        "Data directory: --data-dir, else $PFE_DATA_DIR, else ./financial_data\n";
}

}  // namespace pfe::cli
