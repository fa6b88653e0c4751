#pragma once

/// @file include/pfe/command.hpp
/// @brief Command-line actions as a validated tagged variant.
///
/// `parse_command` turns the action words of the command line into exactly
/// one of the structs below. All argument checking happens there, so the
/// dispatcher only ever sees well-formed requests.
///
///   report YEAR MONTH
///   add_transaction AMOUNT CATEGORY DESCRIPTION [income|expense] [YYYY-MM-DD]
///   set_budget CATEGORY AMOUNT
///   set_profile low|medium|high GOALS
///   help

#include "pfe/types.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>

namespace pfe::cli {

struct ReportCommand {
    int      year;
    unsigned month;
};

struct AddTransactionCommand {
    double              amount;
    std::string         category;
    std::string         description;
    TransactionType     type = TransactionType::Expense;
    std::optional<Date> date;  ///< Today when absent
};

struct SetBudgetCommand {
    std::string category;
    double      amount;
};

struct SetProfileCommand {
    InvestmentProfile profile;
};

struct HelpCommand {};

using Command = std::variant<ReportCommand,
                             AddTransactionCommand,
                             SetBudgetCommand,
                             SetProfileCommand,
                             HelpCommand>;

/// Parse the action name and its arguments (program name and global flags
/// already stripped).
///
/// # Errors
/// - `UnknownAction`        unrecognised action name, or no action at all
/// - `MissingArgument`      a required argument is absent
/// - `InvalidAmount`        amount is not a non-negative number
/// - `InvalidCategory`      category is empty
/// - `InvalidPeriod`        year or month out of range
/// - `InvalidDate`          date is not YYYY-MM-DD or does not exist
/// - `InvalidTransactionType` type other than income or expense
/// - `InvalidRiskTolerance` risk tolerance outside {low, medium, high}
[[nodiscard]] Command parse_command(std::span<const std::string> args);

/// Name of the action a command came from, e.g. "set_budget".
[[nodiscard]] std::string_view action_name(const Command& command);

/// Usage text for `help`.
[[nodiscard]] std::string usage();

} // namespace pfe::cli
