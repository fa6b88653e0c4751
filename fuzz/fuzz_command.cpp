/**
 * @file  fuzz_command.cpp
 * @brief libFuzzer target for cli::parse_command
 *
 * Build:
 *   cmake -DPFE_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_command
 *
 * Run for 60 seconds:
 *   ./fuzz_command -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. The parser either returns a command or throws FinanceError; nothing
 *      else escapes.
 *   2. Accepted amounts are non-negative and finite.
 *   3. Accepted report periods have month in 1..12.
 *
 * Fuzzer strategy:
 *   Input bytes are split on NUL into argv-style words.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "pfe/command.hpp"
#include "pfe/error.hpp"

using namespace pfe;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    std::vector<std::string> words(1);
    for (size_t i = 0; i < size; ++i) {
        if (data[i] == 0) {
            words.emplace_back();
        } else {
            words.back().push_back(static_cast<char>(data[i]));
        }
    }

    try {
        const auto cmd = cli::parse_command(words);
        if (const auto* r = std::get_if<cli::ReportCommand>(&cmd)) {
            assert(r->month >= 1 && r->month <= 12);
        } else if (const auto* a = std::get_if<cli::AddTransactionCommand>(&cmd)) {
            assert(std::isfinite(a->amount) && a->amount >= 0.0);
            assert(!a->date || a->date->valid());
        } else if (const auto* b = std::get_if<cli::SetBudgetCommand>(&cmd)) {
            assert(std::isfinite(b->amount) && b->amount >= 0.0);
        }
    } catch (const FinanceError&) {
        // Rejected input is the expected outcome for most byte strings.
    }

    return 0;
}
