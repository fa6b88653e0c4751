/**
 * @file  prop_store_roundtrip.cpp
 * @brief Property: parse(serialize(ledger)) reproduces every transaction.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_store_roundtrip
 *
 * Descriptions are drawn from arbitrary printable text, including commas and
 * double quotes, to exercise CSV quoting.
 */

#include <rapidcheck.h>

#include "pfe/data_store.hpp"

#include <string>
#include <vector>

using namespace pfe;

int main() {
    rc::check(
        "store_roundtrip: serialized ledger reloads unchanged",
        []() {
            const auto n = *rc::gen::inRange<int>(0, 20);

            Ledger ledger;
            for (int i = 0; i < n; ++i) {
                const double amount = *rc::gen::inRange<int>(0, 10'000'000) / 100.0;
                const auto description = *rc::gen::container<std::string>(
                    rc::gen::inRange<char>(' ', '~'));
                const auto type = *rc::gen::element(TransactionType::Income,
                                                    TransactionType::Expense);
                const Date date{
                    *rc::gen::inRange<int>(2000, 2031),
                    static_cast<unsigned>(*rc::gen::inRange<int>(1, 13)),
                    static_cast<unsigned>(*rc::gen::inRange<int>(1, 29)),
                };
                ledger.add_transaction(amount, "Cat,\"" + std::to_string(i % 3), description,
                                       type, date);
            }

            Ledger reloaded;
            const auto stats =
                DataStore::parse_transactions(DataStore::serialize_transactions(ledger), reloaded);

            RC_ASSERT(stats.skipped == 0u);
            RC_ASSERT(reloaded.size() == ledger.size());
            for (std::size_t i = 0; i < ledger.size(); ++i) {
                RC_ASSERT(reloaded.transactions()[i] == ledger.transactions()[i]);
            }
        }
    );

    return 0;
}
