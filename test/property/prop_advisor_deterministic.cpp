/**
 * @file  prop_advisor_deterministic.cpp
 * @brief Property: recommend() is a pure function of (risk, income, expenses).
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_advisor_deterministic
 *
 * Also checks that the output is always the table row selected by the
 * savings bucket, and that a negative ratio always lands in Deficit.
 */

#include <rapidcheck.h>

#include "pfe/advisor.hpp"

using namespace pfe;

int main() {
    const InvestmentAdvisor advisor;

    rc::check(
        "advisor_deterministic: same inputs give the same table row",
        [&advisor]() {
            const auto risk = *rc::gen::element(RiskTolerance::Low,
                                                RiskTolerance::Medium,
                                                RiskTolerance::High);
            const double income   = *rc::gen::inRange<int>(0, 1'000'000) / 100.0;
            const double expenses = *rc::gen::inRange<int>(0, 1'000'000) / 100.0;
            const InvestmentProfile profile{.risk_tolerance = risk, .goals = "growth"};

            const auto first  = advisor.recommend(profile, income, expenses);
            const auto second = advisor.recommend(profile, income, expenses);
            RC_ASSERT(first == second);
            RC_ASSERT(!first.empty());

            const auto bucket =
                InvestmentAdvisor::bucket_for(InvestmentAdvisor::savings_ratio(income, expenses));
            RC_ASSERT(first == InvestmentAdvisor::recommendations_for(risk, bucket));

            if (income > 0.0 && expenses > income) {
                RC_ASSERT(bucket == SavingsBucket::Deficit);
            }
        }
    );

    return 0;
}
