/// @file tests/core/test_data_store.cpp
/// @brief Unit tests for DataStore CSV persistence.
///
/// Files are written to a per-test directory under the system temp path and
/// removed in TearDown.

#include <gtest/gtest.h>
#include "pfe/data_store.hpp"
#include "pfe/error.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace pfe;
namespace fs = std::filesystem;

// ─── Fixture ─────────────────────────────────────────────────────────────────

class DataStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() /
               (std::string("pfe_test_") + info->test_suite_name() + "_" + info->name());
        fs::remove_all(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void write(const char* name, const std::string& contents) {
        fs::create_directories(dir_);
        std::ofstream(dir_ / name) << contents;
    }

    fs::path dir_;
};

static FinanceBook sample_book() {
    FinanceBook book;
    book.ledger.add_transaction(5000.0, "Income", "Monthly Salary",
                                TransactionType::Income, Date{2024, 3, 1});
    book.ledger.add_transaction(12.34, "Food", "Lunch, with \"friends\"",
                                TransactionType::Expense, Date{2024, 3, 4});
    book.budgets.set_budget("Food", 500.0);
    book.budgets.set_budget("Housing", 1600.5);
    book.set_profile(InvestmentProfile{.risk_tolerance = RiskTolerance::High,
                                       .goals          = "retirement"});
    return book;
}

// ─── Field codec ─────────────────────────────────────────────────────────────

TEST(DataStore_Codec, SplitPlainAndQuoted) {
    auto f = DataStore::split_line(R"(2024-03-01,expense,10,Food,"Lunch, ""big""")");
    ASSERT_TRUE(f.has_value());
    ASSERT_EQ(f->size(), 5u);
    EXPECT_EQ((*f)[4], "Lunch, \"big\"");
}

TEST(DataStore_Codec, SplitKeepsEmptyFields) {
    auto f = DataStore::split_line("a,,b,");
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->size(), 4u);
    EXPECT_EQ((*f)[1], "");
    EXPECT_EQ((*f)[3], "");
}

TEST(DataStore_Codec, UnterminatedQuote_Nullopt) {
    EXPECT_FALSE(DataStore::split_line(R"(a,"broken)").has_value());
}

TEST(DataStore_Codec, EscapeOnlyWhenNeeded) {
    EXPECT_EQ(DataStore::escape_field("plain"), "plain");
    EXPECT_EQ(DataStore::escape_field("a,b"), "\"a,b\"");
    EXPECT_EQ(DataStore::escape_field("say \"hi\""), "\"say \"\"hi\"\"\"");
    EXPECT_EQ(DataStore::escape_field("two\nlines"), "two lines");
}

TEST(DataStore_Codec, LeadingHashQuoted) {
    EXPECT_EQ(DataStore::escape_field("#1 savings"), "\"#1 savings\"");
    EXPECT_EQ(DataStore::escape_field("savings #1"), "savings #1");
}

TEST(DataStore_Parse, CarriageReturnInsideFieldRoundTrips) {
    Ledger ledger;
    ledger.add_transaction(1.0, "Food", "ends with\r", TransactionType::Expense, Date{2024, 3, 4});

    Ledger reloaded;
    (void)DataStore::parse_transactions(DataStore::serialize_transactions(ledger), reloaded);
    ASSERT_EQ(reloaded.size(), 1u);
    EXPECT_EQ(reloaded.transactions()[0].description, "ends with\r");
}

// ─── Parsers ─────────────────────────────────────────────────────────────────

TEST(DataStore_Parse, MalformedTransactionRowsSkipped) {
    const std::string csv =
        "date,type,amount,category,description\n"
        "2024-03-01,income,5000,Income,Salary\n"
        "2024-02-30,expense,10,Food,bad date\n"
        "2024-03-02,transfer,10,Food,bad type\n"
        "2024-03-02,expense,abc,Food,bad amount\n"
        "2024-03-02,expense,-4,Food,negative\n"
        "2024-03-02,expense,4,,empty category\n"
        "2024-03-02,expense,4,Food\n"
        "\n"
        "# comment\n"
        "2024-03-03,expense,40.5,Food,Groceries\r\n";

    Ledger ledger;
    const auto stats = DataStore::parse_transactions(csv, ledger);
    EXPECT_EQ(stats.loaded, 2u);
    EXPECT_EQ(stats.skipped, 6u);
    EXPECT_DOUBLE_EQ(ledger.total_expenses(2024, 3), 40.5);
    EXPECT_EQ(ledger.transactions()[1].description, "Groceries");
}

TEST(DataStore_Parse, HeaderOnly_Empty) {
    Ledger ledger;
    const auto stats = DataStore::parse_transactions("date,type,amount,category,description\n", ledger);
    EXPECT_EQ(stats.loaded, 0u);
    EXPECT_EQ(stats.skipped, 0u);
    EXPECT_TRUE(ledger.empty());
}

TEST(DataStore_Parse, LaterBudgetRowOverwrites) {
    BudgetTracker budgets;
    const auto stats = DataStore::parse_budgets("category,limit\nFood,100\nFood,250\nRent,-5\n", budgets);
    EXPECT_EQ(stats.loaded, 2u);
    EXPECT_EQ(stats.skipped, 1u);
    EXPECT_DOUBLE_EQ(*budgets.limit("Food"), 250.0);
    EXPECT_FALSE(budgets.limit("Rent").has_value());
}

TEST(DataStore_Parse, HashLeadingCategoryRoundTrips) {
    BudgetTracker budgets;
    budgets.set_budget("#1 savings", 250.0);
    budgets.set_budget("Food", 100.0);

    BudgetTracker reloaded;
    const auto stats = DataStore::parse_budgets(DataStore::serialize_budgets(budgets), reloaded);
    EXPECT_EQ(stats.loaded, 2u);
    EXPECT_EQ(stats.skipped, 0u);
    ASSERT_EQ(reloaded.size(), 2u);
    EXPECT_DOUBLE_EQ(*reloaded.limit("#1 savings"), 250.0);
}

TEST(DataStore_Parse, HashLeadingTransactionFieldsRoundTrip) {
    Ledger ledger;
    ledger.add_transaction(9.5, "#tag", "#note", TransactionType::Expense, Date{2024, 3, 4});

    Ledger reloaded;
    const auto stats =
        DataStore::parse_transactions(DataStore::serialize_transactions(ledger), reloaded);
    EXPECT_EQ(stats.loaded, 1u);
    ASSERT_EQ(reloaded.size(), 1u);
    EXPECT_EQ(reloaded.transactions()[0], ledger.transactions()[0]);
}

TEST(DataStore_Parse, InvalidRiskToleranceRowSkipped) {
    std::optional<InvestmentProfile> profile;
    const auto stats = DataStore::parse_profile("risk_tolerance,goals\nreckless,yacht\n", profile);
    EXPECT_EQ(stats.skipped, 1u);
    EXPECT_FALSE(profile.has_value());
}

// ─── load / save ─────────────────────────────────────────────────────────────

TEST_F(DataStoreTest, MissingDirectory_EmptyBook) {
    const auto result = DataStore::load(dir_);
    EXPECT_TRUE(result.book.ledger.empty());
    EXPECT_EQ(result.book.budgets.size(), 0u);
    EXPECT_FALSE(result.book.profile.has_value());
    EXPECT_EQ(result.stats.loaded, 0u);
}

TEST_F(DataStoreTest, SaveThenLoad_SameBook) {
    const FinanceBook book = sample_book();
    DataStore::save(book, dir_);

    EXPECT_TRUE(fs::exists(dir_ / DataStore::TRANSACTIONS_FILE));
    EXPECT_TRUE(fs::exists(dir_ / DataStore::BUDGETS_FILE));
    EXPECT_TRUE(fs::exists(dir_ / DataStore::PROFILE_FILE));
    EXPECT_FALSE(fs::exists(dir_ / "transactions.csv.tmp"));

    const auto loaded = DataStore::load(dir_);
    EXPECT_EQ(loaded.stats.skipped, 0u);
    EXPECT_EQ(loaded.stats.loaded, 5u);

    ASSERT_EQ(loaded.book.ledger.size(), book.ledger.size());
    for (std::size_t i = 0; i < book.ledger.size(); ++i) {
        EXPECT_EQ(loaded.book.ledger.transactions()[i], book.ledger.transactions()[i]);
    }
    EXPECT_DOUBLE_EQ(*loaded.book.budgets.limit("Housing"), 1600.5);
    EXPECT_EQ(loaded.book.profile, book.profile);
}

TEST_F(DataStoreTest, SaveOverwritesPreviousContents) {
    FinanceBook book = sample_book();
    DataStore::save(book, dir_);

    book.budgets.set_budget("Food", 42.0);
    book.profile.reset();
    DataStore::save(book, dir_);

    const auto loaded = DataStore::load(dir_);
    EXPECT_DOUBLE_EQ(*loaded.book.budgets.limit("Food"), 42.0);
    EXPECT_FALSE(loaded.book.profile.has_value());
}

TEST_F(DataStoreTest, HashLeadingBudgetSurvivesLaterSaves) {
    FinanceBook book;
    book.budgets.set_budget("#1 savings", 250.0);
    DataStore::save(book, dir_);

    // Each CLI command reloads and rewrites the whole book.
    auto loaded = DataStore::load(dir_);
    loaded.book.budgets.set_budget("Food", 100.0);
    DataStore::save(loaded.book, dir_);

    const auto again = DataStore::load(dir_);
    EXPECT_EQ(again.stats.skipped, 0u);
    ASSERT_TRUE(again.book.budgets.limit("#1 savings").has_value());
    EXPECT_DOUBLE_EQ(*again.book.budgets.limit("#1 savings"), 250.0);
}

TEST_F(DataStoreTest, CorruptRowsCountedOnLoad) {
    write(DataStore::BUDGETS_FILE, "category,limit\nFood,100\nthis is not csv,\"oops\n");
    const auto loaded = DataStore::load(dir_);
    EXPECT_EQ(loaded.stats.loaded, 1u);
    EXPECT_EQ(loaded.stats.skipped, 1u);
}

TEST_F(DataStoreTest, DirectoryIsAFile_StorageError) {
    fs::create_directories(dir_.parent_path());
    std::ofstream(dir_) << "not a directory";
    try {
        DataStore::save(sample_book(), dir_);
        FAIL() << "expected StorageError";
    } catch (const FinanceError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::StorageError);
    }
    fs::remove(dir_);
}
