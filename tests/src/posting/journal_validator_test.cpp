#include <gtest/gtest.h>
#include <folio/posting/journal_validator.hpp>
#include <folio/testing/posting_fixture.hpp>

#include <chrono>
#include <cmath>
#include <string>
#include <vector>

using folio::schema::posting_error_code_t;
using folio::testing::credit_line;
using folio::testing::debit_line;

TEST(journal_validator, accepts_balanced_journal) {
  auto fixture = folio::testing::posting_fixture{};
  auto result = fixture.validator().validate(fixture.make_journal(
      {debit_line("exp", 250.0), credit_line("ap", 250.0)}));
  EXPECT_TRUE(result.validated);
  EXPECT_FALSE(result.code.has_value());
  EXPECT_DOUBLE_EQ(result.total_debit, 250.0);
  EXPECT_DOUBLE_EQ(result.total_credit, 250.0);
  ASSERT_EQ(result.account_details.size(), 2u);
  EXPECT_EQ(result.account_details[0].code, "5000");
  EXPECT_EQ(result.account_details[1].code, "2000");
  EXPECT_TRUE(result.coa_warnings.empty());
}

TEST(journal_validator, reports_unbalanced_difference) {
  auto fixture = folio::testing::posting_fixture{};
  auto result = fixture.validator().validate(fixture.make_journal(
      {debit_line("cash", 100.0), credit_line("rev", 99.0)}));
  EXPECT_FALSE(result.validated);
  EXPECT_EQ(result.code, posting_error_code_t::journal_unbalanced);
  ASSERT_TRUE(result.difference.has_value());
  EXPECT_NEAR(*result.difference, 1.0, 1e-9);
  EXPECT_EQ(result.error,
            "Journal is not balanced: debits 100.00, credits 99.00, "
            "difference 1.00");
}

TEST(journal_validator, balance_decision_follows_one_cent_tolerance) {
  auto fixture = folio::testing::posting_fixture{};
  for (auto cents = 0; cents <= 300; ++cents) {
    auto offset = cents / 100.0;
    auto result = fixture.validator().validate(fixture.make_journal(
        {debit_line("cash", 1000.0 + offset), credit_line("rev", 1000.0)}));
    auto unbalanced = result.code == posting_error_code_t::journal_unbalanced;
    EXPECT_EQ(unbalanced, cents > 1) << "offset " << offset;
  }
}

TEST(journal_validator, missing_accounts_are_listed) {
  auto fixture = folio::testing::posting_fixture{};
  auto result = fixture.validator().validate(fixture.make_journal(
      {debit_line("ghost", 10.0), credit_line("phantom", 10.0)}));
  EXPECT_EQ(result.code, posting_error_code_t::invalid_accounts);
  EXPECT_EQ(result.error, "Accounts not found: ghost, phantom");
}

TEST(journal_validator, inactive_accounts_are_distinct_from_missing) {
  auto fixture = folio::testing::posting_fixture{};
  auto result = fixture.validator().validate(fixture.make_journal(
      {debit_line("dormant", 10.0), credit_line("cash", 10.0)}));
  EXPECT_EQ(result.code, posting_error_code_t::invalid_accounts);
  EXPECT_EQ(result.error, "Accounts are inactive: dormant");
}

TEST(journal_validator, empty_and_oversized_journals_are_rejected) {
  auto fixture = folio::testing::posting_fixture{};
  auto empty = fixture.validator().validate(fixture.make_journal({}));
  EXPECT_EQ(empty.code, posting_error_code_t::invalid_accounts);

  auto lines = std::vector<folio::schema::journal_line_t>{};
  for (auto i = 0; i < 101; ++i) {
    lines.push_back(i % 2 == 0 ? debit_line("cash", 1.0)
                               : credit_line("rev", 1.0));
  }
  auto oversized = fixture.validator().validate(fixture.make_journal(lines));
  EXPECT_EQ(oversized.code, posting_error_code_t::business_rule_violation);
}

TEST(journal_validator, foreign_currency_requires_rate) {
  auto fixture = folio::testing::posting_fixture{};
  auto journal = fixture.make_journal(
      {debit_line("cash", 100.0), credit_line("rev", 100.0)});
  journal.currency = "USD";
  auto result = fixture.validator().validate(journal);
  EXPECT_EQ(result.code, posting_error_code_t::invalid_currency);
  EXPECT_EQ(result.error, "Exchange rate required for USD to MYR conversion");

  journal.exchange_rate = 4.2;
  auto converted = fixture.validator().validate(journal);
  EXPECT_TRUE(converted.validated);
  EXPECT_NEAR(converted.total_debit, 420.0, 1e-9);
}

TEST(journal_validator, malformed_currency_is_rejected) {
  auto fixture = folio::testing::posting_fixture{};
  auto journal = fixture.make_journal(
      {debit_line("cash", 100.0), credit_line("rev", 100.0)});
  journal.currency = "usd";
  auto result = fixture.validator().validate(journal);
  EXPECT_EQ(result.code, posting_error_code_t::invalid_currency);
  EXPECT_EQ(result.error, "Invalid currency code 'usd'");
}

TEST(journal_validator, line_amounts_must_be_in_range) {
  auto fixture = folio::testing::posting_fixture{};
  auto negative = fixture.validator().validate(fixture.make_journal(
      {debit_line("cash", -5.0), credit_line("rev", -5.0)}));
  EXPECT_EQ(negative.code, posting_error_code_t::invalid_amount);

  auto tiny = fixture.validator().validate(fixture.make_journal(
      {debit_line("cash", 0.001), credit_line("rev", 0.001)}));
  EXPECT_EQ(tiny.code, posting_error_code_t::invalid_amount);
}

TEST(journal_validator, future_dates_are_rejected) {
  auto fixture = folio::testing::posting_fixture{};
  auto journal = fixture.make_journal(
      {debit_line("cash", 10.0), credit_line("rev", 10.0)});
  journal.journal_date = folio::testing::fixed_today() + std::chrono::days{1};
  auto result = fixture.validator().validate(journal);
  EXPECT_EQ(result.code, posting_error_code_t::business_rule_violation);
  EXPECT_EQ(result.error, "Journal date cannot be in the future");
}

TEST(journal_validator, sod_denial_is_fatal) {
  auto fixture = folio::testing::posting_fixture{};
  auto result = fixture.validator().validate(fixture.make_journal(
      {debit_line("cash", 10.0), credit_line("rev", 10.0)}, "clerk"));
  EXPECT_FALSE(result.validated);
  EXPECT_EQ(result.code, posting_error_code_t::sod_violation);
  EXPECT_EQ(result.error,
            "User role 'clerk' is not authorized to journal:post");
  EXPECT_EQ(result.sod_reason, "Role 'clerk' is denied 'journal:post'");
}

TEST(journal_validator, approval_flag_does_not_block) {
  auto fixture = folio::testing::posting_fixture{};
  auto result = fixture.validator().validate(fixture.make_journal(
      {debit_line("exp", 45'000.0), credit_line("bank", 45'000.0)}));
  EXPECT_TRUE(result.validated);
  EXPECT_TRUE(result.requires_approval);
  EXPECT_EQ(result.approver_roles,
            (std::vector<std::string>{"manager", "admin"}));
}

TEST(journal_validator, coa_warnings_follow_normal_balances) {
  auto fixture = folio::testing::posting_fixture{};
  auto result = fixture.validator().validate(fixture.make_journal(
      {debit_line("rev", 80.0), credit_line("exp", 80.0)}));
  ASSERT_TRUE(result.validated);
  ASSERT_EQ(result.coa_warnings.size(), 2u);
  EXPECT_EQ(result.coa_warnings[0].warning,
            "REVENUE account 4000 normally has credit balance");
  EXPECT_EQ(result.coa_warnings[0].side, folio::schema::posting_side_t::debit);
  EXPECT_EQ(result.coa_warnings[1].warning,
            "EXPENSE account 5000 normally has debit balance");
  EXPECT_DOUBLE_EQ(result.coa_warnings[1].amount, 80.0);
}

TEST(journal_validator, foreign_denominated_account_is_advisory) {
  auto fixture = folio::testing::posting_fixture{};
  auto result = fixture.validator().validate(fixture.make_journal(
      {debit_line("usd-cash", 10.0), credit_line("equity", 10.0)}));
  ASSERT_TRUE(result.validated);
  ASSERT_EQ(result.coa_warnings.size(), 1u);
  EXPECT_EQ(result.coa_warnings[0].warning,
            "Account 1020 is denominated in USD but the journal is in MYR");
}
