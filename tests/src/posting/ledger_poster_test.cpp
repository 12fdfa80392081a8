#include <gtest/gtest.h>
#include <folio/posting/ledger_poster.hpp>
#include <folio/testing/ledger_fixture.hpp>
#include <folio/testing/posting_fixture.hpp>

#include <string>
#include <utility>
#include <vector>

using folio::schema::journal_status_t;
using folio::schema::posting_error_code_t;
using folio::testing::credit_line;
using folio::testing::debit_line;
using folio::testing::fixed_today;
using folio::testing::make_date;

namespace {

void store_chart(folio::testing::ledger_fixture& fixture) {
  for (const auto& account : folio::testing::make_chart_accounts()) {
    fixture.storage().put_account(std::string{folio::testing::kTenantId},
                                  std::string{folio::testing::kCompanyId},
                                  account);
  }
}

folio::schema::journal_posting_input_t make_journal(
    std::vector<folio::schema::journal_line_t> lines,
    const std::string& role = "accountant") {
  auto journal = folio::schema::journal_posting_input_t{};
  journal.journal_number = "JV-1001";
  journal.journal_date = fixed_today();
  journal.currency = "MYR";
  journal.lines = std::move(lines);
  journal.context = folio::testing::make_context(role);
  return journal;
}

}  // namespace

TEST(ledger_poster, records_journal_in_open_period) {
  auto fixture = folio::testing::ledger_fixture{"folio_poster_open"};
  store_chart(fixture);
  fixture.add_period(6);
  auto poster = folio::posting::ledger_poster{
      fixture.storage(), fixture.manager(), fixture.authorizer(), "MYR",
      fixed_today};

  auto input = make_journal({debit_line("exp", 120.0), credit_line("ap", 120.0)});
  input.reference = "ACCRUAL-JUN";
  auto result = poster.post(input);
  ASSERT_TRUE(result.success) << result.error;
  ASSERT_TRUE(result.journal.has_value());
  EXPECT_EQ(result.journal->status, journal_status_t::posted);
  EXPECT_EQ(result.journal->reference, "ACCRUAL-JUN");
  EXPECT_EQ(result.journal->description, "JV-1001");
  EXPECT_DOUBLE_EQ(result.journal->total_debit, 120.0);
  ASSERT_TRUE(result.validation.has_value());
  EXPECT_EQ(result.validation->account_details.size(), 2u);

  auto totals = fixture.storage().trial_balance_as_of(
      std::string{folio::testing::kTenantId},
      std::string{folio::testing::kCompanyId}, fixed_today());
  EXPECT_DOUBLE_EQ(totals.total_debits, 120.0);
  EXPECT_DOUBLE_EQ(totals.total_credits, 120.0);
  auto accruals = fixture.storage().list_unreversed_accruals(
      std::string{folio::testing::kTenantId},
      std::string{folio::testing::kCompanyId}, make_date(2025, 6, 1),
      make_date(2025, 6, 30));
  ASSERT_EQ(accruals.size(), 1u);
  EXPECT_EQ(accruals[0].id, result.journal->id);
}

TEST(ledger_poster, large_journal_waits_for_approval) {
  auto fixture = folio::testing::ledger_fixture{"folio_poster_approval"};
  store_chart(fixture);
  fixture.add_period(6);
  auto poster = folio::posting::ledger_poster{
      fixture.storage(), fixture.manager(), fixture.authorizer(), "MYR",
      fixed_today};

  auto result = poster.post(make_journal(
      {debit_line("exp", 60'000.0), credit_line("ap", 60'000.0)}, "manager"));
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.journal->status, journal_status_t::pending_approval);
  EXPECT_EQ(fixture.storage().count_unposted_journals(
                std::string{folio::testing::kTenantId},
                std::string{folio::testing::kCompanyId},
                make_date(2025, 6, 1), make_date(2025, 6, 30)),
            1u);
}

TEST(ledger_poster, closed_period_rejects_posting) {
  auto fixture = folio::testing::ledger_fixture{"folio_poster_closed"};
  store_chart(fixture);
  auto june = fixture.add_period(6);
  fixture.add_period(7);
  auto close = fixture.manager().close_fiscal_period(
      fixture.close_input(june.id));
  ASSERT_TRUE(close.success) << close.error;

  auto poster = folio::posting::ledger_poster{
      fixture.storage(), fixture.manager(), fixture.authorizer(), "MYR",
      fixed_today};
  auto result =
      poster.post(make_journal({debit_line("exp", 10.0), credit_line("ap", 10.0)}));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.code, posting_error_code_t::period_not_open);
  EXPECT_EQ(result.error, "Fiscal period 'period-2025-6' is closed");
  EXPECT_FALSE(result.journal.has_value());
  ASSERT_TRUE(result.validation.has_value());
  EXPECT_TRUE(result.validation->validated);
}

TEST(ledger_poster, date_outside_calendar_rejects_posting) {
  auto fixture = folio::testing::ledger_fixture{"folio_poster_no_period"};
  store_chart(fixture);
  fixture.add_period(5);
  auto poster = folio::posting::ledger_poster{
      fixture.storage(), fixture.manager(), fixture.authorizer(), "MYR",
      fixed_today};

  auto result =
      poster.post(make_journal({debit_line("exp", 10.0), credit_line("ap", 10.0)}));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.code, posting_error_code_t::period_not_open);
  EXPECT_EQ(result.error, "No fiscal period covers 2025-06-30");
}

TEST(ledger_poster, accounts_come_from_the_store) {
  auto fixture = folio::testing::ledger_fixture{"folio_poster_accounts"};
  fixture.add_period(6);
  auto poster = folio::posting::ledger_poster{
      fixture.storage(), fixture.manager(), fixture.authorizer(), "MYR",
      fixed_today};
  auto input = make_journal({debit_line("exp", 10.0), credit_line("ap", 10.0)});

  auto before = poster.post(input);
  EXPECT_FALSE(before.success);
  EXPECT_EQ(before.code, posting_error_code_t::invalid_accounts);
  EXPECT_EQ(before.error, "Accounts not found: exp, ap");

  store_chart(fixture);
  auto after = poster.post(input);
  EXPECT_TRUE(after.success) << after.error;
}

TEST(ledger_poster, configured_base_currency_drives_fx_checks) {
  auto fixture = folio::testing::ledger_fixture{"folio_poster_base"};
  store_chart(fixture);
  fixture.add_period(6);
  auto poster = folio::posting::ledger_poster{
      fixture.storage(), fixture.manager(), fixture.authorizer(), "SGD",
      fixed_today};

  auto input = make_journal({debit_line("exp", 10.0), credit_line("ap", 10.0)});
  auto missing_rate = poster.post(input);
  EXPECT_FALSE(missing_rate.success);
  EXPECT_EQ(missing_rate.code, posting_error_code_t::invalid_currency);
  EXPECT_EQ(missing_rate.error,
            "Exchange rate required for MYR to SGD conversion");

  input.exchange_rate = 0.3;
  auto converted = poster.post(input);
  ASSERT_TRUE(converted.success) << converted.error;
  EXPECT_DOUBLE_EQ(converted.journal->total_debit, 3.0);
}
