#include <gtest/gtest.h>
#include <folio/storage/rocksdb/storage.hpp>
#include <folio/testing/ledger_fixture.hpp>

#include <string>

using folio::schema::journal_status_t;
using folio::schema::period_status_t;
using folio::testing::make_date;

TEST(ledger_storage, accounts_are_scoped_to_company) {
  auto fixture = folio::testing::ledger_fixture{"folio_storage_accounts"};
  auto& storage = fixture.storage();
  auto cash = folio::testing::make_account(
      "cash", "1000", folio::schema::account_type_t::asset);
  cash.parent_id = "assets";
  storage.put_account("tenant-1", "company-1", cash);
  storage.put_account("tenant-1", "company-2",
                      folio::testing::make_account(
                          "rev", "4000", folio::schema::account_type_t::revenue));

  auto accounts = storage.list_accounts("tenant-1", "company-1");
  ASSERT_EQ(accounts.size(), 1u);
  EXPECT_EQ(accounts[0].id, "cash");
  EXPECT_EQ(accounts[0].parent_id, "assets");
  EXPECT_EQ(accounts[0].type, folio::schema::account_type_t::asset);
  EXPECT_TRUE(accounts[0].is_active);
}

TEST(ledger_storage, periods_round_trip_with_close_stamps) {
  auto fixture = folio::testing::ledger_fixture{"folio_storage_periods"};
  auto period = fixture.add_period(3);
  period.status = period_status_t::closed;
  period.closed_at = make_date(2025, 4, 2);
  period.closed_by = "closer";
  fixture.storage().put_fiscal_period(period);

  auto loaded = fixture.storage().find_fiscal_period(period.id);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->status, period_status_t::closed);
  EXPECT_EQ(loaded->start_date, make_date(2025, 3, 1));
  EXPECT_EQ(loaded->end_date, make_date(2025, 3, 31));
  EXPECT_EQ(loaded->closed_at, make_date(2025, 4, 2));
  EXPECT_EQ(loaded->closed_by, "closer");
  EXPECT_FALSE(fixture.storage().find_fiscal_period("missing").has_value());
}

TEST(ledger_storage, next_period_and_period_for_date) {
  auto fixture = folio::testing::ledger_fixture{"folio_storage_next"};
  auto march = fixture.add_period(3);
  auto april = fixture.add_period(4);

  auto next = fixture.storage().find_next_period(march);
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(next->id, april.id);
  EXPECT_FALSE(fixture.storage().find_next_period(april).has_value());

  auto covering = fixture.storage().find_period_for_date(
      "tenant-1", "company-1", make_date(2025, 4, 30));
  ASSERT_TRUE(covering.has_value());
  EXPECT_EQ(covering->id, april.id);
  EXPECT_FALSE(fixture.storage()
                   .find_period_for_date("tenant-1", "company-1",
                                         make_date(2025, 5, 1))
                   .has_value());
}

TEST(ledger_storage, compare_and_set_rejects_stale_status) {
  auto fixture = folio::testing::ledger_fixture{"folio_storage_cas"};
  auto period = fixture.add_period(1);
  auto closed = period;
  closed.status = period_status_t::closed;
  EXPECT_TRUE(
      fixture.storage().compare_and_set_period(period_status_t::open, closed));
  EXPECT_FALSE(
      fixture.storage().compare_and_set_period(period_status_t::open, closed));
  EXPECT_EQ(fixture.storage().find_fiscal_period(period.id)->status,
            period_status_t::closed);
}

TEST(ledger_storage, journal_queries_respect_status_and_dates) {
  auto fixture = folio::testing::ledger_fixture{"folio_storage_journals"};
  fixture.add_journal("j1", make_date(2025, 3, 5), journal_status_t::draft, 10,
                      10);
  fixture.add_journal("j2", make_date(2025, 3, 6),
                      journal_status_t::pending_approval, 10, 10);
  fixture.add_journal("j3", make_date(2025, 4, 1), journal_status_t::draft, 10,
                      10);
  fixture.add_journal("j4", make_date(2025, 3, 7), journal_status_t::posted,
                      100.10, 100.05);
  fixture.add_journal("j5", make_date(2025, 4, 2), journal_status_t::posted,
                      50, 50);

  EXPECT_EQ(fixture.storage().count_unposted_journals(
                "tenant-1", "company-1", make_date(2025, 3, 1),
                make_date(2025, 3, 31)),
            2u);
  auto totals = fixture.storage().trial_balance_as_of("tenant-1", "company-1",
                                                      make_date(2025, 3, 31));
  EXPECT_DOUBLE_EQ(totals.total_debits, 100.10);
  EXPECT_DOUBLE_EQ(totals.total_credits, 100.05);
}

TEST(ledger_storage, accruals_without_reversal_are_listed_once) {
  auto fixture = folio::testing::ledger_fixture{"folio_storage_accruals"};
  fixture.add_journal("acc", make_date(2025, 3, 31), journal_status_t::posted,
                      500, 500, std::string{"MAR-ACCRUAL-01"});
  fixture.add_journal("plain", make_date(2025, 3, 31),
                      journal_status_t::posted, 500, 500, std::string{"INV-1"});

  auto accruals = fixture.storage().list_unreversed_accruals(
      "tenant-1", "company-1", make_date(2025, 3, 1), make_date(2025, 3, 31));
  ASSERT_EQ(accruals.size(), 1u);
  EXPECT_EQ(accruals[0].id, "acc");

  auto entry = folio::schema::reversing_entry_t{
      .id = "rev-acc",
      .tenant_id = "tenant-1",
      .company_id = "company-1",
      .original_journal_id = "acc",
      .reversal_date = make_date(2025, 4, 1),
      .reversal_reason = "reverse",
      .created_by = "closer"};
  EXPECT_TRUE(fixture.storage().insert_reversing_entry(entry));
  EXPECT_FALSE(fixture.storage().insert_reversing_entry(entry));
  EXPECT_TRUE(fixture.storage()
                  .list_unreversed_accruals("tenant-1", "company-1",
                                            make_date(2025, 3, 1),
                                            make_date(2025, 3, 31))
                  .empty());
  EXPECT_EQ(fixture.storage().list_reversing_entries("tenant-1", "company-1")
                .size(),
            1u);
}

TEST(ledger_storage, deactivating_locks_keeps_history) {
  auto fixture = folio::testing::ledger_fixture{"folio_storage_locks"};
  auto period = fixture.add_period(2);
  for (auto id : {"lock-a", "lock-b"}) {
    fixture.storage().insert_period_lock(folio::schema::period_lock_t{
        .id = id,
        .tenant_id = period.tenant_id,
        .company_id = period.company_id,
        .fiscal_period_id = period.id,
        .lock_type = folio::schema::lock_type_t::posting,
        .locked_by = "locker",
        .locked_at = make_date(2025, 3, 1),
        .reason = "test"});
  }
  EXPECT_EQ(fixture.storage().deactivate_period_locks(period.id), 2u);
  EXPECT_EQ(fixture.storage().deactivate_period_locks(period.id), 0u);
  auto locks = fixture.storage().list_period_locks(period.id);
  ASSERT_EQ(locks.size(), 2u);
  EXPECT_FALSE(locks[0].is_active);
  EXPECT_FALSE(locks[1].is_active);
}

namespace {

folio::schema::period_lock_t unnamed_lock(
    const folio::schema::fiscal_period_t& period) {
  return folio::schema::period_lock_t{
      .tenant_id = period.tenant_id,
      .company_id = period.company_id,
      .fiscal_period_id = period.id,
      .lock_type = folio::schema::lock_type_t::posting,
      .locked_by = "locker",
      .locked_at = make_date(2025, 3, 1),
      .reason = "test"};
}

}  // namespace

TEST(ledger_storage, lock_ids_are_assigned_per_period_sequence) {
  auto fixture = folio::testing::ledger_fixture{"folio_storage_lock_ids"};
  auto period = fixture.add_period(2);
  auto first = fixture.storage().insert_period_lock(unnamed_lock(period));
  auto second = fixture.storage().insert_period_lock(unnamed_lock(period));
  EXPECT_FALSE(first.id.empty());
  EXPECT_NE(first.id, second.id);
  EXPECT_EQ(fixture.storage().list_period_locks(period.id).size(), 2u);
}

TEST(ledger_storage, transition_writes_status_and_lock_together) {
  auto fixture = folio::testing::ledger_fixture{"folio_storage_transition"};
  auto period = fixture.add_period(3);
  auto closed = period;
  closed.status = period_status_t::closed;

  auto stored = fixture.storage().compare_and_set_period(
      period_status_t::open, closed, unnamed_lock(period));
  ASSERT_TRUE(stored.has_value());
  EXPECT_FALSE(stored->id.empty());
  EXPECT_EQ(fixture.storage().find_fiscal_period(period.id)->status,
            period_status_t::closed);

  auto stale = fixture.storage().compare_and_set_period(
      period_status_t::open, closed, unnamed_lock(period));
  EXPECT_FALSE(stale.has_value());
  EXPECT_EQ(fixture.storage().list_period_locks(period.id).size(), 1u);
}

TEST(ledger_storage, reopen_clears_locks_only_when_status_matches) {
  auto fixture = folio::testing::ledger_fixture{"folio_storage_reopen"};
  auto period = fixture.add_period(4);
  auto closed = period;
  closed.status = period_status_t::closed;
  ASSERT_TRUE(fixture.storage()
                  .compare_and_set_period(period_status_t::open, closed,
                                          unnamed_lock(period))
                  .has_value());

  EXPECT_FALSE(fixture.storage()
                   .reopen_period(period_status_t::locked, period)
                   .has_value());
  EXPECT_TRUE(fixture.storage().list_period_locks(period.id)[0].is_active);

  auto deactivated =
      fixture.storage().reopen_period(period_status_t::closed, period);
  ASSERT_TRUE(deactivated.has_value());
  EXPECT_EQ(*deactivated, 1u);
  EXPECT_EQ(fixture.storage().find_fiscal_period(period.id)->status,
            period_status_t::open);
  EXPECT_FALSE(fixture.storage().list_period_locks(period.id)[0].is_active);
}
