#pragma once
#include <folio/schema/account.hpp>
#include <folio/schema/fiscal_period.hpp>
#include <folio/schema/journal_record.hpp>
#include <folio/schema/period_lock.hpp>
#include <folio/schema/period_status.hpp>
#include <folio/schema/primitives.hpp>
#include <folio/schema/reversing_entry.hpp>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace folio::storage {

/// Infrastructure failure in the backing store. Never used for business
/// rule outcomes.
class storage_error final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// Sum of posted debits and credits as of a date, in base currency.
struct trial_balance_totals final {
  folio::schema::amount_t total_debits{};
  folio::schema::amount_t total_credits{};
};

/// Typed data-access port for the ledger. Backends specialise this template
/// by tag. Every member may throw storage_error.
template <typename Library>
struct storage {
  /// Chart of accounts for one company.
  std::vector<folio::schema::account_t> list_accounts(
      const std::string& tenant_id,
      const std::string& company_id) const;
  void put_account(const std::string& tenant_id,
                   const std::string& company_id,
                   const folio::schema::account_t& account) const;

  std::optional<folio::schema::fiscal_period_t> find_fiscal_period(
      const std::string& fiscal_period_id) const;
  /// Administrative create or replace. Lifecycle code uses
  /// compare_and_set_period instead.
  void put_fiscal_period(const folio::schema::fiscal_period_t& period) const;
  /// Same calendar, period_number + 1.
  std::optional<folio::schema::fiscal_period_t> find_next_period(
      const folio::schema::fiscal_period_t& period) const;
  /// Period whose [start_date, end_date] contains `date`.
  std::optional<folio::schema::fiscal_period_t> find_period_for_date(
      const std::string& tenant_id,
      const std::string& company_id,
      folio::schema::date_t date) const;
  /// Write `updated` only if the stored status still equals `expected`.
  bool compare_and_set_period(folio::schema::period_status_t expected,
                              const folio::schema::fiscal_period_t& updated);
  /// Status compare-and-set that stores `lock` in the same write batch.
  /// Returns the stored lock, or std::nullopt when the status moved.
  std::optional<folio::schema::period_lock_t> compare_and_set_period(
      folio::schema::period_status_t expected,
      const folio::schema::fiscal_period_t& updated,
      folio::schema::period_lock_t lock);
  /// Status compare-and-set that deactivates every active lock of the period
  /// in the same write batch. Returns the number deactivated, or
  /// std::nullopt when the status moved.
  std::optional<uint64_t> reopen_period(
      folio::schema::period_status_t expected,
      const folio::schema::fiscal_period_t& updated);

  void put_journal(const folio::schema::journal_record_t& journal) const;
  /// Draft or pending-approval journals dated within [from, to].
  uint64_t count_unposted_journals(const std::string& tenant_id,
                                   const std::string& company_id,
                                   folio::schema::date_t from,
                                   folio::schema::date_t to) const;
  trial_balance_totals trial_balance_as_of(const std::string& tenant_id,
                                    const std::string& company_id,
                                    folio::schema::date_t as_of) const;
  /// Posted accrual journals dated within [from, to] that have no reversing
  /// entry yet.
  std::vector<folio::schema::journal_record_t> list_unreversed_accruals(
      const std::string& tenant_id,
      const std::string& company_id,
      folio::schema::date_t from,
      folio::schema::date_t to) const;

  /// Locks with an empty id get one derived from the period's lock count.
  folio::schema::period_lock_t insert_period_lock(
      folio::schema::period_lock_t lock);
  std::vector<folio::schema::period_lock_t> list_period_locks(
      const std::string& fiscal_period_id) const;
  /// Returns the number of locks that were active.
  uint64_t deactivate_period_locks(const std::string& fiscal_period_id);

  bool has_reversing_entry(const std::string& tenant_id,
                           const std::string& company_id,
                           const std::string& original_journal_id) const;
  /// False, and nothing written, when the journal already has one.
  bool insert_reversing_entry(const folio::schema::reversing_entry_t& entry);
  std::vector<folio::schema::reversing_entry_t> list_reversing_entries(
      const std::string& tenant_id,
      const std::string& company_id) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace folio::storage
