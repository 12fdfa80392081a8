#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <folio/schema/encoding/scale/encoder.hpp>
#include <folio/storage/storage.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace folio::storage {

namespace detail {

using encoder_t = folio::schema::encoding::encoder<
    folio::schema::encoding::scale_encoder_tag>;

using raw_entry_t = std::pair<std::string, std::string>;

inline std::string to_key_string(const folio::schema::bytes_t& key) {
  return std::string{reinterpret_cast<const char*>(key.data()), key.size()};
}

inline folio::schema::bytes_view_t to_bytes_view(const std::string& value) {
  return folio::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

/// RocksDB ledger store. Rows are SCALE-encoded tuples under the prefixes in
/// folio/schema/key/ledger_keys.hpp. Amounts are stored in minor units and
/// dates as days since the Unix epoch.
template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;
  /// Serialises read-modify-write sequences (status CAS with its lock
  /// changes, lock id assignment, reversal insert).
  std::unique_ptr<std::mutex> write_mutex{std::make_unique<std::mutex>()};

  std::vector<folio::schema::account_t> list_accounts(
      const std::string& tenant_id,
      const std::string& company_id) const;
  void put_account(const std::string& tenant_id,
                   const std::string& company_id,
                   const folio::schema::account_t& account) const;

  std::optional<folio::schema::fiscal_period_t> find_fiscal_period(
      const std::string& fiscal_period_id) const;
  void put_fiscal_period(const folio::schema::fiscal_period_t& period) const;
  std::optional<folio::schema::fiscal_period_t> find_next_period(
      const folio::schema::fiscal_period_t& period) const;
  std::optional<folio::schema::fiscal_period_t> find_period_for_date(
      const std::string& tenant_id,
      const std::string& company_id,
      folio::schema::date_t date) const;
  bool compare_and_set_period(folio::schema::period_status_t expected,
                              const folio::schema::fiscal_period_t& updated);
  std::optional<folio::schema::period_lock_t> compare_and_set_period(
      folio::schema::period_status_t expected,
      const folio::schema::fiscal_period_t& updated,
      folio::schema::period_lock_t lock);
  std::optional<uint64_t> reopen_period(
      folio::schema::period_status_t expected,
      const folio::schema::fiscal_period_t& updated);

  void put_journal(const folio::schema::journal_record_t& journal) const;
  uint64_t count_unposted_journals(const std::string& tenant_id,
                                   const std::string& company_id,
                                   folio::schema::date_t from,
                                   folio::schema::date_t to) const;
  trial_balance_totals trial_balance_as_of(const std::string& tenant_id,
                                           const std::string& company_id,
                                           folio::schema::date_t as_of) const;
  std::vector<folio::schema::journal_record_t> list_unreversed_accruals(
      const std::string& tenant_id,
      const std::string& company_id,
      folio::schema::date_t from,
      folio::schema::date_t to) const;

  folio::schema::period_lock_t insert_period_lock(
      folio::schema::period_lock_t lock);
  std::vector<folio::schema::period_lock_t> list_period_locks(
      const std::string& fiscal_period_id) const;
  uint64_t deactivate_period_locks(const std::string& fiscal_period_id);

  bool has_reversing_entry(const std::string& tenant_id,
                           const std::string& company_id,
                           const std::string& original_journal_id) const;
  bool insert_reversing_entry(const folio::schema::reversing_entry_t& entry);
  std::vector<folio::schema::reversing_entry_t> list_reversing_entries(
      const std::string& tenant_id,
      const std::string& company_id) const;

 private:
  std::optional<std::string> get_raw(const std::string& key) const;
  void put_raw(const std::string& key, const folio::schema::bytes_t& value) const;
  std::vector<detail::raw_entry_t> list_by_prefix(
      const std::string& prefix) const;
  std::vector<folio::schema::journal_record_t> list_journals(
      const std::string& tenant_id,
      const std::string& company_id) const;
  std::vector<folio::schema::fiscal_period_t> list_fiscal_periods() const;
  void assign_lock_id(folio::schema::period_lock_t& lock) const;
  uint64_t stage_lock_deactivation(ROCKSDB_NAMESPACE::WriteBatch& batch,
                                   const std::string& fiscal_period_id) const;
  void write(ROCKSDB_NAMESPACE::WriteBatch& batch, std::string_view what) const;
  ROCKSDB_NAMESPACE::DB& db() const;
};

using ledger_storage_t = storage<rocksdb_storage_tag>;

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

}  // namespace folio::storage
