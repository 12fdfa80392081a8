#include <folio/common/critical.hpp>
#include <folio/schema/key/ledger_keys.hpp>
#include <folio/storage/rocksdb/storage.hpp>

#include <algorithm>
#include <iterator>
#include <tuple>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

using namespace folio::schema;

namespace {

using encoder_t = folio::storage::detail::encoder_t;
using folio::storage::detail::to_bytes_view;
using folio::storage::detail::to_key_string;
using folio::storage::storage_error;

inline constexpr auto kRowVersion = uint16_t{1};

using account_row_t = std::tuple<uint16_t,
                                 std::string,
                                 std::string,
                                 std::string,
                                 uint8_t,
                                 std::optional<std::string>,
                                 std::string,
                                 bool>;

using period_row_t = std::tuple<uint16_t,
                                std::string,
                                std::string,
                                std::string,
                                std::string,
                                uint32_t,
                                int64_t,
                                int64_t,
                                uint8_t,
                                std::optional<int64_t>,
                                std::optional<std::string>>;

using journal_row_t = std::tuple<uint16_t,
                                 std::string,
                                 std::string,
                                 std::string,
                                 std::string,
                                 std::optional<std::string>,
                                 std::string,
                                 int64_t,
                                 uint8_t,
                                 int64_t,
                                 int64_t>;

using lock_row_t = std::tuple<uint16_t,
                              std::string,
                              std::string,
                              std::string,
                              std::string,
                              uint8_t,
                              std::string,
                              int64_t,
                              std::string,
                              bool>;

using reversal_row_t = std::tuple<uint16_t,
                                  std::string,
                                  std::string,
                                  std::string,
                                  std::string,
                                  int64_t,
                                  std::string,
                                  uint8_t,
                                  std::string>;

template <typename Enum, std::size_t N>
Enum decode_enum(const uint8_t raw,
                 const enum_mappings_t<Enum, N>& mappings,
                 const std::string_view what) {
  auto value = static_cast<Enum>(raw);
  if (!to_string(value, mappings)) {
    throw storage_error{fmt::format("stored {} has unknown value {}", what, raw)};
  }
  return value;
}

template <typename Row>
Row decode_row(const std::string& raw, const std::string_view what) {
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<Row>(to_bytes_view(raw));
  if (!decoded) {
    throw storage_error{fmt::format("failed to decode {} row", what)};
  }
  return std::move(decoded.value());
}

std::optional<int64_t> to_row(const std::optional<date_t>& value) {
  if (!value) {
    return std::nullopt;
  }
  return to_epoch_days(*value);
}

std::optional<date_t> from_row(const std::optional<int64_t>& value) {
  if (!value) {
    return std::nullopt;
  }
  return from_epoch_days(*value);
}

account_row_t to_row(const account_t& account) {
  return account_row_t{kRowVersion,
                       account.id,
                       account.code,
                       account.name,
                       static_cast<uint8_t>(account.type),
                       account.parent_id,
                       account.currency,
                       account.is_active};
}

account_t account_from_row(const std::string& raw) {
  auto [version, id, code, name, type, parent_id, currency, is_active] =
      decode_row<account_row_t>(raw, "account");
  return account_t{
      .version = version,
      .id = std::move(id),
      .code = std::move(code),
      .name = std::move(name),
      .type = decode_enum(type, kAccountTypeMappings, "account type"),
      .parent_id = std::move(parent_id),
      .currency = std::move(currency),
      .is_active = is_active};
}

period_row_t to_row(const fiscal_period_t& period) {
  return period_row_t{kRowVersion,
                      period.id,
                      period.tenant_id,
                      period.company_id,
                      period.fiscal_calendar_id,
                      period.period_number,
                      to_epoch_days(period.start_date),
                      to_epoch_days(period.end_date),
                      static_cast<uint8_t>(period.status),
                      to_row(period.closed_at),
                      period.closed_by};
}

fiscal_period_t period_from_row(const std::string& raw) {
  auto [version, id, tenant_id, company_id, calendar_id, number, start, end,
        status, closed_at, closed_by] = decode_row<period_row_t>(raw, "period");
  return fiscal_period_t{
      .version = version,
      .id = std::move(id),
      .tenant_id = std::move(tenant_id),
      .company_id = std::move(company_id),
      .fiscal_calendar_id = std::move(calendar_id),
      .period_number = number,
      .start_date = from_epoch_days(start),
      .end_date = from_epoch_days(end),
      .status = decode_enum(status, kPeriodStatusMappings, "period status"),
      .closed_at = from_row(closed_at),
      .closed_by = std::move(closed_by)};
}

journal_row_t to_row(const journal_record_t& journal) {
  return journal_row_t{kRowVersion,
                       journal.id,
                       journal.tenant_id,
                       journal.company_id,
                       journal.journal_number,
                       journal.reference,
                       journal.description,
                       to_epoch_days(journal.journal_date),
                       static_cast<uint8_t>(journal.status),
                       to_minor_units(journal.total_debit),
                       to_minor_units(journal.total_credit)};
}

journal_record_t journal_from_row(const std::string& raw) {
  auto [version, id, tenant_id, company_id, number, reference, description,
        date, status, debit, credit] = decode_row<journal_row_t>(raw, "journal");
  return journal_record_t{
      .version = version,
      .id = std::move(id),
      .tenant_id = std::move(tenant_id),
      .company_id = std::move(company_id),
      .journal_number = std::move(number),
      .reference = std::move(reference),
      .description = std::move(description),
      .journal_date = from_epoch_days(date),
      .status = decode_enum(status, kJournalStatusMappings, "journal status"),
      .total_debit = from_minor_units(debit),
      .total_credit = from_minor_units(credit)};
}

lock_row_t to_row(const period_lock_t& lock) {
  return lock_row_t{kRowVersion,
                    lock.id,
                    lock.tenant_id,
                    lock.company_id,
                    lock.fiscal_period_id,
                    static_cast<uint8_t>(lock.lock_type),
                    lock.locked_by,
                    to_epoch_days(lock.locked_at),
                    lock.reason,
                    lock.is_active};
}

period_lock_t lock_from_row(const std::string& raw) {
  auto [version, id, tenant_id, company_id, period_id, type, locked_by,
        locked_at, reason, is_active] = decode_row<lock_row_t>(raw, "lock");
  return period_lock_t{
      .version = version,
      .id = std::move(id),
      .tenant_id = std::move(tenant_id),
      .company_id = std::move(company_id),
      .fiscal_period_id = std::move(period_id),
      .lock_type = decode_enum(type, kLockTypeMappings, "lock type"),
      .locked_by = std::move(locked_by),
      .locked_at = from_epoch_days(locked_at),
      .reason = std::move(reason),
      .is_active = is_active};
}

reversal_row_t to_row(const reversing_entry_t& entry) {
  return reversal_row_t{kRowVersion,
                        entry.id,
                        entry.tenant_id,
                        entry.company_id,
                        entry.original_journal_id,
                        to_epoch_days(entry.reversal_date),
                        entry.reversal_reason,
                        static_cast<uint8_t>(entry.status),
                        entry.created_by};
}

reversing_entry_t reversal_from_row(const std::string& raw) {
  auto [version, id, tenant_id, company_id, journal_id, date, reason, status,
        created_by] = decode_row<reversal_row_t>(raw, "reversing entry");
  return reversing_entry_t{
      .version = version,
      .id = std::move(id),
      .tenant_id = std::move(tenant_id),
      .company_id = std::move(company_id),
      .original_journal_id = std::move(journal_id),
      .reversal_date = from_epoch_days(date),
      .reversal_reason = std::move(reason),
      .status = decode_enum(status, kReversingEntryStatusMappings,
                            "reversing entry status"),
      .created_by = std::move(created_by)};
}

template <typename Row>
bytes_t encode_row(const Row& row) {
  auto encoder = encoder_t{};
  return encoder.encode(row);
}

void stage_put(ROCKSDB_NAMESPACE::WriteBatch& batch,
               const std::string& key,
               const bytes_t& value) {
  auto status = batch.Put(
      key, ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(value.data()),
                                    value.size()});
  if (!status.ok()) {
    throw storage_error{
        fmt::format("failed to stage ledger row: {}", status.ToString())};
  }
}

std::string period_key(const std::string& fiscal_period_id) {
  auto encoder = encoder_t{};
  return to_key_string(
      folio::schema::key::make_period_key(encoder, fiscal_period_id));
}

std::string lock_key(const period_lock_t& lock) {
  auto encoder = encoder_t{};
  return to_key_string(folio::schema::key::make_period_lock_key(
      encoder, lock.fiscal_period_id, lock.id));
}

bool within(const date_t value, const date_t from, const date_t to) {
  return value >= from && value <= to;
}

}  // namespace

namespace folio::storage {

ROCKSDB_NAMESPACE::DB& storage<rocksdb_storage_tag>::db() const {
  if (!database) {
    folio::common::critical("RocksDB database is not initialized");
  }
  return *database;
}

std::optional<std::string> storage<rocksdb_storage_tag>::get_raw(
    const std::string& key) const {
  auto value = std::string{};
  auto status = db().Get(ROCKSDB_NAMESPACE::ReadOptions{}, key, &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    throw storage_error{
        fmt::format("failed to read ledger row: {}", status.ToString())};
  }
  return value;
}

void storage<rocksdb_storage_tag>::put_raw(const std::string& key,
                                           const bytes_t& value) const {
  auto value_slice = ROCKSDB_NAMESPACE::Slice{
      reinterpret_cast<const char*>(value.data()), value.size()};
  auto status = db().Put(ROCKSDB_NAMESPACE::WriteOptions{}, key, value_slice);
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    throw storage_error{
        fmt::format("failed to write ledger row: {}", status.ToString())};
  }
}

std::vector<detail::raw_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const std::string& prefix) const {
  auto entries = std::vector<detail::raw_entry_t>{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      db().NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(prefix); iterator->Valid(); iterator->Next()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix)) {
      break;
    }
    entries.emplace_back(iterator->key().ToString(),
                         iterator->value().ToString());
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB scan failed: {}", iterator->status().ToString());
    throw storage_error{fmt::format("failed to scan ledger rows: {}",
                                    iterator->status().ToString())};
  }
  return entries;
}

std::vector<account_t> storage<rocksdb_storage_tag>::list_accounts(
    const std::string& tenant_id,
    const std::string& company_id) const {
  auto encoder = encoder_t{};
  auto prefix = folio::schema::key::make_account_prefix(encoder, tenant_id,
                                                        company_id);
  auto accounts = std::vector<account_t>{};
  for (const auto& [key, value] : list_by_prefix(to_key_string(prefix))) {
    accounts.push_back(account_from_row(value));
  }
  return accounts;
}

void storage<rocksdb_storage_tag>::put_account(const std::string& tenant_id,
                                               const std::string& company_id,
                                               const account_t& account) const {
  auto encoder = encoder_t{};
  auto key = folio::schema::key::make_account_key(encoder, tenant_id,
                                                  company_id, account.id);
  put_raw(to_key_string(key), encode_row(to_row(account)));
}

std::optional<fiscal_period_t> storage<rocksdb_storage_tag>::find_fiscal_period(
    const std::string& fiscal_period_id) const {
  auto encoder = encoder_t{};
  auto key = folio::schema::key::make_period_key(encoder, fiscal_period_id);
  auto raw = get_raw(to_key_string(key));
  if (!raw) {
    return std::nullopt;
  }
  return period_from_row(*raw);
}

void storage<rocksdb_storage_tag>::put_fiscal_period(
    const fiscal_period_t& period) const {
  auto encoder = encoder_t{};
  auto key = folio::schema::key::make_period_key(encoder, period.id);
  put_raw(to_key_string(key), encode_row(to_row(period)));
}

std::vector<fiscal_period_t> storage<rocksdb_storage_tag>::list_fiscal_periods()
    const {
  auto encoder = encoder_t{};
  auto prefix = folio::schema::key::make_prefix_key(
      encoder, folio::schema::key::kPeriodKeyPrefix);
  auto periods = std::vector<fiscal_period_t>{};
  for (const auto& [key, value] : list_by_prefix(to_key_string(prefix))) {
    periods.push_back(period_from_row(value));
  }
  return periods;
}

std::optional<fiscal_period_t> storage<rocksdb_storage_tag>::find_next_period(
    const fiscal_period_t& period) const {
  for (auto& candidate : list_fiscal_periods()) {
    if (candidate.tenant_id == period.tenant_id &&
        candidate.company_id == period.company_id &&
        candidate.fiscal_calendar_id == period.fiscal_calendar_id &&
        candidate.period_number == period.period_number + 1) {
      return std::move(candidate);
    }
  }
  return std::nullopt;
}

std::optional<fiscal_period_t>
storage<rocksdb_storage_tag>::find_period_for_date(const std::string& tenant_id,
                                                   const std::string& company_id,
                                                   const date_t date) const {
  for (auto& candidate : list_fiscal_periods()) {
    if (candidate.tenant_id == tenant_id &&
        candidate.company_id == company_id &&
        within(date, candidate.start_date, candidate.end_date)) {
      return std::move(candidate);
    }
  }
  return std::nullopt;
}

bool storage<rocksdb_storage_tag>::compare_and_set_period(
    const period_status_t expected,
    const fiscal_period_t& updated) {
  auto lock = std::scoped_lock{*write_mutex};
  auto current = find_fiscal_period(updated.id);
  if (!current || current->status != expected) {
    return false;
  }
  put_fiscal_period(updated);
  return true;
}

std::optional<period_lock_t>
storage<rocksdb_storage_tag>::compare_and_set_period(
    const period_status_t expected,
    const fiscal_period_t& updated,
    period_lock_t period_lock) {
  auto lock = std::scoped_lock{*write_mutex};
  auto current = find_fiscal_period(updated.id);
  if (!current || current->status != expected) {
    return std::nullopt;
  }
  assign_lock_id(period_lock);
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  stage_put(batch, period_key(updated.id), encode_row(to_row(updated)));
  stage_put(batch, lock_key(period_lock), encode_row(to_row(period_lock)));
  write(batch, "period transition");
  return period_lock;
}

std::optional<uint64_t> storage<rocksdb_storage_tag>::reopen_period(
    const period_status_t expected,
    const fiscal_period_t& updated) {
  auto lock = std::scoped_lock{*write_mutex};
  auto current = find_fiscal_period(updated.id);
  if (!current || current->status != expected) {
    return std::nullopt;
  }
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  stage_put(batch, period_key(updated.id), encode_row(to_row(updated)));
  auto deactivated = stage_lock_deactivation(batch, updated.id);
  write(batch, "period reopen");
  return deactivated;
}

void storage<rocksdb_storage_tag>::put_journal(
    const journal_record_t& journal) const {
  auto encoder = encoder_t{};
  auto key = folio::schema::key::make_journal_key(
      encoder, journal.tenant_id, journal.company_id, journal.id);
  put_raw(to_key_string(key), encode_row(to_row(journal)));
}

std::vector<journal_record_t> storage<rocksdb_storage_tag>::list_journals(
    const std::string& tenant_id,
    const std::string& company_id) const {
  auto encoder = encoder_t{};
  auto prefix = folio::schema::key::make_journal_prefix(encoder, tenant_id,
                                                        company_id);
  auto journals = std::vector<journal_record_t>{};
  for (const auto& [key, value] : list_by_prefix(to_key_string(prefix))) {
    journals.push_back(journal_from_row(value));
  }
  return journals;
}

uint64_t storage<rocksdb_storage_tag>::count_unposted_journals(
    const std::string& tenant_id,
    const std::string& company_id,
    const date_t from,
    const date_t to) const {
  auto journals = list_journals(tenant_id, company_id);
  return static_cast<uint64_t>(
      std::ranges::count_if(journals, [&](const journal_record_t& journal) {
        return within(journal.journal_date, from, to) &&
               (journal.status == journal_status_t::draft ||
                journal.status == journal_status_t::pending_approval);
      }));
}

trial_balance_totals storage<rocksdb_storage_tag>::trial_balance_as_of(
    const std::string& tenant_id,
    const std::string& company_id,
    const date_t as_of) const {
  auto debits = minor_units_t{};
  auto credits = minor_units_t{};
  for (const auto& journal : list_journals(tenant_id, company_id)) {
    if (journal.status != journal_status_t::posted ||
        journal.journal_date > as_of) {
      continue;
    }
    debits += to_minor_units(journal.total_debit);
    credits += to_minor_units(journal.total_credit);
  }
  return trial_balance_totals{.total_debits = from_minor_units(debits),
                              .total_credits = from_minor_units(credits)};
}

std::vector<journal_record_t>
storage<rocksdb_storage_tag>::list_unreversed_accruals(
    const std::string& tenant_id,
    const std::string& company_id,
    const date_t from,
    const date_t to) const {
  auto accruals = std::vector<journal_record_t>{};
  for (auto& journal : list_journals(tenant_id, company_id)) {
    if (journal.status != journal_status_t::posted ||
        !within(journal.journal_date, from, to) || !journal.reference ||
        journal.reference->find("ACCRUAL") == std::string::npos) {
      continue;
    }
    if (has_reversing_entry(tenant_id, company_id, journal.id)) {
      continue;
    }
    accruals.push_back(std::move(journal));
  }
  return accruals;
}

period_lock_t storage<rocksdb_storage_tag>::insert_period_lock(
    period_lock_t period_lock) {
  auto lock = std::scoped_lock{*write_mutex};
  assign_lock_id(period_lock);
  put_raw(lock_key(period_lock), encode_row(to_row(period_lock)));
  return period_lock;
}

void storage<rocksdb_storage_tag>::assign_lock_id(
    period_lock_t& period_lock) const {
  if (!period_lock.id.empty()) {
    return;
  }
  auto sequence = list_period_locks(period_lock.fiscal_period_id).size();
  period_lock.id = folio::schema::key::make_period_lock_id(
      period_lock.fiscal_period_id, period_lock.lock_type, sequence);
}

std::vector<period_lock_t> storage<rocksdb_storage_tag>::list_period_locks(
    const std::string& fiscal_period_id) const {
  auto encoder = encoder_t{};
  auto prefix =
      folio::schema::key::make_period_lock_prefix(encoder, fiscal_period_id);
  auto locks = std::vector<period_lock_t>{};
  for (const auto& [key, value] : list_by_prefix(to_key_string(prefix))) {
    locks.push_back(lock_from_row(value));
  }
  return locks;
}

uint64_t storage<rocksdb_storage_tag>::deactivate_period_locks(
    const std::string& fiscal_period_id) {
  auto lock = std::scoped_lock{*write_mutex};
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  auto deactivated = stage_lock_deactivation(batch, fiscal_period_id);
  if (deactivated > 0) {
    write(batch, "lock deactivation");
  }
  return deactivated;
}

uint64_t storage<rocksdb_storage_tag>::stage_lock_deactivation(
    ROCKSDB_NAMESPACE::WriteBatch& batch,
    const std::string& fiscal_period_id) const {
  auto deactivated = uint64_t{0};
  for (auto period_lock : list_period_locks(fiscal_period_id)) {
    if (!period_lock.is_active) {
      continue;
    }
    period_lock.is_active = false;
    stage_put(batch, lock_key(period_lock), encode_row(to_row(period_lock)));
    ++deactivated;
  }
  return deactivated;
}

void storage<rocksdb_storage_tag>::write(ROCKSDB_NAMESPACE::WriteBatch& batch,
                                         const std::string_view what) const {
  auto status = db().Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!status.ok()) {
    spdlog::error("Failed to write {} batch to RocksDB: {}", what,
                  status.ToString());
    throw storage_error{
        fmt::format("failed to write {}: {}", what, status.ToString())};
  }
}

bool storage<rocksdb_storage_tag>::has_reversing_entry(
    const std::string& tenant_id,
    const std::string& company_id,
    const std::string& original_journal_id) const {
  auto encoder = encoder_t{};
  auto key = folio::schema::key::make_reversing_entry_key(
      encoder, tenant_id, company_id, original_journal_id);
  return get_raw(to_key_string(key)).has_value();
}

bool storage<rocksdb_storage_tag>::insert_reversing_entry(
    const reversing_entry_t& entry) {
  auto lock = std::scoped_lock{*write_mutex};
  if (has_reversing_entry(entry.tenant_id, entry.company_id,
                          entry.original_journal_id)) {
    return false;
  }
  auto encoder = encoder_t{};
  auto key = folio::schema::key::make_reversing_entry_key(
      encoder, entry.tenant_id, entry.company_id, entry.original_journal_id);
  put_raw(to_key_string(key), encode_row(to_row(entry)));
  return true;
}

std::vector<reversing_entry_t>
storage<rocksdb_storage_tag>::list_reversing_entries(
    const std::string& tenant_id,
    const std::string& company_id) const {
  auto encoder = encoder_t{};
  auto prefix = folio::schema::key::make_reversing_entry_prefix(
      encoder, tenant_id, company_id);
  auto entries = std::vector<reversing_entry_t>{};
  for (const auto& [key, value] : list_by_prefix(to_key_string(prefix))) {
    entries.push_back(reversal_from_row(value));
  }
  return entries;
}

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    throw storage_error{fmt::format("failed to open ledger store at {}: {}",
                                    path, status.ToString())};
  }
  spdlog::info("Opened ledger store at {}", path);
  store.database.reset(database);

  return store;
}

}  // namespace folio::storage
