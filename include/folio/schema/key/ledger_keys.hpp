#pragma once

#include <folio/schema/lock_type.hpp>
#include <folio/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <tuple>

// Schema key type: ledger keys.
// Canonical key prefixes and key codecs for the ledger store. Keys are the
// encoded prefix followed by the encoded id tuple, so encoding a shorter
// tuple yields a scan prefix for everything beneath it.
namespace folio::schema::key {

inline constexpr std::string_view kAccountKeyPrefix{"LEDGER|ACCOUNT|"};
inline constexpr std::string_view kPeriodKeyPrefix{"LEDGER|PERIOD|"};
inline constexpr std::string_view kJournalKeyPrefix{"LEDGER|JOURNAL|"};
inline constexpr std::string_view kPeriodLockKeyPrefix{"LEDGER|LOCK|"};
inline constexpr std::string_view kReversingEntryKeyPrefix{"LEDGER|REVERSAL|"};

template <typename Encoder, typename T>
folio::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                         std::string_view prefix,
                                         const T& id) {
  auto key = encoder.encode(std::string{prefix});
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
folio::schema::bytes_t make_prefix_key(Encoder& encoder,
                                       std::string_view prefix) {
  return encoder.encode(std::string{prefix});
}

template <typename Encoder>
folio::schema::bytes_t make_account_key(Encoder& encoder,
                                        const std::string& tenant_id,
                                        const std::string& company_id,
                                        const std::string& account_id) {
  return make_prefixed_key(encoder, kAccountKeyPrefix,
                           std::tuple{tenant_id, company_id, account_id});
}

template <typename Encoder>
folio::schema::bytes_t make_account_prefix(Encoder& encoder,
                                           const std::string& tenant_id,
                                           const std::string& company_id) {
  return make_prefixed_key(encoder, kAccountKeyPrefix,
                           std::tuple{tenant_id, company_id});
}

template <typename Encoder>
folio::schema::bytes_t make_period_key(Encoder& encoder,
                                       const std::string& fiscal_period_id) {
  return make_prefixed_key(encoder, kPeriodKeyPrefix, fiscal_period_id);
}

template <typename Encoder>
folio::schema::bytes_t make_journal_key(Encoder& encoder,
                                        const std::string& tenant_id,
                                        const std::string& company_id,
                                        const std::string& journal_id) {
  return make_prefixed_key(encoder, kJournalKeyPrefix,
                           std::tuple{tenant_id, company_id, journal_id});
}

template <typename Encoder>
folio::schema::bytes_t make_journal_prefix(Encoder& encoder,
                                           const std::string& tenant_id,
                                           const std::string& company_id) {
  return make_prefixed_key(encoder, kJournalKeyPrefix,
                           std::tuple{tenant_id, company_id});
}

template <typename Encoder>
folio::schema::bytes_t make_period_lock_key(Encoder& encoder,
                                            const std::string& fiscal_period_id,
                                            const std::string& lock_id) {
  return make_prefixed_key(encoder, kPeriodLockKeyPrefix,
                           std::tuple{fiscal_period_id, lock_id});
}

template <typename Encoder>
folio::schema::bytes_t make_period_lock_prefix(
    Encoder& encoder,
    const std::string& fiscal_period_id) {
  return make_prefixed_key(encoder, kPeriodLockKeyPrefix, fiscal_period_id);
}

template <typename Encoder>
folio::schema::bytes_t make_reversing_entry_key(
    Encoder& encoder,
    const std::string& tenant_id,
    const std::string& company_id,
    const std::string& original_journal_id) {
  return make_prefixed_key(
      encoder, kReversingEntryKeyPrefix,
      std::tuple{tenant_id, company_id, original_journal_id});
}

template <typename Encoder>
folio::schema::bytes_t make_reversing_entry_prefix(
    Encoder& encoder,
    const std::string& tenant_id,
    const std::string& company_id) {
  return make_prefixed_key(encoder, kReversingEntryKeyPrefix,
                           std::tuple{tenant_id, company_id});
}

/// Deterministic lock id. `sequence` is the number of locks already recorded
/// for the period, so relocking after a reopen yields a fresh id.
std::string make_period_lock_id(const std::string& fiscal_period_id,
                                lock_type_t lock_type,
                                uint64_t sequence);

/// Deterministic journal id. Reposting the same journal number replaces the
/// stored summary.
std::string make_journal_id(const std::string& tenant_id,
                            const std::string& company_id,
                            const std::string& journal_number);

/// Deterministic reversing entry id. One per original journal.
std::string make_reversing_entry_id(const std::string& tenant_id,
                                    const std::string& company_id,
                                    const std::string& original_journal_id);

}  // namespace folio::schema::key
