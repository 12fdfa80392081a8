#include <folio/schema/key/builder.hpp>
#include <folio/schema/key/ledger_keys.hpp>

namespace folio::schema::key {

std::string make_period_lock_id(const std::string& fiscal_period_id,
                                const lock_type_t lock_type,
                                const uint64_t sequence) {
  return builder{}
      .write(kPeriodLockKeyPrefix)
      .write(fiscal_period_id)
      .write(static_cast<uint8_t>(lock_type))
      .write(sequence)
      .hex_digest();
}

std::string make_journal_id(const std::string& tenant_id,
                            const std::string& company_id,
                            const std::string& journal_number) {
  return builder{}
      .write(kJournalKeyPrefix)
      .write(tenant_id)
      .write(company_id)
      .write(journal_number)
      .hex_digest();
}

std::string make_reversing_entry_id(const std::string& tenant_id,
                                    const std::string& company_id,
                                    const std::string& original_journal_id) {
  return builder{}
      .write(kReversingEntryKeyPrefix)
      .write(tenant_id)
      .write(company_id)
      .write(original_journal_id)
      .hex_digest();
}

}  // namespace folio::schema::key
