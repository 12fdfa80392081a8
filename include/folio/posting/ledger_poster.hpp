#pragma once

#include <folio/period/manager.hpp>
#include <folio/posting/journal_validator.hpp>
#include <folio/schema/journal_posting_input.hpp>
#include <folio/schema/ledger_posting_result.hpp>
#include <folio/sod/authorizer.hpp>
#include <folio/storage/rocksdb/storage.hpp>
#include <string>

namespace folio::posting {

/// Posts journals against the chart of accounts and period calendar held in
/// the store.
///
/// The company's accounts are loaded into a chart::registry per call, the
/// journal is validated in the configured base currency, and the journal date
/// must fall in an OPEN period without an active POSTING or FULL lock.
/// Accepted journals are recorded as POSTED, or PENDING_APPROVAL when the SoD
/// decision asks for approval. Storage failures propagate as storage_error.
class ledger_poster final {
 public:
  ledger_poster(folio::storage::ledger_storage_t& storage,
                const folio::period::manager& periods,
                const folio::sod::authorizer& authorizer,
                std::string base_currency,
                today_fn_t today = folio::schema::today);

  folio::schema::ledger_posting_result_t post(
      const folio::schema::journal_posting_input_t& input) const;

 private:
  folio::storage::ledger_storage_t& storage_;
  const folio::period::manager& periods_;
  const folio::sod::authorizer& authorizer_;
  std::string base_currency_;
  today_fn_t today_;
};

}  // namespace folio::posting
