#pragma once
#include <folio/schema/journal_record.hpp>
#include <folio/schema/journal_validation_result.hpp>
#include <folio/schema/posting_error_code.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: ledger posting result.
// Outcome of posting a journal into the store: the validator report plus the
// summary row that was written.
namespace folio::schema {

template <uint16_t Version>
struct ledger_posting_result;

template <>
struct ledger_posting_result<1> final {
  uint16_t version{1};
  bool success{};
  std::optional<journal_record_t> journal;
  std::optional<journal_validation_result_t> validation;
  std::optional<posting_error_code_t> code;
  std::string error;
};

using ledger_posting_result_t = ledger_posting_result<1>;

}  // namespace folio::schema
