#pragma once
#include <folio/schema/document_totals.hpp>
#include <folio/schema/journal_posting_input.hpp>
#include <folio/schema/journal_validation_result.hpp>
#include <folio/schema/posting_error_code.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: document posting result.
// Outcome of an invoice or bill adapter. On success carries the journal that
// was validated; persistence belongs to the caller.
namespace folio::schema {

template <uint16_t Version>
struct document_posting_result;

template <>
struct document_posting_result<1> final {
  uint16_t version{1};
  bool success{};
  std::optional<journal_posting_input_t> journal;
  std::optional<journal_validation_result_t> validation;
  document_totals_t totals;
  std::optional<posting_error_code_t> code;
  /// Validator code behind a BUSINESS_RULE_VIOLATION wrapper.
  std::optional<posting_error_code_t> journal_code;
  std::string error;
};

using document_posting_result_t = document_posting_result<1>;

}  // namespace folio::schema
