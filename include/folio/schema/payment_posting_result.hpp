#pragma once
#include <folio/schema/journal_posting_input.hpp>
#include <folio/schema/journal_validation_result.hpp>
#include <folio/schema/posting_error_code.hpp>
#include <folio/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace folio::schema {

template <uint16_t Version>
struct payment_summary;

template <>
struct payment_summary<1> final {
  uint16_t version{1};
  amount_t bill_payments{};
  amount_t invoice_receipts{};
  amount_t total_amount{};
  std::size_t bill_count{};
  std::size_t invoice_count{};
};

using payment_summary_t = payment_summary<1>;

template <uint16_t Version>
struct payment_posting_result;

template <>
struct payment_posting_result<1> final {
  uint16_t version{1};
  bool success{};
  std::optional<journal_posting_input_t> journal;
  std::optional<journal_validation_result_t> validation;
  amount_t total_amount{};
  std::size_t allocations_processed{};
  std::optional<posting_error_code_t> code;
  std::optional<posting_error_code_t> journal_code;
  std::string error;
  std::vector<std::string> errors;
};

using payment_posting_result_t = payment_posting_result<1>;

}  // namespace folio::schema
