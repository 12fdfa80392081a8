#pragma once
#include <folio/schema/journal_line.hpp>
#include <folio/schema/posting_context.hpp>
#include <folio/schema/primitives.hpp>
#include <folio/schema/sod_action.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: journal posting input.
// Proposed double-entry journal. Built by a caller or a sub-ledger adapter,
// validated once and then either accepted or discarded.
namespace folio::schema {

template <uint16_t Version>
struct journal_posting_input;

template <>
struct journal_posting_input<1> final {
  uint16_t version{1};
  std::string journal_number;
  std::optional<std::string> description;
  /// Header reference. Posted journals whose reference contains ACCRUAL are
  /// reversed at period close.
  std::optional<std::string> reference;
  date_t journal_date{};
  std::string currency;
  /// Transaction-currency to base-currency rate. Required when currency
  /// differs from the base currency.
  std::optional<amount_t> exchange_rate;
  std::vector<journal_line_t> lines;
  posting_context_t context;
  sod_action_t action{sod_action_t::journal_post};
};

using journal_posting_input_t = journal_posting_input<1>;

}  // namespace folio::schema
