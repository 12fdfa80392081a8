#pragma once
#include <folio/schema/posting_context.hpp>
#include <folio/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: bill posting input.
// AP source document, the mirror image of an invoice.
namespace folio::schema {

template <uint16_t Version>
struct bill_line;

template <>
struct bill_line<1> final {
  uint16_t version{1};
  std::string description;
  amount_t quantity{};
  amount_t unit_price{};
  amount_t line_amount{};
  std::optional<amount_t> tax_rate;
  amount_t tax_amount{};
  std::optional<std::string> tax_code;
  std::string expense_account_id;
};

using bill_line_t = bill_line<1>;

template <uint16_t Version>
struct bill_tax_line;

/// Recoverable input tax, debited to its own account.
template <>
struct bill_tax_line<1> final {
  uint16_t version{1};
  std::string tax_code;
  amount_t tax_rate{};
  amount_t tax_amount{};
  std::string tax_account_id;
};

using bill_tax_line_t = bill_tax_line<1>;

template <uint16_t Version>
struct bill_posting_input;

template <>
struct bill_posting_input<1> final {
  uint16_t version{1};
  posting_context_t context;
  std::string bill_id;
  std::string bill_number;
  std::string supplier_id;
  std::string supplier_name;
  date_t bill_date{};
  std::optional<date_t> due_date;
  std::string currency;
  std::optional<amount_t> exchange_rate;
  std::string ap_account_id;
  std::optional<std::string> description;
  std::vector<bill_line_t> lines;
  std::vector<bill_tax_line_t> tax_lines;
};

using bill_posting_input_t = bill_posting_input<1>;

}  // namespace folio::schema
