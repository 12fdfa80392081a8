#pragma once
#include <folio/schema/posting_context.hpp>
#include <folio/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: invoice posting input.
// AR source document. Transformed into a journal and then discarded.
namespace folio::schema {

template <uint16_t Version>
struct invoice_line;

template <>
struct invoice_line<1> final {
  uint16_t version{1};
  std::string description;
  amount_t quantity{};
  amount_t unit_price{};
  amount_t line_amount{};
  std::optional<amount_t> tax_rate;
  amount_t tax_amount{};
  std::optional<std::string> tax_code;
  std::string revenue_account_id;
};

using invoice_line_t = invoice_line<1>;

template <uint16_t Version>
struct invoice_tax_line;

template <>
struct invoice_tax_line<1> final {
  uint16_t version{1};
  std::string tax_code;
  amount_t tax_rate{};
  amount_t tax_amount{};
  std::string tax_account_id;
};

using invoice_tax_line_t = invoice_tax_line<1>;

template <uint16_t Version>
struct invoice_posting_input;

template <>
struct invoice_posting_input<1> final {
  uint16_t version{1};
  posting_context_t context;
  std::string invoice_id;
  std::string invoice_number;
  std::string customer_id;
  std::string customer_name;
  date_t invoice_date{};
  std::optional<date_t> due_date;
  std::string currency;
  std::optional<amount_t> exchange_rate;
  std::string ar_account_id;
  std::optional<std::string> description;
  std::vector<invoice_line_t> lines;
  std::vector<invoice_tax_line_t> tax_lines;
};

using invoice_posting_input_t = invoice_posting_input<1>;

}  // namespace folio::schema
