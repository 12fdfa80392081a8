#pragma once
#include <folio/schema/allocation_type.hpp>
#include <folio/schema/payment_method.hpp>
#include <folio/schema/posting_context.hpp>
#include <folio/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: payment posting input.
// A single bank movement settling one or more bills and/or invoices.
namespace folio::schema {

template <uint16_t Version>
struct payment_allocation;

template <>
struct payment_allocation<1> final {
  uint16_t version{1};
  allocation_type_t type{allocation_type_t::bill};
  std::string document_id;
  std::string document_number;
  amount_t amount{};
  std::optional<std::string> ap_account_id;
  std::optional<std::string> ar_account_id;
  std::optional<std::string> supplier_id;
  std::optional<std::string> customer_id;
};

using payment_allocation_t = payment_allocation<1>;

template <uint16_t Version>
struct payment_posting_input;

template <>
struct payment_posting_input<1> final {
  uint16_t version{1};
  posting_context_t context;
  std::string payment_id;
  std::string payment_number;
  date_t payment_date{};
  payment_method_t payment_method{payment_method_t::bank_transfer};
  std::string bank_account_id;
  std::string currency;
  amount_t exchange_rate{1.0};
  amount_t amount{};
  std::optional<std::string> reference;
  std::optional<std::string> description;
  std::vector<payment_allocation_t> allocations;
};

using payment_posting_input_t = payment_posting_input<1>;

}  // namespace folio::schema
