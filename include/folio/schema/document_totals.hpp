#pragma once
#include <folio/schema/primitives.hpp>
#include <cstdint>

namespace folio::schema {

template <uint16_t Version>
struct document_totals;

/// Subtotal, tax and grand total of a document, each rounded to two decimals
/// after summation.
template <>
struct document_totals<1> final {
  uint16_t version{1};
  amount_t subtotal{};
  amount_t tax_amount{};
  amount_t total_amount{};
};

using document_totals_t = document_totals<1>;

}  // namespace folio::schema
