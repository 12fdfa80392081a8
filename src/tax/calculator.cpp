#include <folio/tax/calculator.hpp>

namespace folio::tax {

folio::schema::amount_t compute_line_tax(
    const folio::schema::amount_t line_amount,
    const folio::schema::amount_t tax_rate) {
  return folio::schema::round_amount(line_amount * tax_rate);
}

std::optional<tax_mismatch> validate_line_tax(
    const folio::schema::amount_t line_amount,
    const folio::schema::amount_t tax_rate,
    const folio::schema::amount_t supplied_tax_amount) {
  auto expected = line_amount * tax_rate;
  auto difference = supplied_tax_amount - expected;
  if (!folio::schema::exceeds_tolerance(difference)) {
    return std::nullopt;
  }
  return tax_mismatch{.expected = expected,
                      .supplied = supplied_tax_amount,
                      .difference = difference};
}

folio::schema::document_totals_t make_totals(
    const folio::schema::amount_t subtotal,
    const folio::schema::amount_t tax) {
  auto rounded_subtotal = folio::schema::round_amount(subtotal);
  auto rounded_tax = folio::schema::round_amount(tax);
  return folio::schema::document_totals_t{
      .subtotal = rounded_subtotal,
      .tax_amount = rounded_tax,
      .total_amount = folio::schema::round_amount(rounded_subtotal + rounded_tax)};
}

}  // namespace folio::tax
