#pragma once

#include <folio/schema/document_totals.hpp>
#include <folio/schema/line_validation_result.hpp>
#include <folio/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <fmt/format.h>

namespace folio::tax {

struct tax_mismatch final {
  folio::schema::amount_t expected{};
  folio::schema::amount_t supplied{};
  folio::schema::amount_t difference{};
};

/// line_amount * tax_rate, rounded half away from zero to two decimals.
folio::schema::amount_t compute_line_tax(folio::schema::amount_t line_amount,
                                         folio::schema::amount_t tax_rate);

/// std::nullopt when the supplied tax is within one cent of
/// line_amount * tax_rate.
std::optional<tax_mismatch> validate_line_tax(
    folio::schema::amount_t line_amount,
    folio::schema::amount_t tax_rate,
    folio::schema::amount_t supplied_tax_amount);

/// Build totals from raw sums. Rounding happens here and only here.
folio::schema::document_totals_t make_totals(folio::schema::amount_t subtotal,
                                             folio::schema::amount_t tax);

template <typename Line>
folio::schema::amount_t line_tax_total(const std::vector<Line>& lines) {
  auto tax = folio::schema::amount_t{};
  for (const auto& line : lines) {
    tax += line.tax_amount;
  }
  return tax;
}

template <typename TaxLine>
folio::schema::amount_t declared_tax_total(
    const std::vector<TaxLine>& tax_lines) {
  auto tax = folio::schema::amount_t{};
  for (const auto& tax_line : tax_lines) {
    tax += tax_line.tax_amount;
  }
  return tax;
}

/// Reduce document lines (anything with line_amount and tax_amount) and the
/// declared tax lines (anything with tax_amount). Document tax comes from the
/// tax lines when any are declared, otherwise from the per-line tax.
template <typename Line, typename TaxLine>
folio::schema::document_totals_t totals(const std::vector<Line>& lines,
                                        const std::vector<TaxLine>& tax_lines) {
  auto subtotal = folio::schema::amount_t{};
  for (const auto& line : lines) {
    subtotal += line.line_amount;
  }
  auto tax = tax_lines.empty() ? line_tax_total(lines)
                               : declared_tax_total(tax_lines);
  return make_totals(subtotal, tax);
}

/// Only tax lines carry a tax account, so per-line tax must be covered by
/// them. Returns the error when line tax is undeclared or disagrees with the
/// tax lines by more than a cent.
template <typename Line, typename TaxLine>
std::optional<std::string> check_tax_coverage(
    const std::vector<Line>& lines,
    const std::vector<TaxLine>& tax_lines) {
  auto line_tax = folio::schema::round_amount(line_tax_total(lines));
  if (line_tax == 0.0) {
    return std::nullopt;
  }
  if (tax_lines.empty()) {
    return fmt::format("Line tax {:.2f} has no tax line to post to", line_tax);
  }
  auto declared = folio::schema::round_amount(declared_tax_total(tax_lines));
  if (folio::schema::exceeds_tolerance(declared - line_tax)) {
    return fmt::format("Tax lines total {:.2f} does not match line tax {:.2f}",
                       declared, line_tax);
  }
  return std::nullopt;
}

template <typename Line>
folio::schema::document_totals_t totals(const std::vector<Line>& lines) {
  return totals(lines, std::vector<Line>{});
}

/// Arithmetic checks shared by invoice and bill lines: positive quantity,
/// non-negative price and amount, amount == quantity * price, and
/// tax == amount * rate when a positive rate is present.
template <typename Line>
folio::schema::line_validation_result_t validate_lines(
    const std::vector<Line>& lines) {
  auto result = folio::schema::line_validation_result_t{};
  auto number = std::size_t{0};
  for (const auto& line : lines) {
    ++number;
    if (line.quantity <= 0.0) {
      result.errors.push_back(
          fmt::format("Line {}: Quantity must be positive", number));
    }
    if (line.unit_price < 0.0) {
      result.errors.push_back(
          fmt::format("Line {}: Unit price cannot be negative", number));
    }
    if (line.line_amount < 0.0) {
      result.errors.push_back(
          fmt::format("Line {}: Line amount cannot be negative", number));
    }
    auto expected_amount = line.quantity * line.unit_price;
    if (folio::schema::exceeds_tolerance(line.line_amount - expected_amount)) {
      result.errors.push_back(fmt::format(
          "Line {}: Line amount {:.2f} does not match quantity × unit price "
          "{:.2f}",
          number, line.line_amount, expected_amount));
    }
    if (line.tax_rate && *line.tax_rate > 0.0) {
      if (auto mismatch =
              validate_line_tax(line.line_amount, *line.tax_rate,
                                line.tax_amount)) {
        result.errors.push_back(fmt::format(
            "Line {}: Tax amount {:.2f} does not match line amount × tax "
            "rate {:.2f}",
            number, mismatch->supplied, mismatch->expected));
      }
    }
  }
  result.valid = result.errors.empty();
  return result;
}

}  // namespace folio::tax
