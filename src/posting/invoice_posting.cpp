#include <folio/fx/policy.hpp>
#include <folio/posting/document_posting.hpp>
#include <folio/posting/invoice_posting.hpp>
#include <folio/tax/calculator.hpp>

#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

using namespace folio::schema;

namespace folio::posting {

document_posting_result_t post_invoice(const invoice_posting_input_t& input,
                                       const journal_validator& validator) {
  if (input.invoice_id.empty() || input.ar_account_id.empty() ||
      input.lines.empty()) {
    return detail::reject_document(
        posting_error_code_t::invalid_amounts,
        "Missing required fields: invoice id, AR account or lines", {});
  }

  auto totals = calculate_invoice_totals(input.lines, input.tax_lines);
  if (totals.subtotal <= 0.0) {
    return detail::reject_document(posting_error_code_t::invalid_amounts,
                                   "Invoice revenue must be positive", totals);
  }
  if (totals.total_amount <= 0.0) {
    return detail::reject_document(posting_error_code_t::invalid_amounts,
                                   "Invoice total amount must be positive",
                                   totals);
  }

  if (auto tax_error = folio::tax::check_tax_coverage(input.lines,
                                                      input.tax_lines)) {
    return detail::reject_document(posting_error_code_t::invalid_amounts,
                                   std::move(*tax_error), totals);
  }

  const auto& base = validator.base_currency();
  if (folio::fx::validate_rate(base, input.currency, input.exchange_rate) !=
      folio::fx::rate_status_t::ok) {
    return detail::reject_document(
        posting_error_code_t::invalid_currency,
        fmt::format("Exchange rate required for {} to {} conversion",
                    input.currency, base),
        totals);
  }
  auto rate = folio::fx::effective_rate(base, input.currency,
                                        input.exchange_rate);

  auto journal = journal_posting_input_t{};
  journal.journal_number = input.invoice_number;
  journal.description = input.description.value_or(fmt::format(
      "Invoice {} - {}", input.invoice_number, input.customer_name));
  journal.journal_date = input.invoice_date;
  journal.currency = base;
  journal.context = input.context;
  journal.action = sod_action_t::invoice_post;

  journal.lines.push_back(journal_line_t{
      .account_id = input.ar_account_id,
      .debit = totals.total_amount * rate,
      .credit = 0.0,
      .description = fmt::format("AR - {} - {}", input.customer_name,
                                 input.invoice_number),
      .reference = input.invoice_number});
  for (const auto& line : input.lines) {
    journal.lines.push_back(journal_line_t{
        .account_id = line.revenue_account_id,
        .debit = 0.0,
        .credit = line.line_amount * rate,
        .description = fmt::format("Revenue - {}", line.description),
        .reference = input.invoice_number});
  }
  for (const auto& tax_line : input.tax_lines) {
    journal.lines.push_back(journal_line_t{
        .account_id = tax_line.tax_account_id,
        .debit = 0.0,
        .credit = tax_line.tax_amount * rate,
        .description = fmt::format("{} Tax - {}", tax_line.tax_code,
                                   input.invoice_number),
        .reference = input.invoice_number});
  }

  spdlog::debug("Invoice {} mapped to {} journal line(s) at rate {}",
                input.invoice_number, journal.lines.size(), rate);
  return detail::validate_document_journal(std::move(journal), totals,
                                           validator);
}

document_totals_t calculate_invoice_totals(
    const std::vector<invoice_line_t>& lines,
    const std::vector<invoice_tax_line_t>& tax_lines) {
  return folio::tax::totals(lines, tax_lines);
}

line_validation_result_t validate_invoice_lines(
    const std::vector<invoice_line_t>& lines) {
  return folio::tax::validate_lines(lines);
}

}  // namespace folio::posting
