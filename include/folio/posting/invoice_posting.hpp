#pragma once

#include <folio/posting/journal_validator.hpp>
#include <folio/schema/document_posting_result.hpp>
#include <folio/schema/document_totals.hpp>
#include <folio/schema/invoice_posting_input.hpp>
#include <folio/schema/line_validation_result.hpp>
#include <vector>

namespace folio::posting {

/// Map an AR invoice to a journal and validate it.
///
/// Debits the AR account for the grand total, credits each line's revenue
/// account and each declared tax line's tax account. Amounts are converted to
/// the validator's base currency. The journal number is the bare invoice
/// number.
folio::schema::document_posting_result_t post_invoice(
    const folio::schema::invoice_posting_input_t& input,
    const journal_validator& validator);

folio::schema::document_totals_t calculate_invoice_totals(
    const std::vector<folio::schema::invoice_line_t>& lines,
    const std::vector<folio::schema::invoice_tax_line_t>& tax_lines = {});

folio::schema::line_validation_result_t validate_invoice_lines(
    const std::vector<folio::schema::invoice_line_t>& lines);

}  // namespace folio::posting
