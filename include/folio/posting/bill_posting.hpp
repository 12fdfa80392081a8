#pragma once

#include <folio/posting/journal_validator.hpp>
#include <folio/schema/bill_posting_input.hpp>
#include <folio/schema/document_posting_result.hpp>
#include <folio/schema/document_totals.hpp>
#include <folio/schema/line_validation_result.hpp>
#include <string_view>
#include <vector>

namespace folio::posting {

inline constexpr auto kBillJournalPrefix = std::string_view{"BILL-"};

/// Map an AP bill to a journal and validate it.
///
/// Debits each line's expense account and each input-tax account, credits
/// the AP account for the grand total. The journal number is prefixed with
/// BILL- (invoices are not prefixed).
folio::schema::document_posting_result_t post_bill(
    const folio::schema::bill_posting_input_t& input,
    const journal_validator& validator);

folio::schema::document_totals_t calculate_bill_totals(
    const std::vector<folio::schema::bill_line_t>& lines,
    const std::vector<folio::schema::bill_tax_line_t>& tax_lines = {});

folio::schema::line_validation_result_t validate_bill_lines(
    const std::vector<folio::schema::bill_line_t>& lines);

}  // namespace folio::posting
