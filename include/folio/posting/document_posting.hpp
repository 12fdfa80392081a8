#pragma once

#include <folio/posting/journal_validator.hpp>
#include <folio/schema/document_posting_result.hpp>
#include <folio/schema/document_totals.hpp>
#include <folio/schema/journal_posting_input.hpp>
#include <folio/schema/posting_error_code.hpp>
#include <string>

// Plumbing shared by the invoice and bill adapters.
namespace folio::posting::detail {

folio::schema::document_posting_result_t reject_document(
    folio::schema::posting_error_code_t code,
    std::string error,
    const folio::schema::document_totals_t& totals);

/// Run the assembled journal through the validator. A validator failure is
/// reported as BUSINESS_RULE_VIOLATION with the validator code preserved in
/// journal_code.
folio::schema::document_posting_result_t validate_document_journal(
    folio::schema::journal_posting_input_t journal,
    const folio::schema::document_totals_t& totals,
    const journal_validator& validator);

}  // namespace folio::posting::detail
