#pragma once

#include <folio/posting/journal_validator.hpp>
#include <folio/schema/line_validation_result.hpp>
#include <folio/schema/payment_posting_input.hpp>
#include <folio/schema/payment_posting_result.hpp>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace folio::posting {

inline constexpr auto kPaymentJournalPrefix = std::string_view{"PAY-"};

/// Map a supplier payment and/or customer receipt to a journal and validate
/// it.
///
/// Bill allocations debit their AP account and credit the bank for their
/// total. Invoice allocations debit the bank for their total and credit their
/// AR account. Every amount is multiplied by the exchange rate.
folio::schema::payment_posting_result_t post_payment(
    const folio::schema::payment_posting_input_t& input,
    const journal_validator& validator);

/// Business-rule errors for a payment, empty when it may be posted.
std::vector<std::string> validate_payment(
    const folio::schema::payment_posting_input_t& input,
    folio::schema::date_t today);

/// Per-type sums, each rounded after summation.
folio::schema::payment_summary_t calculate_payment_summary(
    const std::vector<folio::schema::payment_allocation_t>& allocations);

/// Check allocations against outstanding balances keyed by document id.
/// A document with nothing outstanding is an error, over-allocation only a
/// warning.
folio::schema::line_validation_result_t validate_payment_allocations(
    const std::vector<folio::schema::payment_allocation_t>& allocations,
    const std::unordered_map<std::string, folio::schema::amount_t>&
        outstanding_balances);

}  // namespace folio::posting
