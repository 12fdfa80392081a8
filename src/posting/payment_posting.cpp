#include <folio/fx/policy.hpp>
#include <folio/posting/payment_posting.hpp>

#include <cmath>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

using namespace folio::schema;

namespace {

std::string_view document_label(const payment_allocation_t& allocation) {
  return allocation.document_number.empty() ? allocation.document_id
                                             : allocation.document_number;
}

bool missing(const std::optional<std::string>& value) {
  return !value || value->empty();
}

}  // namespace

namespace folio::posting {

std::vector<std::string> validate_payment(const payment_posting_input_t& input,
                                          const date_t today) {
  auto errors = std::vector<std::string>{};
  if (input.payment_date > today) {
    errors.emplace_back("Payment date cannot be in the future");
  }
  if (!folio::fx::is_valid_currency_code(input.currency)) {
    errors.emplace_back("Currency must be a valid 3-letter ISO code");
  }
  if (!std::isfinite(input.exchange_rate) || input.exchange_rate <= 0.0) {
    errors.emplace_back("Exchange rate must be positive");
  }
  if (input.amount <= 0.0) {
    errors.emplace_back("Payment amount must be positive");
  }
  if (input.bank_account_id.empty()) {
    errors.emplace_back("Bank account is required");
  }
  if (input.allocations.empty()) {
    errors.emplace_back("Payment must have at least one allocation");
    return errors;
  }

  auto allocated = amount_t{};
  auto number = std::size_t{0};
  for (const auto& allocation : input.allocations) {
    ++number;
    allocated += allocation.amount;
    if (allocation.amount <= 0.0) {
      errors.push_back(
          fmt::format("Allocation {}: Amount must be positive", number));
    }
    switch (allocation.type) {
      case allocation_type_t::bill:
        if (missing(allocation.ap_account_id)) {
          errors.push_back(fmt::format(
              "Allocation {}: AP account required for bill payments", number));
        }
        if (missing(allocation.supplier_id)) {
          errors.push_back(fmt::format(
              "Allocation {}: Supplier ID required for bill payments", number));
        }
        break;
      case allocation_type_t::invoice:
        if (missing(allocation.ar_account_id)) {
          errors.push_back(fmt::format(
              "Allocation {}: AR account required for invoice receipts",
              number));
        }
        if (missing(allocation.customer_id)) {
          errors.push_back(fmt::format(
              "Allocation {}: Customer ID required for invoice receipts",
              number));
        }
        break;
    }
  }
  if (exceeds_tolerance(allocated - input.amount)) {
    errors.push_back(fmt::format(
        "Total allocated amount ({:.2f}) does not match payment amount ({:.2f})",
        allocated, input.amount));
  }
  return errors;
}

payment_posting_result_t post_payment(const payment_posting_input_t& input,
                                      const journal_validator& validator) {
  auto result = payment_posting_result_t{};
  result.errors = validate_payment(input, validator.today());
  if (!result.errors.empty()) {
    spdlog::warn("Payment {} failed validation with {} error(s)",
                 input.payment_number, result.errors.size());
    result.code = posting_error_code_t::payment_validation_failed;
    result.error = fmt::format("Payment validation failed: {}",
                               fmt::join(result.errors, "; "));
    return result;
  }

  auto rate = input.exchange_rate;
  auto journal = journal_posting_input_t{};
  journal.journal_number =
      fmt::format("{}{}", kPaymentJournalPrefix, input.payment_number);
  journal.description = input.description.value_or(
      fmt::format("Payment {}", input.payment_number));
  journal.journal_date = input.payment_date;
  journal.currency = validator.base_currency();
  journal.context = input.context;
  journal.action = sod_action_t::payment_post;

  auto reference = input.reference.value_or(input.payment_number);
  auto summary = calculate_payment_summary(input.allocations);
  auto bank_debit = amount_t{};
  auto bank_credit = amount_t{};
  for (const auto& allocation : input.allocations) {
    auto converted = allocation.amount * rate;
    if (allocation.type == allocation_type_t::bill) {
      bank_credit += converted;
      journal.lines.push_back(journal_line_t{
          .account_id = allocation.ap_account_id.value_or(""),
          .debit = converted,
          .credit = 0.0,
          .description = fmt::format("Payment to supplier - {}",
                                     document_label(allocation)),
          .reference = reference});
    } else {
      bank_debit += converted;
      journal.lines.push_back(journal_line_t{
          .account_id = allocation.ar_account_id.value_or(""),
          .debit = 0.0,
          .credit = converted,
          .description = fmt::format("Receipt from customer - {}",
                                     document_label(allocation)),
          .reference = reference});
    }
  }
  if (summary.bill_count > 0) {
    journal.lines.push_back(journal_line_t{
        .account_id = input.bank_account_id,
        .debit = 0.0,
        .credit = bank_credit,
        .description = fmt::format("Payment {} - bank", input.payment_number),
        .reference = reference});
  }
  if (summary.invoice_count > 0) {
    journal.lines.push_back(journal_line_t{
        .account_id = input.bank_account_id,
        .debit = bank_debit,
        .credit = 0.0,
        .description = fmt::format("Receipt {} - bank", input.payment_number),
        .reference = reference});
  }

  auto validation = validator.validate(journal);
  if (!validation.validated) {
    spdlog::warn("Payment journal '{}' rejected: {}", journal.journal_number,
                 validation.error);
    result.code = posting_error_code_t::journal_validation_failed;
    result.journal_code = validation.code;
    result.error =
        fmt::format("Journal validation failed: {}", validation.error);
    result.validation = std::move(validation);
    return result;
  }

  result.success = true;
  result.total_amount = input.amount * rate;
  result.allocations_processed = input.allocations.size();
  result.journal = std::move(journal);
  result.validation = std::move(validation);
  return result;
}

payment_summary_t calculate_payment_summary(
    const std::vector<payment_allocation_t>& allocations) {
  auto summary = payment_summary_t{};
  auto bills = amount_t{};
  auto invoices = amount_t{};
  for (const auto& allocation : allocations) {
    if (allocation.type == allocation_type_t::bill) {
      bills += allocation.amount;
      ++summary.bill_count;
    } else {
      invoices += allocation.amount;
      ++summary.invoice_count;
    }
  }
  summary.bill_payments = round_amount(bills);
  summary.invoice_receipts = round_amount(invoices);
  summary.total_amount = round_amount(bills + invoices);
  return summary;
}

line_validation_result_t validate_payment_allocations(
    const std::vector<payment_allocation_t>& allocations,
    const std::unordered_map<std::string, amount_t>& outstanding_balances) {
  auto result = line_validation_result_t{};
  for (const auto& allocation : allocations) {
    auto it = outstanding_balances.find(allocation.document_id);
    auto outstanding =
        it == std::end(outstanding_balances) ? amount_t{} : it->second;
    if (outstanding <= 0.0) {
      result.errors.push_back(fmt::format("Document {} has no outstanding balance",
                                          document_label(allocation)));
      continue;
    }
    if (exceeds_tolerance(allocation.amount - outstanding) &&
        allocation.amount > outstanding) {
      result.warnings.push_back(fmt::format(
          "Document {}: Allocated amount ({:.2f}) exceeds outstanding balance "
          "({:.2f})",
          document_label(allocation), allocation.amount, outstanding));
    }
  }
  result.valid = result.errors.empty();
  return result;
}

}  // namespace folio::posting
