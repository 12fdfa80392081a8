#include <gtest/gtest.h>
#include <folio/posting/payment_posting.hpp>
#include <folio/testing/posting_fixture.hpp>

#include <chrono>
#include <string>
#include <unordered_map>

namespace {

using folio::schema::allocation_type_t;
using folio::schema::posting_error_code_t;

folio::schema::payment_allocation_t bill_allocation(const std::string& id,
                                                    const double amount) {
  return folio::schema::payment_allocation_t{.type = allocation_type_t::bill,
                                             .document_id = id,
                                             .document_number = "B-" + id,
                                             .amount = amount,
                                             .ap_account_id = "ap",
                                             .supplier_id = "sup-1"};
}

folio::schema::payment_allocation_t invoice_allocation(const std::string& id,
                                                       const double amount) {
  return folio::schema::payment_allocation_t{
      .type = allocation_type_t::invoice,
      .document_id = id,
      .document_number = "INV-" + id,
      .amount = amount,
      .ar_account_id = "ar",
      .customer_id = "cust-1"};
}

folio::schema::payment_posting_input_t make_payment() {
  auto payment = folio::schema::payment_posting_input_t{};
  payment.context = folio::testing::make_context("accountant");
  payment.payment_id = "pay-1";
  payment.payment_number = "P-100";
  payment.payment_date = folio::testing::fixed_today();
  payment.bank_account_id = "bank";
  payment.currency = "MYR";
  payment.amount = 300.0;
  payment.allocations = {bill_allocation("1", 200.0),
                         bill_allocation("2", 100.0)};
  return payment;
}

}  // namespace

TEST(payment_posting, supplier_payment_debits_ap_and_credits_bank) {
  auto fixture = folio::testing::posting_fixture{};
  auto result = folio::posting::post_payment(make_payment(), fixture.validator());
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.allocations_processed, 2u);
  EXPECT_DOUBLE_EQ(result.total_amount, 300.0);

  const auto& journal = *result.journal;
  EXPECT_EQ(journal.journal_number, "PAY-P-100");
  EXPECT_EQ(journal.action, folio::schema::sod_action_t::payment_post);
  ASSERT_EQ(journal.lines.size(), 3u);
  EXPECT_EQ(journal.lines[0].account_id, "ap");
  EXPECT_DOUBLE_EQ(journal.lines[0].debit, 200.0);
  EXPECT_EQ(journal.lines[0].description, "Payment to supplier - B-1");
  EXPECT_EQ(journal.lines[2].account_id, "bank");
  EXPECT_DOUBLE_EQ(journal.lines[2].credit, 300.0);
}

TEST(payment_posting, customer_receipt_debits_bank_and_credits_ar) {
  auto fixture = folio::testing::posting_fixture{};
  auto payment = make_payment();
  payment.amount = 150.0;
  payment.allocations = {invoice_allocation("9", 150.0)};
  auto result = folio::posting::post_payment(payment, fixture.validator());
  ASSERT_TRUE(result.success) << result.error;
  const auto& lines = result.journal->lines;
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0].account_id, "ar");
  EXPECT_DOUBLE_EQ(lines[0].credit, 150.0);
  EXPECT_EQ(lines[1].account_id, "bank");
  EXPECT_DOUBLE_EQ(lines[1].debit, 150.0);
  EXPECT_EQ(lines[1].description, "Receipt P-100 - bank");
}

TEST(payment_posting, exchange_rate_is_always_applied) {
  auto fixture = folio::testing::posting_fixture{};
  auto payment = make_payment();
  payment.currency = "USD";
  payment.exchange_rate = 4.5;
  auto result = folio::posting::post_payment(payment, fixture.validator());
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_NEAR(result.total_amount, 1350.0, 1e-9);
  EXPECT_NEAR(result.journal->lines[2].credit, 1350.0, 1e-9);
}

TEST(payment_posting, business_rule_errors_are_collected) {
  auto fixture = folio::testing::posting_fixture{};
  auto payment = make_payment();
  payment.payment_date = folio::testing::fixed_today() + std::chrono::days{3};
  payment.bank_account_id.clear();
  payment.allocations[1].supplier_id.reset();
  auto result = folio::posting::post_payment(payment, fixture.validator());
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.code, posting_error_code_t::payment_validation_failed);
  ASSERT_EQ(result.errors.size(), 3u);
  EXPECT_EQ(result.errors[0], "Payment date cannot be in the future");
  EXPECT_EQ(result.errors[1], "Bank account is required");
  EXPECT_EQ(result.errors[2],
            "Allocation 2: Supplier ID required for bill payments");
  EXPECT_EQ(result.error,
            "Payment validation failed: Payment date cannot be in the future; "
            "Bank account is required; Allocation 2: Supplier ID required for "
            "bill payments");
}

TEST(payment_posting, allocations_must_add_up_to_amount) {
  auto payment = make_payment();
  payment.amount = 310.0;
  auto errors =
      folio::posting::validate_payment(payment, folio::testing::fixed_today());
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0],
            "Total allocated amount (300.00) does not match payment amount "
            "(310.00)");
}

TEST(payment_posting, journal_failure_is_reported_separately) {
  auto fixture = folio::testing::posting_fixture{};
  auto payment = make_payment();
  payment.bank_account_id = "ghost-bank";
  auto result = folio::posting::post_payment(payment, fixture.validator());
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.code, posting_error_code_t::journal_validation_failed);
  EXPECT_EQ(result.journal_code, posting_error_code_t::invalid_accounts);
}

TEST(payment_posting, summary_rounds_after_summation) {
  auto summary = folio::posting::calculate_payment_summary(
      {bill_allocation("1", 0.105), bill_allocation("2", 0.105),
       invoice_allocation("3", 10.0)});
  EXPECT_EQ(summary.bill_count, 2u);
  EXPECT_EQ(summary.invoice_count, 1u);
  EXPECT_DOUBLE_EQ(summary.bill_payments, 0.21);
  EXPECT_DOUBLE_EQ(summary.invoice_receipts, 10.0);
  EXPECT_DOUBLE_EQ(summary.total_amount, 10.21);
}

TEST(payment_posting, outstanding_balances_gate_allocations) {
  auto balances = std::unordered_map<std::string, double>{{"1", 150.0},
                                                          {"2", 0.0}};
  auto result = folio::posting::validate_payment_allocations(
      {bill_allocation("1", 200.0), bill_allocation("2", 50.0)}, balances);
  EXPECT_FALSE(result.valid);
  ASSERT_EQ(result.errors.size(), 1u);
  EXPECT_EQ(result.errors[0], "Document B-2 has no outstanding balance");
  ASSERT_EQ(result.warnings.size(), 1u);
  EXPECT_EQ(result.warnings[0],
            "Document B-1: Allocated amount (200.00) exceeds outstanding "
            "balance (150.00)");
}
