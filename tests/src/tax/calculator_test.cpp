#include <gtest/gtest.h>
#include <folio/schema/invoice_posting_input.hpp>
#include <folio/tax/calculator.hpp>

#include <vector>

namespace {

folio::schema::invoice_line_t make_line(const double quantity,
                                        const double unit_price,
                                        const double line_amount,
                                        const std::optional<double> tax_rate = {},
                                        const double tax_amount = 0.0) {
  auto line = folio::schema::invoice_line_t{};
  line.description = "Consulting";
  line.quantity = quantity;
  line.unit_price = unit_price;
  line.line_amount = line_amount;
  line.tax_rate = tax_rate;
  line.tax_amount = tax_amount;
  line.revenue_account_id = "rev";
  return line;
}

}  // namespace

TEST(tax_calculator, line_tax_is_rounded_to_cents) {
  EXPECT_DOUBLE_EQ(folio::tax::compute_line_tax(1000.0, 0.06), 60.0);
  EXPECT_DOUBLE_EQ(folio::tax::compute_line_tax(33.33, 0.08), 2.67);
  EXPECT_DOUBLE_EQ(folio::tax::compute_line_tax(0.0, 0.06), 0.0);
}

TEST(tax_calculator, line_tax_mismatch_reports_expected_amount) {
  EXPECT_FALSE(folio::tax::validate_line_tax(1000.0, 0.06, 60.01).has_value());
  auto mismatch = folio::tax::validate_line_tax(1000.0, 0.06, 55.0);
  ASSERT_TRUE(mismatch.has_value());
  EXPECT_DOUBLE_EQ(mismatch->expected, 60.0);
  EXPECT_DOUBLE_EQ(mismatch->supplied, 55.0);
}

TEST(tax_calculator, totals_add_rounded_parts_exactly) {
  auto lines = std::vector{make_line(3, 33.333, 99.999, 0.06, 6.0),
                           make_line(1, 0.005, 0.005)};
  auto first = folio::tax::totals(lines);
  auto second = folio::tax::totals(lines);
  EXPECT_DOUBLE_EQ(first.subtotal, 100.0);
  EXPECT_DOUBLE_EQ(first.tax_amount, 6.0);
  EXPECT_DOUBLE_EQ(first.total_amount, first.subtotal + first.tax_amount);
  EXPECT_DOUBLE_EQ(second.total_amount, first.total_amount);
}

TEST(tax_calculator, declared_tax_lines_replace_line_tax) {
  auto lines = std::vector{make_line(1, 100.0, 100.0, 0.10, 10.0)};
  auto tax_lines = std::vector{make_line(1, 0.0, 0.0, 0.10, 10.0)};
  auto document = folio::tax::totals(lines, tax_lines);
  EXPECT_DOUBLE_EQ(document.tax_amount, 10.0);
  EXPECT_DOUBLE_EQ(document.total_amount, 110.0);
  EXPECT_FALSE(folio::tax::check_tax_coverage(lines, tax_lines).has_value());
  EXPECT_TRUE(folio::tax::check_tax_coverage(
                  lines, std::vector<folio::schema::invoice_line_t>{})
                  .has_value());
}

TEST(tax_calculator, validate_lines_reports_every_problem_per_line) {
  auto lines = std::vector{make_line(2, 50.0, 100.0, 0.06, 6.0),
                           make_line(-1, -1.0, 10.0),
                           make_line(1, 100.0, 100.0, 0.06, 5.0)};
  auto result = folio::tax::validate_lines(lines);
  EXPECT_FALSE(result.valid);
  ASSERT_EQ(result.errors.size(), 4u);
  EXPECT_EQ(result.errors[0], "Line 2: Quantity must be positive");
  EXPECT_EQ(result.errors[1], "Line 2: Unit price cannot be negative");
  EXPECT_EQ(result.errors[2],
            "Line 2: Line amount 10.00 does not match quantity × unit price "
            "1.00");
  EXPECT_EQ(result.errors[3],
            "Line 3: Tax amount 5.00 does not match line amount × tax rate "
            "6.00");
}

TEST(tax_calculator, zero_rate_skips_tax_check) {
  auto lines = std::vector{make_line(1, 10.0, 10.0, 0.0, 3.0)};
  EXPECT_TRUE(folio::tax::validate_lines(lines).valid);
}
