#include <gtest/gtest.h>
#include <folio/fx/policy.hpp>

#include <array>
#include <limits>
#include <string_view>

namespace {

constexpr auto kCurrencies =
    std::array<std::string_view, 5>{"MYR", "USD", "SGD", "EUR", "JPY"};

}  // namespace

TEST(fx_policy, same_currency_never_requires_rate) {
  for (auto currency : kCurrencies) {
    EXPECT_FALSE(folio::fx::requires_fx_rate(currency, currency));
    EXPECT_EQ(folio::fx::validate_rate(currency, currency, std::nullopt),
              folio::fx::rate_status_t::ok);
    EXPECT_DOUBLE_EQ(folio::fx::effective_rate(currency, currency, 3.5), 1.0);
  }
}

TEST(fx_policy, different_currencies_require_positive_rate) {
  for (auto base : kCurrencies) {
    for (auto currency : kCurrencies) {
      if (base == currency) {
        continue;
      }
      EXPECT_TRUE(folio::fx::requires_fx_rate(base, currency));
      EXPECT_EQ(folio::fx::validate_rate(base, currency, std::nullopt),
                folio::fx::rate_status_t::fx_rate_required);
      EXPECT_EQ(folio::fx::validate_rate(base, currency, 0.0),
                folio::fx::rate_status_t::fx_rate_required);
      EXPECT_EQ(folio::fx::validate_rate(base, currency, -4.2),
                folio::fx::rate_status_t::fx_rate_required);
      EXPECT_EQ(folio::fx::validate_rate(base, currency, 4.2),
                folio::fx::rate_status_t::ok);
    }
  }
}

TEST(fx_policy, non_finite_rate_is_invalid) {
  EXPECT_EQ(folio::fx::validate_rate(
                "MYR", "USD", std::numeric_limits<double>::infinity()),
            folio::fx::rate_status_t::invalid_rate);
  EXPECT_EQ(folio::fx::validate_rate("MYR", "USD",
                                     std::numeric_limits<double>::quiet_NaN()),
            folio::fx::rate_status_t::invalid_rate);
}

TEST(fx_policy, currency_codes_are_three_upper_case_letters) {
  EXPECT_TRUE(folio::fx::is_valid_currency_code("MYR"));
  EXPECT_FALSE(folio::fx::is_valid_currency_code("myr"));
  EXPECT_FALSE(folio::fx::is_valid_currency_code("MY"));
  EXPECT_FALSE(folio::fx::is_valid_currency_code("MYR1"));
  EXPECT_FALSE(folio::fx::is_valid_currency_code("M1R"));
}
