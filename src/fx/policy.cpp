#include <folio/fx/policy.hpp>

#include <algorithm>
#include <cmath>

namespace folio::fx {

bool requires_fx_rate(const std::string_view base_currency,
                      const std::string_view transaction_currency) {
  return base_currency != transaction_currency;
}

rate_status_t validate_rate(
    const std::string_view base_currency,
    const std::string_view transaction_currency,
    const std::optional<folio::schema::amount_t> rate) {
  if (rate && !std::isfinite(*rate)) {
    return rate_status_t::invalid_rate;
  }
  if (requires_fx_rate(base_currency, transaction_currency)) {
    if (!rate || *rate <= 0.0) {
      return rate_status_t::fx_rate_required;
    }
    return rate_status_t::ok;
  }
  if (rate && *rate <= 0.0) {
    return rate_status_t::invalid_rate;
  }
  return rate_status_t::ok;
}

folio::schema::amount_t effective_rate(
    const std::string_view base_currency,
    const std::string_view transaction_currency,
    const std::optional<folio::schema::amount_t> rate) {
  if (!requires_fx_rate(base_currency, transaction_currency)) {
    return 1.0;
  }
  return rate.value_or(1.0);
}

bool is_valid_currency_code(const std::string_view currency) {
  return currency.size() == 3 && std::ranges::all_of(currency, [](char c) {
           return c >= 'A' && c <= 'Z';
         });
}

}  // namespace folio::fx
