#pragma once

#include <folio/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

namespace folio::fx {

enum class rate_status_t : uint8_t {
  ok = 0,
  fx_rate_required = 1,
  invalid_rate = 2
};

/// True iff the currencies differ.
bool requires_fx_rate(std::string_view base_currency,
                      std::string_view transaction_currency);

/// fx_rate_required when a conversion is needed and the rate is absent or
/// not positive. invalid_rate for a non-finite rate, or a non-positive rate
/// supplied where none is needed.
rate_status_t validate_rate(std::string_view base_currency,
                            std::string_view transaction_currency,
                            std::optional<folio::schema::amount_t> rate);

/// Rate to multiply transaction amounts by. 1.0 for same-currency postings.
/// Call only after validate_rate returned ok.
folio::schema::amount_t effective_rate(
    std::string_view base_currency,
    std::string_view transaction_currency,
    std::optional<folio::schema::amount_t> rate);

/// Three upper-case ASCII letters.
bool is_valid_currency_code(std::string_view currency);

}  // namespace folio::fx
