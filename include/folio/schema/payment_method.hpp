#pragma once

#include <folio/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace folio::schema {

enum class payment_method_t : uint8_t {
  bank_transfer = 0,
  check = 1,
  cash = 2,
  credit_card = 3,
  debit_card = 4,
  other = 5
};

inline constexpr auto kPaymentMethodMappings = std::array{
    std::pair<std::string_view, payment_method_t>{"BANK_TRANSFER", payment_method_t::bank_transfer},
    std::pair<std::string_view, payment_method_t>{"CHECK", payment_method_t::check},
    std::pair<std::string_view, payment_method_t>{"CASH", payment_method_t::cash},
    std::pair<std::string_view, payment_method_t>{"CREDIT_CARD", payment_method_t::credit_card},
    std::pair<std::string_view, payment_method_t>{"DEBIT_CARD", payment_method_t::debit_card},
    std::pair<std::string_view, payment_method_t>{"OTHER", payment_method_t::other}};

template <>
inline std::optional<payment_method_t> try_from_string<payment_method_t>(
    const std::string_view value) {
  return from_string(value, kPaymentMethodMappings);
}

inline constexpr std::string_view to_string(const payment_method_t value) {
  return to_string(value, kPaymentMethodMappings).value_or("UNKNOWN");
}

}  // namespace folio::schema
