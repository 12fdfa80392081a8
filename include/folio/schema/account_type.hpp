#pragma once

#include <folio/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: account type.
// Ledger classification that drives the normal balance side of an account.
namespace folio::schema {

enum class account_type_t : uint8_t {
  asset = 0,
  liability = 1,
  equity = 2,
  revenue = 3,
  expense = 4,
  cost_of_goods_sold = 5
};

inline constexpr auto kAccountTypeMappings = std::array{
    std::pair<std::string_view, account_type_t>{"ASSET", account_type_t::asset},
    std::pair<std::string_view, account_type_t>{"LIABILITY", account_type_t::liability},
    std::pair<std::string_view, account_type_t>{"EQUITY", account_type_t::equity},
    std::pair<std::string_view, account_type_t>{"REVENUE", account_type_t::revenue},
    std::pair<std::string_view, account_type_t>{"EXPENSE", account_type_t::expense},
    std::pair<std::string_view, account_type_t>{"COST_OF_GOODS_SOLD", account_type_t::cost_of_goods_sold}};

template <>
inline std::optional<account_type_t> try_from_string<account_type_t>(
    const std::string_view value) {
  return from_string(value, kAccountTypeMappings);
}

inline constexpr std::string_view to_string(const account_type_t value) {
  return to_string(value, kAccountTypeMappings).value_or("UNKNOWN");
}

}  // namespace folio::schema
