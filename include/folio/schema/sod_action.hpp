#pragma once

#include <folio/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: SoD action.
// Sensitive operations gated by the segregation of duties authorizer.
namespace folio::schema {

enum class sod_action_t : uint8_t {
  journal_post = 0,
  invoice_post = 1,
  bill_post = 2,
  payment_post = 3,
  period_close = 4,
  period_open = 5,
  period_lock = 6
};

inline constexpr auto kSodActionMappings = std::array{
    std::pair<std::string_view, sod_action_t>{"journal:post", sod_action_t::journal_post},
    std::pair<std::string_view, sod_action_t>{"invoice:post", sod_action_t::invoice_post},
    std::pair<std::string_view, sod_action_t>{"bill:post", sod_action_t::bill_post},
    std::pair<std::string_view, sod_action_t>{"payment:post", sod_action_t::payment_post},
    std::pair<std::string_view, sod_action_t>{"period:close", sod_action_t::period_close},
    std::pair<std::string_view, sod_action_t>{"period:open", sod_action_t::period_open},
    std::pair<std::string_view, sod_action_t>{"period:lock", sod_action_t::period_lock}};

template <>
inline std::optional<sod_action_t> try_from_string<sod_action_t>(
    const std::string_view value) {
  return from_string(value, kSodActionMappings);
}

inline constexpr std::string_view to_string(const sod_action_t value) {
  return to_string(value, kSodActionMappings).value_or("UNKNOWN");
}

}  // namespace folio::schema
