#pragma once

#include <folio/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: fiscal period status.
// OPEN -> CLOSED -> LOCKED, with reopen returning to OPEN.
namespace folio::schema {

enum class period_status_t : uint8_t {
  open = 0,
  closed = 1,
  locked = 2
};

inline constexpr auto kPeriodStatusMappings = std::array{
    std::pair<std::string_view, period_status_t>{"OPEN", period_status_t::open},
    std::pair<std::string_view, period_status_t>{"CLOSED", period_status_t::closed},
    std::pair<std::string_view, period_status_t>{"LOCKED", period_status_t::locked}};

template <>
inline std::optional<period_status_t> try_from_string<period_status_t>(
    const std::string_view value) {
  return from_string(value, kPeriodStatusMappings);
}

inline constexpr std::string_view to_string(const period_status_t value) {
  return to_string(value, kPeriodStatusMappings).value_or("UNKNOWN");
}

}  // namespace folio::schema
