#pragma once

#include <folio/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace folio::schema {

enum class reversing_entry_status_t : uint8_t {
  pending = 0,
  posted = 1,
  cancelled = 2
};

inline constexpr auto kReversingEntryStatusMappings = std::array{
    std::pair<std::string_view, reversing_entry_status_t>{"PENDING", reversing_entry_status_t::pending},
    std::pair<std::string_view, reversing_entry_status_t>{"POSTED", reversing_entry_status_t::posted},
    std::pair<std::string_view, reversing_entry_status_t>{"CANCELLED", reversing_entry_status_t::cancelled}};

template <>
inline std::optional<reversing_entry_status_t> try_from_string<reversing_entry_status_t>(
    const std::string_view value) {
  return from_string(value, kReversingEntryStatusMappings);
}

inline constexpr std::string_view to_string(const reversing_entry_status_t value) {
  return to_string(value, kReversingEntryStatusMappings).value_or("UNKNOWN");
}

}  // namespace folio::schema
