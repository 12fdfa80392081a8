#pragma once

#include <folio/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: period lock type.
namespace folio::schema {

enum class lock_type_t : uint8_t {
  posting = 0,
  reporting = 1,
  full = 2
};

inline constexpr auto kLockTypeMappings = std::array{
    std::pair<std::string_view, lock_type_t>{"POSTING", lock_type_t::posting},
    std::pair<std::string_view, lock_type_t>{"REPORTING", lock_type_t::reporting},
    std::pair<std::string_view, lock_type_t>{"FULL", lock_type_t::full}};

template <>
inline std::optional<lock_type_t> try_from_string<lock_type_t>(
    const std::string_view value) {
  return from_string(value, kLockTypeMappings);
}

inline constexpr std::string_view to_string(const lock_type_t value) {
  return to_string(value, kLockTypeMappings).value_or("UNKNOWN");
}

}  // namespace folio::schema
