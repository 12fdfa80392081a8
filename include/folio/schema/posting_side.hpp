#pragma once

#include <folio/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: posting side.
namespace folio::schema {

enum class posting_side_t : uint8_t {
  debit = 0,
  credit = 1
};

inline constexpr auto kPostingSideMappings = std::array{
    std::pair<std::string_view, posting_side_t>{"debit", posting_side_t::debit},
    std::pair<std::string_view, posting_side_t>{"credit", posting_side_t::credit}};

template <>
inline std::optional<posting_side_t> try_from_string<posting_side_t>(
    const std::string_view value) {
  return from_string(value, kPostingSideMappings);
}

inline constexpr std::string_view to_string(const posting_side_t value) {
  return to_string(value, kPostingSideMappings).value_or("UNKNOWN");
}

}  // namespace folio::schema
