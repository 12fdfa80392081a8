#pragma once

#include <folio/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: payment allocation type.
// BILL settles a supplier bill (AP), INVOICE settles a customer invoice (AR).
namespace folio::schema {

enum class allocation_type_t : uint8_t {
  bill = 0,
  invoice = 1
};

inline constexpr auto kAllocationTypeMappings = std::array{
    std::pair<std::string_view, allocation_type_t>{"BILL", allocation_type_t::bill},
    std::pair<std::string_view, allocation_type_t>{"INVOICE", allocation_type_t::invoice}};

template <>
inline std::optional<allocation_type_t> try_from_string<allocation_type_t>(
    const std::string_view value) {
  return from_string(value, kAllocationTypeMappings);
}

inline constexpr std::string_view to_string(const allocation_type_t value) {
  return to_string(value, kAllocationTypeMappings).value_or("UNKNOWN");
}

}  // namespace folio::schema
