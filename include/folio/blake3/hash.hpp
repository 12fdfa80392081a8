#pragma once
#include <folio/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace folio::blake3 {

folio::schema::hash32_t hash(const std::string_view& str);
folio::schema::hash32_t hash(const folio::schema::bytes_view_t& bytes);

}  // namespace folio::blake3
