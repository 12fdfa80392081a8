#pragma once
#include <folio/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace folio::schema::key {

/// Accumulates identifier material and digests it with BLAKE3.
struct builder final {
  folio::schema::bytes_t data;

  /// Length-prefixed so ("ab","c") and ("a","bc") never collide.
  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
      data.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
    return *this;
  }

  folio::schema::hash32_t digest() const;
  /// Lower-case hex of digest(), used as a stable row identifier.
  std::string hex_digest() const;
};

}  // namespace folio::schema::key
