#include <algorithm>
#include <folio/blake3/hash.hpp>
#include <folio/schema/key/builder.hpp>
#include <iterator>
#include <ranges>

using namespace folio::schema::key;

builder& builder::write(const std::string_view& str) {
  write(static_cast<uint32_t>(str.size()));
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  write(static_cast<uint32_t>(bytes.size()));
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

folio::schema::hash32_t builder::digest() const {
  return folio::blake3::hash(folio::schema::bytes_view_t{data});
}

std::string builder::hex_digest() const {
  auto hash = digest();
  return folio::schema::to_hex(
      folio::schema::bytes_view_t{hash.data(), hash.size()});
}
