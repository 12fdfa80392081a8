#include <blake3.h>
#include <folio/blake3/hash.hpp>

namespace folio::blake3 {

namespace {

folio::schema::hash32_t digest(const void* input, const std::size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, input, size);
  auto output = folio::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<folio::schema::hash32_t>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

folio::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

folio::schema::hash32_t hash(const folio::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace folio::blake3
