#pragma once
#include <folio/common/critical.hpp>
#include <folio/schema/encoding/encoder.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace folio::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  folio::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, folio::schema::bytes_t& out);

  /// Decode or terminate. Only for bytes this process produced itself.
  template <typename T>
  T decode(const folio::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const folio::schema::bytes_view_t& bytes);
};

template <typename T>
folio::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    folio::common::critical("failed to encode SCALE row");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        folio::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(const folio::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    folio::common::critical("failed to decode SCALE row");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const folio::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace folio::schema::encoding
