#pragma once
#include <folio/schema/primitives.hpp>
#include <optional>
#include <span>

namespace folio::schema::encoding {

/// Row codec selected at build time by tag, e.g.
/// `encoder<scale_encoder_tag>`. Storage rows are flat tuples of primitives,
/// so any codec that handles tuples, strings and optionals will do.
template <typename Library>
struct encoder {
  template <typename T>
  folio::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, folio::schema::bytes_t& out);

  template <typename T>
  T decode(const folio::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const folio::schema::bytes_view_t& bytes);
};

}  // namespace folio::schema::encoding
