#pragma once
#include <stategen/schema/primitives.hpp>
#include <optional>
#include <span>

namespace stategen::schema::encoding {

// Codec selection is a build time setting: callers name the library tag,
// e.g. encoder<scale_encoder_tag>, and never the library itself.
template <typename Library>
struct encoder {
  template <typename T>
  stategen::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, stategen::schema::bytes_t& out);

  template <typename T>
  std::optional<T> try_decode(const stategen::schema::bytes_view_t& bytes);
};

}  // namespace stategen::schema::encoding
