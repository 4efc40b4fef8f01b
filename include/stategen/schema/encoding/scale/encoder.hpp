#pragma once
#include <stategen/common/critical.hpp>
#include <stategen/schema/beacon_block.hpp>
#include <stategen/schema/beacon_state.hpp>
#include <stategen/schema/encoding/encoder.hpp>
#include <stategen/schema/split_info.hpp>
#include <stategen/schema/state_summary.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace stategen::schema::encoding {

struct scale_encoder_tag {};

// Schema types are plain aggregates; SCALE encodes them field by field in
// declaration order, so adding a field means bumping the struct version.
template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  stategen::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, stategen::schema::bytes_t& out);

  template <typename T>
  std::optional<T> try_decode(const stategen::schema::bytes_view_t& bytes);
};

template <typename T>
stategen::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    stategen::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        stategen::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const stategen::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

using scale_encoder_t = encoder<scale_encoder_tag>;

}  // namespace stategen::schema::encoding
