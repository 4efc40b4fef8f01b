#include <boost/endian/conversion.hpp>
#include <stategen/schema/key/builder.hpp>
#include <algorithm>
#include <iterator>

using namespace stategen::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const hash32_t& hash) {
  return write(std::span<const uint8_t>{hash.data(), hash.size()});
}

builder& builder::write_big_endian(const uint64_t value) {
  auto big = boost::endian::native_to_big(value);
  auto bytes = reinterpret_cast<const uint8_t*>(&big);
  std::ranges::copy_n(bytes, sizeof(big), std::back_inserter(data));
  return *this;
}
