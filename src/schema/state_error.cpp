#include <spdlog/fmt/fmt.h>
#include <stategen/schema/state_error.hpp>

namespace stategen::schema {

std::string describe(const state_error& error) {
  return fmt::format("{} slot={} root={}: {}", to_string(error.code),
                     error.slot, short_hex(error.root), error.log);
}

}  // namespace stategen::schema
