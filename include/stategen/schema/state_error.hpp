#pragma once

#include <stategen/schema/primitives.hpp>
#include <stategen/schema/state_error_code.hpp>

#include <string>
#include <utility>

// Schema type: state error.
// Failure envelope: code plus the slot/root the request was about, so the
// caller can retry or report without re-deriving context.
namespace stategen::schema {

struct state_error final {
  state_error_code code{};
  slot_t slot{};
  hash32_t root{};
  std::string log;
};

inline state_error make_state_error(const state_error_code code,
                                    const slot_t slot,
                                    const hash32_t& root,
                                    std::string log) {
  return state_error{
      .code = code, .slot = slot, .root = root, .log = std::move(log)};
}

/// Human readable form: "<code> slot=<n> root=<hex>: <log>".
std::string describe(const state_error& error);

}  // namespace stategen::schema
