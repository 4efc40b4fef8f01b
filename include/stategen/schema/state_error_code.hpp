#pragma once

#include <stategen/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

// Schema type: state error code.
// Failure taxonomy of the state generation service: stable numeric codes
// surfaced to block processing and query callers.
namespace stategen::schema {

enum class state_error_code : uint32_t {
  unknown_root = 1,
  unknown_slot = 2,
  unknown_checkpoint = 3,
  no_valid_ancestor = 4,
  discontinuous_chain = 5,
  invalid_transition = 6,
  store_io = 7,
};

inline constexpr auto kStateErrorCodeMappings = std::array{
    std::pair<std::string_view, state_error_code>{
        "unknown_root", state_error_code::unknown_root},
    std::pair<std::string_view, state_error_code>{
        "unknown_slot", state_error_code::unknown_slot},
    std::pair<std::string_view, state_error_code>{
        "unknown_checkpoint", state_error_code::unknown_checkpoint},
    std::pair<std::string_view, state_error_code>{
        "no_valid_ancestor", state_error_code::no_valid_ancestor},
    std::pair<std::string_view, state_error_code>{
        "discontinuous_chain", state_error_code::discontinuous_chain},
    std::pair<std::string_view, state_error_code>{
        "invalid_transition", state_error_code::invalid_transition},
    std::pair<std::string_view, state_error_code>{"store_io",
                                                  state_error_code::store_io},
};

inline constexpr std::string_view to_string(const state_error_code value) {
  return to_string(value, kStateErrorCodeMappings).value_or("unknown");
}

}  // namespace stategen::schema
