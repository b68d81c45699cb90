#pragma once

#include <refuge/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: target kind.
// Aid workflow: Tags an outstanding decryption request with the callback that
// must consume it. Each kind lives in its own correlation keyspace.
namespace refuge::schema {

enum class target_kind_t : uint8_t {
  eligibility_computation = 0,
  result_reveal = 1
};

inline constexpr auto kTargetKindMappings =
    std::array{std::pair<std::string_view, target_kind_t>{
                   "eligibility_computation",
                   target_kind_t::eligibility_computation},
               std::pair<std::string_view, target_kind_t>{
                   "result_reveal", target_kind_t::result_reveal}};

template <>
inline std::optional<target_kind_t> try_from_string<target_kind_t>(
    const std::string_view value) {
  return from_string(value, kTargetKindMappings);
}

inline constexpr std::string_view to_string(const target_kind_t value) {
  return to_string(value, kTargetKindMappings).value_or("unknown");
}

}  // namespace refuge::schema
