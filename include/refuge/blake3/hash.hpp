#pragma once
#include <refuge/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace refuge::blake3 {

refuge::schema::hash32_t hash(const std::string_view& str);
refuge::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

/// Hash `left || right` without materializing the concatenation.
refuge::schema::hash32_t hash(const std::span<const uint8_t>& left,
                              const std::span<const uint8_t>& right);

}  // namespace refuge::blake3
