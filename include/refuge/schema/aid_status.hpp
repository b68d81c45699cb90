#pragma once

#include <refuge/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: aid status.
// Aid workflow: Request lifecycle enum: pending until an agency approves or
// rejects it, then distributed once the aid is handed over.
namespace refuge::schema {

enum class aid_status_t : uint8_t {
  pending = 0,
  approved = 1,
  distributed = 2,
  rejected = 3
};

inline constexpr auto kAidStatusMappings = std::array{
    std::pair<std::string_view, aid_status_t>{"pending", aid_status_t::pending},
    std::pair<std::string_view, aid_status_t>{"approved",
                                              aid_status_t::approved},
    std::pair<std::string_view, aid_status_t>{"distributed",
                                              aid_status_t::distributed},
    std::pair<std::string_view, aid_status_t>{"rejected",
                                              aid_status_t::rejected}};

template <>
inline std::optional<aid_status_t> try_from_string<aid_status_t>(
    const std::string_view value) {
  return from_string(value, kAidStatusMappings);
}

inline constexpr std::string_view to_string(const aid_status_t value) {
  return to_string(value, kAidStatusMappings).value_or("unknown");
}

}  // namespace refuge::schema
