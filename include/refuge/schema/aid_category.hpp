#pragma once

#include <refuge/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: aid category.
// Aid workflow: Routing class for a request or package, stored in cleartext.
namespace refuge::schema {

enum class aid_category_t : uint8_t {
  food = 0,
  medical = 1,
  shelter = 2,
  clothing = 3,
  hygiene = 4,
  other = 5
};

inline constexpr auto kAidCategoryMappings = std::array{
    std::pair<std::string_view, aid_category_t>{"food", aid_category_t::food},
    std::pair<std::string_view, aid_category_t>{"medical",
                                                aid_category_t::medical},
    std::pair<std::string_view, aid_category_t>{"shelter",
                                                aid_category_t::shelter},
    std::pair<std::string_view, aid_category_t>{"clothing",
                                                aid_category_t::clothing},
    std::pair<std::string_view, aid_category_t>{"hygiene",
                                                aid_category_t::hygiene},
    std::pair<std::string_view, aid_category_t>{"other",
                                                aid_category_t::other}};

template <>
inline std::optional<aid_category_t> try_from_string<aid_category_t>(
    const std::string_view value) {
  return from_string(value, kAidCategoryMappings);
}

inline constexpr std::string_view to_string(const aid_category_t value) {
  return to_string(value, kAidCategoryMappings).value_or("unknown");
}

}  // namespace refuge::schema
