#pragma once

#include <refuge/schema/aid_category.hpp>
#include <refuge/schema/aid_status.hpp>
#include <optional>
#include <string>

// Schema type: record filter.
// Aid workflow: Listing criteria. `search` matches case-insensitively against
// category name, location and every needs entry.
namespace refuge::schema {

template <uint16_t Version>
struct record_filter;

template <>
struct record_filter<1> final {
  uint16_t version{1};
  std::optional<aid_status_t> status;
  std::optional<aid_category_t> category;
  std::optional<std::string> search;
};

using record_filter_t = record_filter<1>;

}  // namespace refuge::schema
