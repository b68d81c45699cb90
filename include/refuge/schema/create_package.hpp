#pragma once
#include <refuge/schema/aid_category.hpp>
#include <refuge/schema/primitives.hpp>

// Schema type: create package.
// Aid workflow: Submission payload for a new resource offer.
namespace refuge::schema {

template <uint16_t Version>
struct create_package;

template <>
struct create_package<1> final {
  uint16_t version{1};
  aid_category_t category{};
  ciphertext_handle_t encrypted_resources{};
  ciphertext_handle_t encrypted_quantities{};
};

using create_package_t = create_package<1>;

}  // namespace refuge::schema
