#pragma once
#include <refuge/schema/aid_category.hpp>
#include <refuge/schema/primitives.hpp>

// Schema type: aid package.
// Aid workflow: A resource offer matched against requests during
// verification. Resources and quantities stay encrypted.
namespace refuge::schema {

template <uint16_t Version>
struct aid_package;

template <>
struct aid_package<1> final {
  uint16_t version{1};
  package_id_t id{};
  caller_id_t owner;
  aid_category_t category{};
  ciphertext_handle_t encrypted_resources{};
  ciphertext_handle_t encrypted_quantities{};
  timestamp_milliseconds_t timestamp{};
};

using aid_package_t = aid_package<1>;

}  // namespace refuge::schema
