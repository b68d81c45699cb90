#pragma once
#include <refuge/schema/aid_category.hpp>
#include <refuge/schema/primitives.hpp>
#include <string>
#include <vector>

// Schema type: create record.
// Aid workflow: Submission payload for a new aid request. Sensitive fields
// arrive already encrypted by the caller.
namespace refuge::schema {

template <uint16_t Version>
struct create_record;

template <>
struct create_record<1> final {
  uint16_t version{1};
  aid_category_t category{};
  std::string location;
  amount_t amount;
  std::vector<std::string> needs;
  ciphertext_handle_t encrypted_identity{};
  ciphertext_handle_t encrypted_location{};
  ciphertext_handle_t encrypted_needs{};
};

using create_record_t = create_record<1>;

}  // namespace refuge::schema
