#pragma once
#include <refuge/schema/aid_category.hpp>
#include <refuge/schema/aid_status.hpp>
#include <refuge/schema/primitives.hpp>
#include <string>
#include <vector>

// Schema type: aid record.
// Aid workflow: One aid request. Identity, precise location and needs are
// only held as ciphertext handles; category, coarse location, amount and the
// needs list are cleartext routing metadata.
namespace refuge::schema {

template <uint16_t Version>
struct aid_record;

template <>
struct aid_record<1> final {
  uint16_t version{1};
  record_id_t id{};
  caller_id_t owner;
  aid_category_t category{};
  std::string location;
  amount_t amount;
  std::vector<std::string> needs;
  ciphertext_handle_t encrypted_identity{};
  ciphertext_handle_t encrypted_location{};
  ciphertext_handle_t encrypted_needs{};
  aid_status_t status{aid_status_t::pending};
  timestamp_milliseconds_t timestamp{};
};

using aid_record_t = aid_record<1>;

}  // namespace refuge::schema
