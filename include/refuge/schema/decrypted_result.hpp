#pragma once
#include <refuge/schema/primitives.hpp>
#include <optional>

// Schema type: decrypted result.
// Aid workflow: Public view of a verification's scores. Values are absent
// until the reveal callback lands and never change afterwards.
namespace refuge::schema {

template <uint16_t Version>
struct decrypted_result;

template <>
struct decrypted_result<1> final {
  uint16_t version{1};
  verification_id_t verification_id{};
  std::optional<uint32_t> eligibility;
  std::optional<uint32_t> priority;
  bool is_revealed{};
  std::optional<timestamp_milliseconds_t> revealed_at;
};

using decrypted_result_t = decrypted_result<1>;

}  // namespace refuge::schema
