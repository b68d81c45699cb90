#pragma once
#include <refuge/schema/primitives.hpp>

// Schema type: verification.
// Aid workflow: Outcome of one eligibility computation. Refers to the record
// and package by id only; scores are stored re-encrypted.
namespace refuge::schema {

template <uint16_t Version>
struct verification;

template <>
struct verification<1> final {
  uint16_t version{1};
  verification_id_t id{};
  record_id_t refugee_record_id{};
  package_id_t package_id{};
  ciphertext_handle_t encrypted_eligibility{};
  ciphertext_handle_t encrypted_priority{};
  timestamp_milliseconds_t verified_at{};
};

using verification_t = verification<1>;

}  // namespace refuge::schema
