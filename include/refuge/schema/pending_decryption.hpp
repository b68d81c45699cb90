#pragma once
#include <refuge/schema/primitives.hpp>
#include <refuge/schema/target_kind.hpp>
#include <optional>

// Schema type: pending decryption.
// Aid workflow: Correlation entry linking an outstanding decryption request
// to the entity waiting on its callback.
namespace refuge::schema {

template <uint16_t Version>
struct pending_decryption;

template <>
struct pending_decryption<1> final {
  uint16_t version{1};
  request_id_t request_id{};
  target_kind_t target_kind{};
  uint64_t target_id{};
  // Set for eligibility computations so the verification keeps its package.
  std::optional<package_id_t> package_id;
  timestamp_milliseconds_t submitted_at{};
};

using pending_decryption_t = pending_decryption<1>;

}  // namespace refuge::schema
