#pragma once

#include <refuge/schema/ledger_error_code.hpp>
#include <refuge/schema/ledger_event.hpp>
#include <refuge/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: operation result.
// Aid workflow: Envelope returned by every mutating ledger call. `id` carries
// the created entity id or the issued decryption request id.
namespace refuge::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::optional<uint64_t> id;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<ledger_event_t> events;
};

using operation_result_t = operation_result<1>;

inline bool succeeded(const operation_result_t& result) {
  return result.code == static_cast<uint32_t>(ledger_error_code::ok);
}

inline ledger_error_code error_code(const operation_result_t& result) {
  return static_cast<ledger_error_code>(result.code);
}

}  // namespace refuge::schema
