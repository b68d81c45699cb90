#pragma once

#include <cstdint>
#include <string_view>

namespace refuge::schema {

enum class ledger_error_code : uint32_t {
  ok = 0,
  not_found = 1,
  unauthorized = 2,
  illegal_transition = 3,
  unknown_request_id = 4,
  invalid_proof = 5,
  already_revealed = 6,
  duplicate_request_id = 7,
  malformed_cleartexts = 8,
  invalid_record = 9,
  invalid_package = 10,
  decryption_unavailable = 11,
  encryption_unavailable = 12,
};

inline constexpr std::string_view to_string(const ledger_error_code value) {
  switch (value) {
    case ledger_error_code::ok:
      return "ok";
    case ledger_error_code::not_found:
      return "not found";
    case ledger_error_code::unauthorized:
      return "unauthorized";
    case ledger_error_code::illegal_transition:
      return "illegal status transition";
    case ledger_error_code::unknown_request_id:
      return "unknown request id";
    case ledger_error_code::invalid_proof:
      return "invalid proof";
    case ledger_error_code::already_revealed:
      return "already revealed";
    case ledger_error_code::duplicate_request_id:
      return "duplicate request id";
    case ledger_error_code::malformed_cleartexts:
      return "malformed cleartexts";
    case ledger_error_code::invalid_record:
      return "invalid record";
    case ledger_error_code::invalid_package:
      return "invalid package";
    case ledger_error_code::decryption_unavailable:
      return "decryption capability unavailable";
    case ledger_error_code::encryption_unavailable:
      return "encryption capability unavailable";
  }
  return "unknown";
}

}  // namespace refuge::schema
