#pragma once
#include <cstdint>
#include <string>

// Schema type: cleartexts.
// Aid workflow: Strict callback payload shapes. The decryption capability
// returns the SCALE encoding of exactly one of these per callback kind.
namespace refuge::schema {

struct eligibility_cleartexts_t final {
  std::string identity;
  std::string needs;
  std::string resources;
};

struct reveal_cleartexts_t final {
  uint32_t eligibility{};
  uint32_t priority{};
};

}  // namespace refuge::schema
