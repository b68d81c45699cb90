#pragma once

#include <refuge/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: query result.
// Aid workflow: Read API envelope: SCALE-encoded value, key echo and error
// metadata.
namespace refuge::schema {

template <uint16_t Version>
struct query_result;

template <>
struct query_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  bytes_t key;
  bytes_t value;
  std::string codespace;
};

using query_result_t = query_result<1>;

}  // namespace refuge::schema
