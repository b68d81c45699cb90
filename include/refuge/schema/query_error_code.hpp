#pragma once

#include <cstdint>

// Schema type: query error code.
// Aid workflow: Read-path failure taxonomy with stable numeric codes.
namespace refuge::schema {

enum class query_error_code : uint32_t {
  invalid_key = 1,
  not_found = 2,
  unsupported_path = 3,
};

}  // namespace refuge::schema
