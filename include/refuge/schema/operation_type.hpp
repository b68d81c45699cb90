#pragma once

#include <refuge/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: operation type.
// Aid workflow: Mutating ledger operations presented to the access policy.
namespace refuge::schema {

enum class operation_type_t : uint8_t {
  create_record = 0,
  create_package = 1,
  verify_eligibility = 2,
  approve_record = 3,
  distribute_record = 4,
  reject_record = 5,
  request_verification_result = 6
};

inline constexpr auto kOperationTypeMappings = std::array{
    std::pair<std::string_view, operation_type_t>{
        "create_record", operation_type_t::create_record},
    std::pair<std::string_view, operation_type_t>{
        "create_package", operation_type_t::create_package},
    std::pair<std::string_view, operation_type_t>{
        "verify_eligibility", operation_type_t::verify_eligibility},
    std::pair<std::string_view, operation_type_t>{
        "approve_record", operation_type_t::approve_record},
    std::pair<std::string_view, operation_type_t>{
        "distribute_record", operation_type_t::distribute_record},
    std::pair<std::string_view, operation_type_t>{
        "reject_record", operation_type_t::reject_record},
    std::pair<std::string_view, operation_type_t>{
        "request_verification_result",
        operation_type_t::request_verification_result}};

template <>
inline std::optional<operation_type_t> try_from_string<operation_type_t>(
    const std::string_view value) {
  return from_string(value, kOperationTypeMappings);
}

inline constexpr std::string_view to_string(const operation_type_t value) {
  return to_string(value, kOperationTypeMappings).value_or("unknown");
}

}  // namespace refuge::schema
