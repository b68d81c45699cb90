#pragma once

#include <refuge/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: ledger event type.
// Aid workflow: Phase transitions surfaced to auditors and monitors.
namespace refuge::schema {

enum class ledger_event_type_t : uint16_t {
  record_registered = 1,
  package_created = 2,
  verification_requested = 3,
  verification_completed = 4,
  reveal_requested = 5,
  result_revealed = 6,
  record_approved = 7,
  record_distributed = 8,
  record_rejected = 9,
};

inline constexpr auto kLedgerEventTypeMappings = std::array{
    std::pair<std::string_view, ledger_event_type_t>{
        "record_registered", ledger_event_type_t::record_registered},
    std::pair<std::string_view, ledger_event_type_t>{
        "package_created", ledger_event_type_t::package_created},
    std::pair<std::string_view, ledger_event_type_t>{
        "verification_requested", ledger_event_type_t::verification_requested},
    std::pair<std::string_view, ledger_event_type_t>{
        "verification_completed", ledger_event_type_t::verification_completed},
    std::pair<std::string_view, ledger_event_type_t>{
        "reveal_requested", ledger_event_type_t::reveal_requested},
    std::pair<std::string_view, ledger_event_type_t>{
        "result_revealed", ledger_event_type_t::result_revealed},
    std::pair<std::string_view, ledger_event_type_t>{
        "record_approved", ledger_event_type_t::record_approved},
    std::pair<std::string_view, ledger_event_type_t>{
        "record_distributed", ledger_event_type_t::record_distributed},
    std::pair<std::string_view, ledger_event_type_t>{
        "record_rejected", ledger_event_type_t::record_rejected}};

inline constexpr std::string_view to_string(const ledger_event_type_t value) {
  return to_string(value, kLedgerEventTypeMappings).value_or("unknown");
}

}  // namespace refuge::schema
