#pragma once

#include <refuge/schema/primitives.hpp>
#include <refuge/schema/target_kind.hpp>
#include <array>
#include <cstdint>
#include <string_view>

// Schema key type: ledger keys.
// Aid workflow: Canonical keyspaces for records, packages, verifications,
// correlation entries, sequences and the event stream.
namespace refuge::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kRecordKeyPrefix{"SYS|STATE|RECORD|"};
inline constexpr std::string_view kRecordIndexKeyPrefix{
    "SYS|STATE|RECORD_INDEX|"};
inline constexpr std::string_view kPackageKeyPrefix{"SYS|STATE|PACKAGE|"};
inline constexpr std::string_view kVerificationKeyPrefix{
    "SYS|STATE|VERIFICATION|"};
inline constexpr std::string_view kResultKeyPrefix{"SYS|STATE|RESULT|"};
inline constexpr std::string_view kPendingEligibilityKeyPrefix{
    "SYS|STATE|PENDING|ELIGIBILITY|"};
inline constexpr std::string_view kPendingRevealKeyPrefix{
    "SYS|STATE|PENDING|REVEAL|"};
inline constexpr std::string_view kSequenceKeyPrefix{"SYS|STATE|SEQ|"};
inline constexpr std::string_view kEventHeadKey{"SYS|STATE|EVENT_HEAD"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

inline constexpr std::array<std::string_view, 10> kLedgerKeyspaces{
    kRecordKeyPrefix,        kRecordIndexKeyPrefix,
    kPackageKeyPrefix,       kVerificationKeyPrefix,
    kResultKeyPrefix,        kPendingEligibilityKeyPrefix,
    kPendingRevealKeyPrefix, kSequenceKeyPrefix,
    kEventHeadKey,           kEventPrefix};

enum class sequence_t : uint8_t { record, package, verification, event };

refuge::schema::bytes_t make_prefix_key(std::string_view prefix);
refuge::schema::bytes_t make_record_key(record_id_t id);
refuge::schema::bytes_t make_record_index_key(record_id_t id);
refuge::schema::bytes_t make_package_key(package_id_t id);
refuge::schema::bytes_t make_verification_key(verification_id_t id);
refuge::schema::bytes_t make_result_key(verification_id_t id);
refuge::schema::bytes_t make_pending_key(target_kind_t kind,
                                         request_id_t request_id);
std::string_view pending_prefix(target_kind_t kind);
refuge::schema::bytes_t make_sequence_key(sequence_t sequence);
refuge::schema::bytes_t make_event_head_key();
refuge::schema::bytes_t make_event_key(uint64_t event_id);

}  // namespace refuge::schema::key
