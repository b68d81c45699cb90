#include <refuge/schema/key/builder.hpp>
#include <refuge/schema/key/ledger_keys.hpp>

namespace refuge::schema::key {

namespace {

refuge::schema::bytes_t make_id_key(std::string_view prefix, uint64_t id) {
  auto key = builder{};
  key.write(prefix).write(id);
  return std::move(key.data);
}

std::string_view sequence_name(const sequence_t sequence) {
  switch (sequence) {
    case sequence_t::record:
      return "RECORD";
    case sequence_t::package:
      return "PACKAGE";
    case sequence_t::verification:
      return "VERIFICATION";
    case sequence_t::event:
      return "EVENT";
  }
  return "UNKNOWN";
}

}  // namespace

refuge::schema::bytes_t make_prefix_key(std::string_view prefix) {
  return refuge::schema::make_bytes(prefix);
}

refuge::schema::bytes_t make_record_key(record_id_t id) {
  return make_id_key(kRecordKeyPrefix, id);
}

refuge::schema::bytes_t make_record_index_key(record_id_t id) {
  return make_id_key(kRecordIndexKeyPrefix, id);
}

refuge::schema::bytes_t make_package_key(package_id_t id) {
  return make_id_key(kPackageKeyPrefix, id);
}

refuge::schema::bytes_t make_verification_key(verification_id_t id) {
  return make_id_key(kVerificationKeyPrefix, id);
}

refuge::schema::bytes_t make_result_key(verification_id_t id) {
  return make_id_key(kResultKeyPrefix, id);
}

std::string_view pending_prefix(target_kind_t kind) {
  return kind == target_kind_t::eligibility_computation
             ? kPendingEligibilityKeyPrefix
             : kPendingRevealKeyPrefix;
}

refuge::schema::bytes_t make_pending_key(target_kind_t kind,
                                         request_id_t request_id) {
  return make_id_key(pending_prefix(kind), request_id);
}

refuge::schema::bytes_t make_sequence_key(sequence_t sequence) {
  auto key = builder{};
  key.write(kSequenceKeyPrefix).write(sequence_name(sequence));
  return std::move(key.data);
}

refuge::schema::bytes_t make_event_head_key() {
  return make_prefix_key(kEventHeadKey);
}

refuge::schema::bytes_t make_event_key(uint64_t event_id) {
  return make_id_key(kEventPrefix, event_id);
}

}  // namespace refuge::schema::key
