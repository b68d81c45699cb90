#include <refuge/ledger/correlation_table.hpp>
#include <refuge/schema/key/ledger_keys.hpp>
#include <refuge/storage/memory/storage.hpp>
#include <refuge/storage/rocksdb/storage.hpp>
#include <spdlog/spdlog.h>

#include <array>

using namespace refuge::schema;

namespace refuge::ledger {

template <typename Library>
correlation_table<Library>::correlation_table(
    refuge::storage::storage<Library>& storage)
    : storage_{storage} {}

template <typename Library>
ledger_error_code correlation_table<Library>::stage_register(
    refuge::storage::write_batch& batch,
    const pending_decryption_t& entry) {
  auto key = key::make_pending_key(entry.target_kind, entry.request_id);
  if (storage_.template get<pending_decryption_t>(encoder_, batch,
                                                  make_bytes_view(key))) {
    spdlog::warn("Decryption request {} is already outstanding for {}",
                 entry.request_id, to_string(entry.target_kind));
    return ledger_error_code::duplicate_request_id;
  }
  batch.put(std::move(key), encoder_.encode(entry));
  spdlog::debug("Registered decryption request {} for {} {}", entry.request_id,
                to_string(entry.target_kind), entry.target_id);
  return ledger_error_code::ok;
}

template <typename Library>
std::optional<pending_decryption_t> correlation_table<Library>::stage_resolve(
    refuge::storage::write_batch& batch,
    target_kind_t kind,
    request_id_t request_id) {
  auto key = key::make_pending_key(kind, request_id);
  auto entry = storage_.template get<pending_decryption_t>(
      encoder_, batch, make_bytes_view(key));
  if (!entry) {
    return std::nullopt;
  }
  batch.erase(std::move(key));
  return entry;
}

template <typename Library>
std::optional<pending_decryption_t> correlation_table<Library>::find(
    target_kind_t kind,
    request_id_t request_id) const {
  auto key = key::make_pending_key(kind, request_id);
  return storage_.template get<pending_decryption_t>(encoder_,
                                                     make_bytes_view(key));
}

template <typename Library>
std::vector<pending_decryption_t> correlation_table<Library>::outstanding()
    const {
  auto entries = std::vector<pending_decryption_t>{};
  for (auto kind : std::array{target_kind_t::eligibility_computation,
                              target_kind_t::result_reveal}) {
    auto prefix = key::make_prefix_key(key::pending_prefix(kind));
    for (const auto& [row_key, value] :
         storage_.list_by_prefix(make_bytes_view(prefix))) {
      entries.push_back(
          encoder_.template decode<pending_decryption_t>(make_bytes_view(value)));
    }
  }
  return entries;
}

template class correlation_table<refuge::storage::rocksdb_storage_tag>;
template class correlation_table<refuge::storage::memory_storage_tag>;

}  // namespace refuge::ledger
