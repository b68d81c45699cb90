#pragma once

#include <refuge/schema/encoding/encoder.hpp>
#include <refuge/schema/encoding/scale/encoder.hpp>
#include <refuge/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace refuge::testing {

using scale_encoder_t = refuge::schema::encoding::encoder<
    refuge::schema::encoding::scale_encoder_tag>;

inline refuge::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = refuge::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline refuge::schema::caller_id_t make_named_caller(const uint8_t seed) {
  auto named = refuge::schema::named_signer_t{};
  named[0] = seed;
  return refuge::schema::caller_id_t{named};
}

inline refuge::schema::ed25519_signer_id make_ed25519_signer(
    const uint8_t seed) {
  auto signer = refuge::schema::ed25519_signer_id{};
  for (std::size_t i = 0; i < signer.public_key.size(); ++i) {
    signer.public_key[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return signer;
}

inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = std::atomic<uint64_t>{};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)) +
                     "_" + std::to_string(counter++));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace refuge::testing
