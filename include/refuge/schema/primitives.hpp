#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace refuge::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using amount_t = boost::multiprecision::uint256_t;
using timestamp_milliseconds_t = uint64_t;

// Opaque reference to a value held by the encryption capability.
using ciphertext_handle_t = hash32_t;

// Correlation id assigned by the decryption capability on submission.
using request_id_t = uint64_t;

using record_id_t = uint64_t;
using package_id_t = uint64_t;
using verification_id_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(const std::string_view hex);

struct ed25519_signer_id final {
  std::array<uint8_t, 32> public_key;

  friend bool operator==(const ed25519_signer_id&,
                         const ed25519_signer_id&) = default;
};

struct secp256k1_signer_id final {
  std::array<uint8_t, 33> public_key;

  friend bool operator==(const secp256k1_signer_id&,
                         const secp256k1_signer_id&) = default;
};

using named_signer_t = hash32_t;  // Registry identity without a key
using signer_id_t =
    std::variant<ed25519_signer_id, secp256k1_signer_id, named_signer_t>;

// Identity presented by the caller of a mutating ledger operation.
using caller_id_t = signer_id_t;

using ed25519_signature_t = std::array<uint8_t, 64>;
using secp256k1_signature_t = std::array<uint8_t, 65>;
using signature_t = std::variant<ed25519_signature_t, secp256k1_signature_t>;

}  // namespace refuge::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
