#include <refuge/crypto/verify.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>

#include <array>
#include <memory>
#include <optional>
#include <vector>

namespace refuge::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

bool digest_verify(EVP_PKEY* pkey,
                   const EVP_MD* digest,
                   const uint8_t* signature,
                   const size_t signature_size,
                   const refuge::schema::bytes_view_t& message) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, digest, nullptr, pkey) != 1) {
    return false;
  }
  return EVP_DigestVerify(ctx.get(), signature, signature_size, message.data(),
                          message.size()) == 1;
}

bool verify_ed25519(const refuge::schema::bytes_view_t& message,
                    const refuge::schema::ed25519_signer_id& signer,
                    const refuge::schema::ed25519_signature_t& signature) {
  auto pkey =
      evp_pkey_ptr{EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                               signer.public_key.data(),
                                               signer.public_key.size()),
                   EVP_PKEY_free};
  if (!pkey) {
    return false;
  }
  return digest_verify(pkey.get(), nullptr, signature.data(), signature.size(),
                       message);
}

// Accepts [v || r || s] and [r || s || v]. Recovery ids 0..3 and 27+ are
// valid; 4..26 on both ends is rejected.
std::optional<std::array<uint8_t, 64>> compact_secp_signature(
    const refuge::schema::secp256k1_signature_t& signature) {
  auto out = std::array<uint8_t, 64>{};
  if (signature[0] <= 3 || signature[0] >= 27) {
    std::copy_n(signature.data() + 1, out.size(), out.data());
    return out;
  }
  if (signature[64] <= 3 || signature[64] >= 27) {
    std::copy_n(signature.data(), out.size(), out.data());
    return out;
  }
  return std::nullopt;
}

evp_pkey_ptr load_secp256k1_key(
    const refuge::schema::secp256k1_signer_id& signer) {
  auto key_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!key_ctx || EVP_PKEY_fromdata_init(key_ctx.get()) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }

  auto* group_name = const_cast<char*>("secp256k1");
  auto params =
      std::array{OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                                  group_name, 0),
                 OSSL_PARAM_construct_octet_string(
                     OSSL_PKEY_PARAM_PUB_KEY,
                     const_cast<unsigned char*>(signer.public_key.data()),
                     signer.public_key.size()),
                 OSSL_PARAM_construct_end()};

  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &raw_pkey, EVP_PKEY_PUBLIC_KEY,
                        params.data()) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }
  return evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
}

std::optional<std::vector<uint8_t>> der_encode(
    const std::array<uint8_t, 64>& compact) {
  auto ecdsa_sig = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  if (!ecdsa_sig) {
    return std::nullopt;
  }
  auto r = bignum_ptr{BN_bin2bn(compact.data(), 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(compact.data() + 32, 32, nullptr), BN_free};
  if (!r || !s ||
      ECDSA_SIG_set0(ecdsa_sig.get(), r.release(), s.release()) != 1) {
    return std::nullopt;
  }

  auto der_len = i2d_ECDSA_SIG(ecdsa_sig.get(), nullptr);
  if (der_len <= 0) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(static_cast<size_t>(der_len));
  auto* der_ptr = der.data();
  i2d_ECDSA_SIG(ecdsa_sig.get(), &der_ptr);
  return der;
}

bool verify_secp256k1(const refuge::schema::bytes_view_t& message,
                      const refuge::schema::secp256k1_signer_id& signer,
                      const refuge::schema::secp256k1_signature_t& signature) {
  auto compact = compact_secp_signature(signature);
  if (!compact) {
    return false;
  }
  auto pkey = load_secp256k1_key(signer);
  if (!pkey) {
    return false;
  }
  auto der = der_encode(*compact);
  if (!der) {
    return false;
  }
  return digest_verify(pkey.get(), EVP_sha256(), der->data(), der->size(),
                       message);
}

}  // namespace

bool available() {
  static const auto available_now = [] {
    auto ed_ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                                   EVP_PKEY_CTX_free};
    auto ec_ctx = evp_pkey_ctx_ptr{
        EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
    return ed_ctx != nullptr && ec_ctx != nullptr;
  }();
  return available_now;
}

bool verify_signature(const refuge::schema::bytes_view_t& message,
                      const refuge::schema::signer_id_t& signer,
                      const refuge::schema::signature_t& signature) {
  return std::visit(
      overloaded{
          [&](const refuge::schema::ed25519_signer_id& value) {
            const auto* ed =
                std::get_if<refuge::schema::ed25519_signature_t>(&signature);
            return ed != nullptr && verify_ed25519(message, value, *ed);
          },
          [&](const refuge::schema::secp256k1_signer_id& value) {
            const auto* secp =
                std::get_if<refuge::schema::secp256k1_signature_t>(&signature);
            return secp != nullptr && verify_secp256k1(message, value, *secp);
          },
          [](const refuge::schema::named_signer_t&) { return false; }},
      signer);
}

}  // namespace refuge::crypto
