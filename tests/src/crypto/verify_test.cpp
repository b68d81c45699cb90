#include <gtest/gtest.h>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <refuge/crypto/decryption_proof.hpp>
#include <refuge/crypto/verify.hpp>
#include <refuge/testing/decryption_authority.hpp>

#include <array>
#include <memory>
#include <optional>
#include <vector>

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#endif

namespace {

struct secp_fixture_t final {
  refuge::schema::secp256k1_signer_id signer;
  refuge::schema::secp256k1_signature_t signature;
  std::vector<uint8_t> message;
};

std::optional<secp_fixture_t> make_secp_fixture(
    const std::vector<uint8_t>& message) {
  auto* ec_key = EC_KEY_new_by_curve_name(NID_secp256k1);
  if (ec_key == nullptr || EC_KEY_generate_key(ec_key) != 1) {
    EC_KEY_free(ec_key);
    return std::nullopt;
  }
  EC_KEY_set_conv_form(ec_key, POINT_CONVERSION_COMPRESSED);

  auto compressed = std::array<uint8_t, 33>{};
  auto* pub_ptr = compressed.data();
  if (i2o_ECPublicKey(ec_key, &pub_ptr) !=
      static_cast<int>(compressed.size())) {
    EC_KEY_free(ec_key);
    return std::nullopt;
  }

  auto pkey = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>{
      EVP_PKEY_new(), EVP_PKEY_free};
  if (!pkey || EVP_PKEY_assign_EC_KEY(pkey.get(), ec_key) != 1) {
    EC_KEY_free(ec_key);
    return std::nullopt;
  }

  auto sign_ctx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>{
      EVP_MD_CTX_new(), EVP_MD_CTX_free};
  auto der_size = size_t{};
  if (!sign_ctx ||
      EVP_DigestSignInit(sign_ctx.get(), nullptr, EVP_sha256(), nullptr,
                         pkey.get()) != 1 ||
      EVP_DigestSign(sign_ctx.get(), nullptr, &der_size, message.data(),
                     message.size()) != 1) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(der_size);
  if (EVP_DigestSign(sign_ctx.get(), der.data(), &der_size, message.data(),
                     message.size()) != 1) {
    return std::nullopt;
  }

  const auto* der_ptr = static_cast<const unsigned char*>(der.data());
  auto* sig = d2i_ECDSA_SIG(nullptr, &der_ptr, static_cast<long>(der_size));
  if (sig == nullptr) {
    return std::nullopt;
  }
  const auto* r = static_cast<const BIGNUM*>(nullptr);
  const auto* s = static_cast<const BIGNUM*>(nullptr);
  ECDSA_SIG_get0(sig, &r, &s);

  auto compact = refuge::schema::secp256k1_signature_t{};
  auto ok_r = BN_bn2binpad(r, compact.data() + 1, 32);
  auto ok_s = BN_bn2binpad(s, compact.data() + 33, 32);
  ECDSA_SIG_free(sig);
  if (ok_r != 32 || ok_s != 32) {
    return std::nullopt;
  }
  return secp_fixture_t{
      .signer = refuge::schema::secp256k1_signer_id{.public_key = compressed},
      .signature = compact,
      .message = message};
}

}  // namespace

TEST(crypto_verify, verifies_secp256k1_signatures) {
  if (!refuge::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto fixture =
      make_secp_fixture(std::vector<uint8_t>{'s', 'e', 'c', 'p', '-', 'm'});
  ASSERT_TRUE(fixture.has_value());

  EXPECT_TRUE(refuge::crypto::verify_signature(
      refuge::schema::make_bytes_view(fixture->message),
      refuge::schema::signer_id_t{fixture->signer},
      refuge::schema::signature_t{fixture->signature}));

  fixture->message[0] ^= 0x01;
  EXPECT_FALSE(refuge::crypto::verify_signature(
      refuge::schema::make_bytes_view(fixture->message),
      refuge::schema::signer_id_t{fixture->signer},
      refuge::schema::signature_t{fixture->signature}));
}

TEST(crypto_verify, rejects_invalid_secp256k1_recovery_id) {
  if (!refuge::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto fixture = make_secp_fixture(std::vector<uint8_t>{'r', 'i', 'd'});
  ASSERT_TRUE(fixture.has_value());
  fixture->signature[0] = 7;
  fixture->signature[64] = 7;

  EXPECT_FALSE(refuge::crypto::verify_signature(
      refuge::schema::make_bytes_view(fixture->message),
      refuge::schema::signer_id_t{fixture->signer},
      refuge::schema::signature_t{fixture->signature}));
}

TEST(crypto_verify, rejects_mismatched_signer_and_signature_variants) {
  auto ed_signer = refuge::schema::ed25519_signer_id{};
  ed_signer.public_key[0] = 1;
  EXPECT_FALSE(refuge::crypto::verify_signature(
      refuge::schema::bytes_view_t{}, refuge::schema::signer_id_t{ed_signer},
      refuge::schema::signature_t{refuge::schema::secp256k1_signature_t{}}));
}

TEST(crypto_verify, rejects_named_signer_signatures) {
  auto named = refuge::schema::named_signer_t{};
  named[0] = 0x42;
  auto message = std::array<uint8_t, 3>{'a', 'b', 'c'};
  EXPECT_FALSE(refuge::crypto::verify_signature(
      refuge::schema::bytes_view_t{message.data(), message.size()},
      refuge::schema::signer_id_t{named},
      refuge::schema::signature_t{refuge::schema::ed25519_signature_t{}}));
}

TEST(decryption_proof, verifier_accepts_authority_signature) {
  if (!refuge::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto authority = refuge::testing::decryption_authority{};
  auto verifier = authority.verifier();
  auto cleartexts = refuge::schema::bytes_t{0x01, 0x02, 0x03};
  auto proof = authority.sign(42, cleartexts);

  EXPECT_TRUE(verifier(42, refuge::schema::make_bytes_view(cleartexts),
                       refuge::schema::make_bytes_view(proof)));
}

TEST(decryption_proof, proof_is_bound_to_request_and_cleartexts) {
  if (!refuge::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto authority = refuge::testing::decryption_authority{};
  auto verifier = authority.verifier();
  auto cleartexts = refuge::schema::bytes_t{0x01, 0x02, 0x03};
  auto proof = authority.sign(42, cleartexts);

  EXPECT_FALSE(verifier(43, refuge::schema::make_bytes_view(cleartexts),
                        refuge::schema::make_bytes_view(proof)));
  auto altered = cleartexts;
  altered[2] = 0x04;
  EXPECT_FALSE(verifier(42, refuge::schema::make_bytes_view(altered),
                        refuge::schema::make_bytes_view(proof)));

  auto other = refuge::testing::decryption_authority{};
  auto forged = other.sign(42, cleartexts);
  EXPECT_FALSE(verifier(42, refuge::schema::make_bytes_view(cleartexts),
                        refuge::schema::make_bytes_view(forged)));
}

TEST(decryption_proof, signature_length_selects_scheme) {
  EXPECT_FALSE(refuge::crypto::try_make_signature(
                   refuge::schema::make_bytes_view(refuge::schema::bytes_t(10)))
                   .has_value());
  auto ed = refuge::crypto::try_make_signature(
      refuge::schema::make_bytes_view(refuge::schema::bytes_t(64)));
  ASSERT_TRUE(ed.has_value());
  EXPECT_TRUE(std::holds_alternative<refuge::schema::ed25519_signature_t>(*ed));
  auto secp = refuge::crypto::try_make_signature(
      refuge::schema::make_bytes_view(refuge::schema::bytes_t(65)));
  ASSERT_TRUE(secp.has_value());
  EXPECT_TRUE(
      std::holds_alternative<refuge::schema::secp256k1_signature_t>(*secp));
}

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif
