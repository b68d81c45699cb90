#include <blake3.h>
#include <refuge/blake3/hash.hpp>

namespace refuge::blake3 {

namespace {

refuge::schema::hash32_t finalize(blake3_hasher& hasher) {
  auto output = refuge::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

refuge::schema::hash32_t hash(const std::string_view& str) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, str.data(), str.size());
  return finalize(hasher);
}

refuge::schema::hash32_t hash(const std::span<const uint8_t>& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  return finalize(hasher);
}

refuge::schema::hash32_t hash(const std::span<const uint8_t>& left,
                              const std::span<const uint8_t>& right) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, left.data(), left.size());
  blake3_hasher_update(&hasher, right.data(), right.size());
  return finalize(hasher);
}

}  // namespace refuge::blake3
