#pragma once
#include <refuge/common/critical.hpp>
#include <refuge/schema/encoding/encoder.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace refuge::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  refuge::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, refuge::schema::bytes_t& out);

  template <typename T>
  T decode(const refuge::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const refuge::schema::bytes_view_t& bytes);

  /// Decode and reject inputs carrying bytes past the decoded value.
  template <typename T>
  std::optional<T> try_decode_exact(const refuge::schema::bytes_view_t& bytes);
};

template <typename T>
refuge::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    refuge::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        refuge::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const refuge::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    refuge::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const refuge::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode_exact(
    const refuge::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  // SCALE is canonical for these shapes, so a re-encode that differs in
  // size means the input had trailing bytes.
  if (encode(decoded.value()).size() != bytes.size()) {
    return std::nullopt;
  }
  return decoded;
}

}  // namespace refuge::schema::encoding
