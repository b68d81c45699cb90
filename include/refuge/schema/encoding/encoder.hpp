#pragma once
#include <refuge/schema/primitives.hpp>
#include <optional>
#include <span>

namespace refuge::schema::encoding {

// The wire format is a build-time choice made through the tag type; nothing
// in the ledger swaps codecs at runtime.
template <typename Library>
struct encoder {
  template <typename T>
  refuge::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, refuge::schema::bytes_t& out);

  template <typename T>
  T decode(const refuge::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const refuge::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode_exact(const refuge::schema::bytes_view_t& bytes);
};

}  // namespace refuge::schema::encoding
