#pragma once
#include <refuge/schema/primitives.hpp>
#include <boost/endian/buffers.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <type_traits>

namespace refuge::schema::key {

// Integers are written big-endian so that prefix iteration walks ids in
// ascending numeric order.
struct builder final {
  refuge::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);

  template <typename T, typename = std::enable_if_t<std::is_unsigned_v<T>>>
  builder& write(T value) {
    auto buffer =
        boost::endian::endian_buffer<boost::endian::order::big, T,
                                     sizeof(T) * 8>{value};
    return write(std::span<const uint8_t>{
        reinterpret_cast<const uint8_t*>(buffer.data()), sizeof(T)});
  }
};

/// Read the big-endian u64 that follows `prefix` in `key`.
std::optional<uint64_t> parse_u64_suffix(const refuge::schema::bytes_view_t& key,
                                         std::string_view prefix);

}  // namespace refuge::schema::key
