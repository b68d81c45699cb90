#include <algorithm>
#include <cstring>
#include <iterator>
#include <ranges>
#include <refuge/schema/key/builder.hpp>

namespace refuge::schema::key {

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

std::optional<uint64_t> parse_u64_suffix(const refuge::schema::bytes_view_t& key,
                                         std::string_view prefix) {
  if (key.size() != prefix.size() + sizeof(uint64_t)) {
    return std::nullopt;
  }
  if (!std::equal(std::begin(prefix), std::end(prefix), std::begin(key),
                  [](const char lhs, const uint8_t rhs) {
                    return static_cast<uint8_t>(lhs) == rhs;
                  })) {
    return std::nullopt;
  }
  auto buffer = boost::endian::big_uint64_buf_t{};
  std::memcpy(buffer.data(), key.data() + prefix.size(), sizeof(uint64_t));
  return buffer.value();
}

}  // namespace refuge::schema::key
