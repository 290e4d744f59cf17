/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#pragma once

#include <fmt/format.h>

#include <array>
#include <compare>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace gridfs {

// 12-byte identifier for file entries and chunk records.
//
// Layout: 4-byte big-endian seconds since the epoch, 5 bytes of per-process
// randomness, 3-byte big-endian counter. Ids generated by the same shard are
// strictly increasing within a second.
class object_id {
 public:
  static constexpr size_t size = 12;

 private:
  std::array<uint8_t, size> _bytes{};

 public:
  object_id() = default;
  explicit object_id(const std::array<uint8_t, size>& bytes) : _bytes(bytes) {}

  static object_id generate();

  // throws std::invalid_argument if 'hex' is not 24 hex digits.
  static object_id from_hex(std::string_view hex);
  static bool is_valid(std::string_view hex);

  std::string to_hex() const;
  uint32_t timestamp() const;
  const std::array<uint8_t, size>& bytes() const { return _bytes; }

  auto operator<=>(const object_id&) const = default;
  bool operator==(const object_id&) const = default;
};

std::ostream& operator<<(std::ostream& os, const object_id& id);

}  // namespace gridfs

template <>
struct fmt::formatter<gridfs::object_id> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const gridfs::object_id& id, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(id.to_hex(), ctx);
  }
};
