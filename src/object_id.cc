/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#include "object_id.hh"

#include <algorithm>
#include <chrono>
#include <stdexcept>

#include "utils.hh"

namespace gridfs {

namespace {

// Per-shard generator state. Each reactor runs on its own thread, so
// thread_local keeps shards from contending on the counter.
struct id_generator {
  std::array<uint8_t, 5> process_bytes;
  uint32_t counter;

  id_generator() {
    gen_rnd_bytes(process_bytes.data(), process_bytes.size());
    uint8_t seed[3];
    gen_rnd_bytes(seed, sizeof(seed));
    counter = (uint32_t(seed[0]) << 16) | (uint32_t(seed[1]) << 8) | seed[2];
  }
};

thread_local id_generator generator;

}  // namespace

object_id object_id::generate() {
  auto now = std::chrono::system_clock::now();
  auto secs = static_cast<uint32_t>(
      std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch())
          .count()
  );
  uint32_t count = generator.counter++ & 0xffffff;

  std::array<uint8_t, size> bytes;
  bytes[0] = secs >> 24;
  bytes[1] = secs >> 16;
  bytes[2] = secs >> 8;
  bytes[3] = secs;
  std::copy(
      generator.process_bytes.begin(), generator.process_bytes.end(),
      bytes.begin() + 4
  );
  bytes[9] = count >> 16;
  bytes[10] = count >> 8;
  bytes[11] = count;
  return object_id(bytes);
}

bool object_id::is_valid(std::string_view hex) {
  if (hex.size() != size * 2) {
    return false;
  }
  return std::all_of(hex.begin(), hex.end(), [](char c) {
    return hex_value(c) >= 0;
  });
}

object_id object_id::from_hex(std::string_view hex) {
  if (!is_valid(hex)) {
    throw std::invalid_argument(
        fmt::format("'{}' is not a valid object id", hex)
    );
  }
  std::array<uint8_t, size> bytes;
  for (size_t i = 0; i < size; ++i) {
    bytes[i] = (hex_value(hex[i * 2]) << 4) | hex_value(hex[i * 2 + 1]);
  }
  return object_id(bytes);
}

std::string object_id::to_hex() const {
  return gridfs::to_hex(_bytes.data(), _bytes.size());
}

uint32_t object_id::timestamp() const {
  return (uint32_t(_bytes[0]) << 24) | (uint32_t(_bytes[1]) << 16) |
         (uint32_t(_bytes[2]) << 8) | uint32_t(_bytes[3]);
}

std::ostream& operator<<(std::ostream& os, const object_id& id) {
  return os << id.to_hex();
}

}  // namespace gridfs
