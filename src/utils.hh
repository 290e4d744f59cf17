/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>

namespace gridfs {

static const std::string hex_chars("0123456789abcdef");

// Fill 'len' bytes at 'out' with random data.
inline void gen_rnd_bytes(uint8_t* out, size_t len) {
  auto rnd = std::mt19937(std::random_device()());
  auto dist = std::uniform_int_distribution<int>(0, 255);

  std::generate_n(out, len, [&rnd, &dist] {
    return static_cast<uint8_t>(dist(rnd));
  });
}

inline std::string to_hex(const uint8_t* data, size_t len) {
  std::string s;
  s.reserve(len * 2);
  for (size_t i = 0; i < len; ++i) {
    s += hex_chars[data[i] >> 4];
    s += hex_chars[data[i] & 0x0f];
  }
  return s;
}

// Returns the value of a lowercase or uppercase hex digit, or -1.
inline int hex_value(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

}  // namespace gridfs
