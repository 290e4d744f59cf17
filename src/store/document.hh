/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <vector>

namespace gridfs {

namespace store {

// Documents keep their key order, which matters for sort and index key
// specifications.
using document = nlohmann::ordered_json;
using binary = document::binary_t;

inline document make_binary(std::vector<uint8_t>&& bytes) {
  return document::binary(std::move(bytes));
}

}  // namespace store

}  // namespace gridfs
