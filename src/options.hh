/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "store/collection.hh"
#include "store/document.hh"

namespace gridfs {

constexpr int32_t default_chunk_size = 255 * 1024;

struct bucket_options {
  // collections are named '<bucket_name>.files' and '<bucket_name>.chunks'.
  std::string bucket_name = "fs";
  int32_t chunk_size_bytes = default_chunk_size;
  std::optional<store::write_concern> write_concern;
  std::optional<store::read_concern> read_concern;
  std::optional<store::read_preference> read_preference;
  bool disable_md5 = false;

  // throws invalid_argument_error.
  void validate() const;
};

struct upload_options {
  // overrides the bucket's chunk size for this upload.
  std::optional<int32_t> chunk_size_bytes;
  std::optional<store::document> metadata;
  // called after each chunk is persisted, with the bytes persisted so far.
  std::function<void(uint64_t)> progress;

  void validate() const;
};

struct find_options {
  std::optional<int32_t> batch_size;
  std::optional<int32_t> limit;
  std::optional<std::chrono::milliseconds> max_time;
  std::optional<bool> no_cursor_timeout;
  int32_t skip = 0;
  std::optional<store::document> sort;
  std::optional<bool> allow_disk_use;

  void validate() const;
};

}  // namespace gridfs
