/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <seastar/core/temporary_buffer.hh>
#include <string>
#include <vector>

#include "object_id.hh"
#include "store/document.hh"

namespace gridfs {

// Document keys of file entries and chunk records.
namespace fields {

constexpr const char* id = "_id";
constexpr const char* length = "length";
constexpr const char* chunk_size = "chunkSize";
constexpr const char* upload_date = "uploadDate";
constexpr const char* filename = "filename";
constexpr const char* metadata = "metadata";
constexpr const char* md5 = "md5";

constexpr const char* files_id = "files_id";
constexpr const char* n = "n";
constexpr const char* data = "data";

}  // namespace fields

using upload_clock = std::chrono::system_clock;
using upload_time =
    std::chrono::time_point<upload_clock, std::chrono::milliseconds>;

// The existence proof of a stored file, written last by an upload.
struct file_entry {
  object_id id;
  int64_t length = 0;
  int32_t chunk_size = 0;
  upload_time upload_date;
  std::string filename;
  std::optional<store::document> metadata;
  std::optional<std::string> md5;

  store::document to_document() const;

  // throws store::document_format_error when there's no usable '_id', and
  // corrupt_file_error when other fields are missing or have the wrong type.
  static file_entry from_document(const store::document& doc);

  // ceil(length / chunk_size), zero for empty files.
  int64_t chunk_count() const;

  // Size chunk 'n' must have; only the last one may be short.
  int64_t expected_chunk_length(int64_t n) const;
};

struct chunk_record {
  object_id id;
  object_id files_id;
  int32_t n = 0;
  std::vector<uint8_t> data;

  store::document to_document() &&;

  // throws corrupt_file_error, naming 'owner', if 'doc' is not a chunk.
  static chunk_record from_document(
      store::document&& doc, const object_id& owner
  );

  // Hands the payload over to a buffer without copying it.
  seastar::temporary_buffer<char> release_data() &&;
};

}  // namespace gridfs
