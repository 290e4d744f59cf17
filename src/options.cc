/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#include "options.hh"

#include <fmt/format.h>

#include "errors.hh"
#include "store/errors.hh"
#include "store/matcher.hh"

namespace gridfs {

static void check_chunk_size(int32_t chunk_size) {
  if (chunk_size <= 0) {
    throw invalid_argument_error(
        fmt::format("chunk size must be positive, got {}", chunk_size)
    );
  }
}

void bucket_options::validate() const {
  if (bucket_name.empty()) {
    throw invalid_argument_error("bucket name must not be empty");
  }
  check_chunk_size(chunk_size_bytes);
}

void upload_options::validate() const {
  if (chunk_size_bytes) {
    check_chunk_size(*chunk_size_bytes);
  }
  if (metadata && !metadata->is_object()) {
    throw invalid_argument_error("metadata must be a document");
  }
}

void find_options::validate() const {
  if (batch_size && *batch_size <= 0) {
    throw invalid_argument_error(
        fmt::format("batch size must be positive, got {}", *batch_size)
    );
  }
  if (limit && *limit < 0) {
    throw invalid_argument_error(
        fmt::format("limit must not be negative, got {}", *limit)
    );
  }
  if (skip < 0) {
    throw invalid_argument_error(
        fmt::format("skip must not be negative, got {}", skip)
    );
  }
  if (max_time && max_time->count() < 0) {
    throw invalid_argument_error("max time must not be negative");
  }
  if (sort) {
    try {
      store::check_sort(*sort);
    } catch (const store::document_format_error& e) {
      throw invalid_argument_error(fmt::format("invalid sort: {}", e.what()));
    }
  }
}

}  // namespace gridfs
