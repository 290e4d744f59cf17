/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#pragma once

#include <cstdint>
#include <exception>
#include <optional>
#include <seastar/core/future.hh>
#include <seastar/core/temporary_buffer.hh>
#include <string>

#include "schema.hh"
#include "stats.hh"
#include "store/collection.hh"

namespace gridfs {

// Yields the chunks of one file, in order, checking them against the file
// entry as they arrive. The first inconsistency fails the stream with
// corrupt_file_error, and every later next() fails the same way.
class download_stream {
  file_entry _file;
  store::cursor_ptr _chunks;
  std::string _chunks_name;
  stats::bucket_stats_ptr _stats;

  int64_t _next_n = 0;
  bool _done = false;
  std::exception_ptr _error;

 public:
  download_stream(
      file_entry file, store::cursor_ptr chunks, std::string chunks_name,
      stats::bucket_stats_ptr stats
  );

  download_stream(download_stream&&) = default;
  download_stream(const download_stream&) = delete;

  const file_entry& file() const { return _file; }

  // Next chunk's bytes, or std::nullopt once the whole file was read.
  seastar::future<std::optional<seastar::temporary_buffer<char>>> next();

 private:
  seastar::temporary_buffer<char> check(store::document&& doc);
};

}  // namespace gridfs
