/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <seastar/core/future.hh>
#include <seastar/core/temporary_buffer.hh>
#include <string>
#include <vector>

#include "digest.hh"
#include "object_id.hh"
#include "options.hh"
#include "schema.hh"
#include "stats.hh"
#include "store/collection.hh"

namespace gridfs {

// Splits the bytes written to it into chunk records, then writes the file
// entry on close().
//
// Chunks are written one at a time, in order, as soon as they fill up. The
// file entry is only written once every chunk has been acknowledged, so a
// stream that fails or is abandoned leaves no visible file behind; its
// chunks stay in the store unreferenced.
//
// Writes must not overlap: wait for each write() before issuing the next.
class upload_stream {
 public:
  enum class state {
    open,
    closed,
    aborted,
    failed,
  };

 private:
  object_id _id;
  std::string _filename;
  int32_t _chunk_size;
  std::optional<store::document> _metadata;
  std::function<void(uint64_t)> _progress;

  store::collection_ptr _files;
  store::collection_ptr _chunks;
  store::write_options _write_opts;
  stats::bucket_stats_ptr _stats;
  std::optional<md5_digest> _md5;

  std::vector<uint8_t> _pending;
  int32_t _next_n = 0;
  uint64_t _length = 0;
  uint64_t _persisted = 0;
  state _state = state::open;
  bool _writing = false;

 public:
  upload_stream(
      object_id id, std::string filename, int32_t chunk_size,
      upload_options opts, store::collection_ptr files,
      store::collection_ptr chunks, store::write_options write_opts,
      bool compute_md5, stats::bucket_stats_ptr stats
  );

  upload_stream(upload_stream&&) = default;
  upload_stream(const upload_stream&) = delete;

  const object_id& id() const { return _id; }
  const std::string& filename() const { return _filename; }
  int32_t chunk_size() const { return _chunk_size; }
  state get_state() const { return _state; }

  // Bytes written so far, persisted or not.
  uint64_t length() const { return _length; }

  // 'data' must stay valid until the returned future resolves.
  seastar::future<> write(const char* data, size_t len);
  seastar::future<> write(seastar::temporary_buffer<char> buf);

  // Persist the trailing chunk and the file entry.
  seastar::future<file_entry> close();

  // Give up on the upload. Chunks written so far are not removed.
  seastar::future<> abort();

 private:
  void check_open() const;
  seastar::future<> flush_chunk();
};

}  // namespace gridfs
