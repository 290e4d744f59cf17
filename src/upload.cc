/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#include "upload.hh"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <seastar/core/coroutine.hh>
#include <seastar/util/log.hh>
#include <utility>

#include "errors.hh"
#include "store/errors.hh"

static seastar::logger applog(__FILE__);

namespace gridfs {

upload_stream::upload_stream(
    object_id id, std::string filename, int32_t chunk_size,
    upload_options opts, store::collection_ptr files,
    store::collection_ptr chunks, store::write_options write_opts,
    bool compute_md5, stats::bucket_stats_ptr stats
)
    : _id(id),
      _filename(std::move(filename)),
      _chunk_size(chunk_size),
      _metadata(std::move(opts.metadata)),
      _progress(std::move(opts.progress)),
      _files(std::move(files)),
      _chunks(std::move(chunks)),
      _write_opts(std::move(write_opts)),
      _stats(std::move(stats)) {
  if (_chunk_size <= 0) {
    throw invalid_argument_error(
        fmt::format("chunk size must be positive, got {}", _chunk_size)
    );
  }
  if (compute_md5) {
    _md5.emplace();
  }
  _pending.reserve(_chunk_size);
  _stats->uploads().stream();
  applog.debug(
      "open upload '{}' ({}), chunk size {}", _id, _filename, _chunk_size
  );
}

void upload_stream::check_open() const {
  if (_state != state::open) {
    throw invalid_argument_error("stream is not open");
  }
  if (_writing) {
    throw invalid_argument_error("a write is already in progress");
  }
}

seastar::future<> upload_stream::write(const char* data, size_t len) {
  check_open();
  _writing = true;
  try {
    if (_md5) {
      _md5->update(data, len);
    }
    _length += len;

    while (len > 0) {
      auto room = static_cast<size_t>(_chunk_size) - _pending.size();
      auto take = std::min(len, room);
      _pending.insert(_pending.end(), data, data + take);
      data += take;
      len -= take;

      if (_pending.size() == static_cast<size_t>(_chunk_size)) {
        co_await flush_chunk();
      }
    }
  } catch (...) {
    _writing = false;
    _state = state::failed;
    throw;
  }
  _writing = false;
}

seastar::future<> upload_stream::write(seastar::temporary_buffer<char> buf) {
  co_await write(buf.get(), buf.size());
}

seastar::future<> upload_stream::flush_chunk() {
  chunk_record chunk{
      object_id::generate(), _id, _next_n, std::exchange(_pending, {})
  };
  _pending.reserve(_chunk_size);

  auto n = chunk.n;
  auto len = chunk.data.size();
  applog.debug("write chunk {} of '{}', {} bytes", n, _id, len);

  co_await with_store_context(
      "insert chunk", _chunks->name(), fmt::format("{}/{}", _id, n),
      [this, &chunk] {
        return _chunks->insert_one(std::move(chunk).to_document(), _write_opts);
      }
  );

  ++_next_n;
  _persisted += len;
  _stats->uploads().chunk(len);
  if (_progress) {
    _progress(_persisted);
  }
}

seastar::future<file_entry> upload_stream::close() {
  check_open();
  _writing = true;
  try {
    if (!_pending.empty()) {
      co_await flush_chunk();
    }

    file_entry entry;
    entry.id = _id;
    entry.length = static_cast<int64_t>(_length);
    entry.chunk_size = _chunk_size;
    entry.upload_date =
        std::chrono::time_point_cast<std::chrono::milliseconds>(
            upload_clock::now()
        );
    entry.filename = _filename;
    entry.metadata = _metadata;
    if (_md5) {
      entry.md5 = _md5->finish();
    }

    co_await with_store_context(
        "insert file entry", _files->name(), _id.to_hex(),
        [this, &entry] {
          return _files->insert_one(entry.to_document(), _write_opts)
              .handle_exception_type(
                  [this](const store::duplicate_key_error&) {
                    return seastar::make_exception_future<>(
                        file_exists_error(_id)
                    );
                  }
              );
        }
    );

    _writing = false;
    _state = state::closed;
    applog.debug(
        "closed upload '{}', {} bytes in {} chunks", _id, _length, _next_n
    );
    co_return entry;
  } catch (...) {
    _writing = false;
    _state = state::failed;
    applog.warn("upload '{}' failed: {}", _id, std::current_exception());
    throw;
  }
}

seastar::future<> upload_stream::abort() {
  if (_state == state::closed) {
    return seastar::make_exception_future<>(
        invalid_argument_error("stream is already closed")
    );
  }
  if (_state == state::open) {
    applog.debug(
        "abort upload '{}' after {} chunks, leaving them behind", _id, _next_n
    );
    _state = state::aborted;
  }
  return seastar::make_ready_future<>();
}

}  // namespace gridfs
