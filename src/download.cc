/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#include "download.hh"

#include <fmt/format.h>

#include <seastar/core/coroutine.hh>
#include <seastar/util/log.hh>
#include <utility>

#include "errors.hh"

static seastar::logger applog(__FILE__);

namespace gridfs {

download_stream::download_stream(
    file_entry file, store::cursor_ptr chunks, std::string chunks_name,
    stats::bucket_stats_ptr stats
)
    : _file(std::move(file)),
      _chunks(std::move(chunks)),
      _chunks_name(std::move(chunks_name)),
      _stats(std::move(stats)) {
  _stats->downloads().stream();
  applog.debug(
      "open download '{}', {} bytes in {} chunks", _file.id, _file.length,
      _file.chunk_count()
  );
}

seastar::temporary_buffer<char> download_stream::check(store::document&& doc) {
  auto chunk = chunk_record::from_document(std::move(doc), _file.id);

  if (chunk.n != _next_n) {
    throw corrupt_file_error(
        _file.id, _next_n,
        fmt::format("expected chunk {}, found chunk {}", _next_n, chunk.n)
    );
  }
  if (_next_n >= _file.chunk_count()) {
    throw corrupt_file_error(
        _file.id, chunk.n,
        fmt::format("file should have {} chunks", _file.chunk_count())
    );
  }

  auto expected = _file.expected_chunk_length(chunk.n);
  if (static_cast<int64_t>(chunk.data.size()) != expected) {
    throw corrupt_file_error(
        _file.id, chunk.n,
        fmt::format(
            "expected {} bytes, found {}", expected, chunk.data.size()
        )
    );
  }

  ++_next_n;
  _stats->downloads().chunk(chunk.data.size());
  return std::move(chunk).release_data();
}

seastar::future<std::optional<seastar::temporary_buffer<char>>>
download_stream::next() {
  if (_error) {
    std::rethrow_exception(_error);
  }
  if (_done) {
    co_return std::nullopt;
  }

  try {
    auto doc = co_await with_store_context(
        "read chunk", _chunks_name,
        fmt::format("{}/{}", _file.id, _next_n),
        [this] { return _chunks->next(); }
    );

    if (!doc) {
      if (_next_n < _file.chunk_count()) {
        throw corrupt_file_error(_file.id, _next_n, "chunk is missing");
      }
      applog.debug("finished download '{}'", _file.id);
      _done = true;
      co_return std::nullopt;
    }

    auto n = _next_n;
    auto buf = check(std::move(*doc));
    applog.debug("read chunk {} of '{}', {} bytes", n, _file.id, buf.size());
    co_return std::move(buf);
  } catch (...) {
    _error = std::current_exception();
    applog.error("download '{}' failed: {}", _file.id, _error);
    throw;
  }
}

}  // namespace gridfs
