/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#pragma once

#include <fmt/format.h>

#include <atomic>
#include <cstdint>
#include <seastar/core/shared_ptr.hh>
#include <sstream>

namespace gridfs {

namespace stats {

class transfer_stats {
  std::atomic<uint64_t> _streams;
  std::atomic<uint64_t> _chunks;
  std::atomic<uint64_t> _bytes;

 public:
  transfer_stats() : _streams(0), _chunks(0), _bytes(0) {}
  transfer_stats(transfer_stats&) = delete;
  transfer_stats(const transfer_stats&) = delete;

  void stream() { _streams.fetch_add(1); }
  void chunk(uint64_t len) {
    _chunks.fetch_add(1);
    _bytes.fetch_add(len);
  }

  uint64_t streams() const { return _streams.load(); }
  uint64_t chunks() const { return _chunks.load(); }
  uint64_t bytes() const { return _bytes.load(); }

  void print(std::ostringstream& oss) const {
    oss << fmt::format(
        "streams: {}, chunks: {}, bytes: {}", streams(), chunks(), bytes()
    );
  }
};

class bucket_stats {
  transfer_stats _uploads;
  transfer_stats _downloads;

  std::atomic<uint64_t> _find;
  std::atomic<uint64_t> _delete;
  std::atomic<uint64_t> _rename;
  std::atomic<uint64_t> _drop;

 public:
  bucket_stats() : _find(0), _delete(0), _rename(0), _drop(0) {}
  bucket_stats(bucket_stats&) = delete;
  bucket_stats(const bucket_stats&) = delete;

  transfer_stats& uploads() { return _uploads; }
  transfer_stats& downloads() { return _downloads; }
  const transfer_stats& uploads() const { return _uploads; }
  const transfer_stats& downloads() const { return _downloads; }

  void find() { _find.fetch_add(1); }
  void remove() { _delete.fetch_add(1); }
  void rename() { _rename.fetch_add(1); }
  void drop() { _drop.fetch_add(1); }

  uint64_t finds() const { return _find.load(); }
  uint64_t removes() const { return _delete.load(); }
  uint64_t renames() const { return _rename.load(); }
  uint64_t drops() const { return _drop.load(); }

  void print(std::ostringstream& oss) const {
    oss << "uploads(";
    _uploads.print(oss);
    oss << "), downloads(";
    _downloads.print(oss);
    oss << "), "
        << fmt::format(
               "find: {}, delete: {}, rename: {}, drop: {}", finds(),
               removes(), renames(), drops()
           );
  }
};

using bucket_stats_ptr = seastar::lw_shared_ptr<bucket_stats>;

}  // namespace stats

}  // namespace gridfs
