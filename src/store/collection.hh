/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <seastar/core/future.hh>
#include <seastar/core/shared_ptr.hh>
#include <string>
#include <vector>

#include "store/document.hh"

// Capabilities the engine needs from a document store. Connection handling,
// authentication and wire encoding belong to implementations.

namespace gridfs {

namespace store {

// Concerns are passed through to the store unmodified.
struct write_concern {
  std::optional<int32_t> w;
  std::optional<std::string> w_tag;
  std::optional<bool> journal;
  std::optional<std::chrono::milliseconds> timeout;
};

struct read_concern {
  std::string level;
};

enum class read_mode {
  primary,
  primary_preferred,
  secondary,
  secondary_preferred,
  nearest,
};

struct read_preference {
  read_mode mode = read_mode::primary;
  std::optional<std::chrono::seconds> max_staleness;
};

struct write_options {
  std::optional<write_concern> concern;
};

struct query_options {
  // {field: 1 | -1, ...}, applied in key order.
  std::optional<document> sort;
  // inclusion list of top-level fields, '_id' is always returned.
  std::optional<document> projection;
  int64_t skip = 0;
  // 0 or unset means no limit.
  std::optional<int64_t> limit;
  std::optional<uint32_t> batch_size;
  std::optional<std::chrono::milliseconds> max_time;
  std::optional<bool> no_cursor_timeout;
  std::optional<bool> allow_disk_use;
  std::optional<read_concern> concern;
  std::optional<read_preference> preference;
};

struct index_model {
  std::string name;
  // {field: 1 | -1, ...}
  document keys;
  bool unique = false;
};

// Forward-only, lazy sequence of documents.
class cursor {
 public:
  virtual ~cursor() = default;

  // Obtain the next document, or std::nullopt once the cursor is exhausted.
  virtual seastar::future<std::optional<document>> next() = 0;
};

using cursor_ptr = std::unique_ptr<cursor>;

class collection {
 public:
  virtual ~collection() = default;

  virtual const std::string& name() const = 0;

  virtual seastar::future<> insert_one(
      document doc, const write_options& opts
  ) = 0;

  // Sets the top-level 'fields' on the first document matching 'filter'.
  // Returns the number of matched documents (0 or 1).
  virtual seastar::future<uint64_t> update_one(
      const document& filter, const document& fields, const write_options& opts
  ) = 0;

  // Both return the number of removed documents.
  virtual seastar::future<uint64_t> delete_one(
      const document& filter, const write_options& opts
  ) = 0;
  virtual seastar::future<uint64_t> delete_many(
      const document& filter, const write_options& opts
  ) = 0;

  virtual seastar::future<cursor_ptr> find(
      const document& filter, const query_options& opts
  ) = 0;

  virtual seastar::future<std::optional<document>> find_one(
      const document& filter, const query_options& opts
  );

  // No-op if an index with the same name and keys already exists.
  virtual seastar::future<> create_index(const index_model& model) = 0;
  virtual seastar::future<std::vector<index_model>> list_indexes() = 0;

  // Removes every document and index. Dropping an empty or unknown
  // collection succeeds.
  virtual seastar::future<> drop() = 0;
};

using collection_ptr = seastar::shared_ptr<collection>;

class database {
 public:
  virtual ~database() = default;

  // Obtain a handle to the named collection, creating it if needed.
  virtual seastar::future<collection_ptr> get_collection(
      const std::string& name
  ) = 0;
};

using database_ptr = seastar::shared_ptr<database>;

}  // namespace store

}  // namespace gridfs
