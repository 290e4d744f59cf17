/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <seastar/core/future.hh>
#include <seastar/core/iostream.hh>
#include <string>

#include "download.hh"
#include "object_id.hh"
#include "options.hh"
#include "schema.hh"
#include "stats.hh"
#include "store/collection.hh"
#include "upload.hh"

namespace gridfs {

// File entries matching a find(), read lazily.
class files_cursor {
  store::cursor_ptr _cursor;
  std::string _files_name;

 public:
  files_cursor(store::cursor_ptr cursor, std::string files_name)
      : _cursor(std::move(cursor)), _files_name(std::move(files_name)) {}

  seastar::future<std::optional<file_entry>> next();
};

// A GridFS bucket: the '<name>.files' and '<name>.chunks' collections of a
// database, operated on as a unit.
//
// Constructing a bucket doesn't touch the store. Uploads make sure the
// indexes exist first; every other operation works without them.
class bucket {
  store::database_ptr _db;
  bucket_options _opts;
  stats::bucket_stats_ptr _stats;

 public:
  // throws invalid_argument_error if 'opts' are not valid.
  explicit bucket(store::database_ptr db, bucket_options opts = {});

  const bucket_options& options() const { return _opts; }
  const stats::bucket_stats& get_stats() const { return *_stats; }

  std::string files_collection_name() const;
  std::string chunks_collection_name() const;

  // Create the bucket's indexes unless they already exist.
  seastar::future<> ensure_indexes();

  seastar::future<upload_stream> open_upload_stream(
      std::string filename, upload_options opts = {}
  );
  // Fails with file_exists_error if 'id' already names a file.
  seastar::future<upload_stream> open_upload_stream_with_id(
      object_id id, std::string filename, upload_options opts = {}
  );

  // Upload everything 'source' yields until its end.
  seastar::future<object_id> upload_from_stream(
      std::string filename, seastar::input_stream<char>& source,
      upload_options opts = {}
  );
  seastar::future<> upload_from_stream_with_id(
      object_id id, std::string filename, seastar::input_stream<char>& source,
      upload_options opts = {}
  );

  // Fail with file_not_found_error if there's no such file.
  seastar::future<download_stream> open_download_stream(object_id id);

  // 'revision' counts from the oldest upload of 'filename' when positive,
  // 0 being the first; and from the newest when negative, -1 being the
  // latest.
  seastar::future<download_stream> open_download_stream_by_name(
      std::string filename, int32_t revision = -1
  );

  // Copy a file to 'dest' and flush it; returns the number of bytes written.
  seastar::future<uint64_t> download_to_stream(
      object_id id, seastar::output_stream<char>& dest
  );

  // Query the file entries only; chunks are not read.
  seastar::future<files_cursor> find(
      store::document filter, find_options opts = {}
  );

  // Remove the file entry, then its chunks.
  seastar::future<> delete_file(object_id id);

  seastar::future<> rename(object_id id, std::string new_filename);

  // Drop both collections. Dropping an empty bucket is fine.
  seastar::future<> drop();

 private:
  seastar::future<store::collection_ptr> collection(const std::string& name);

  store::write_options write_opts() const;
  store::query_options read_opts() const;

  seastar::future<upload_stream> make_upload(
      object_id id, std::string filename, upload_options opts,
      bool check_existing
  );
  seastar::future<object_id> drain(
      upload_stream stream, seastar::input_stream<char>& source
  );
  seastar::future<download_stream> make_download(file_entry entry);
};

}  // namespace gridfs
