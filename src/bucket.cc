/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#include "bucket.hh"

#include <fmt/format.h>

#include <exception>
#include <seastar/core/coroutine.hh>
#include <seastar/util/log.hh>
#include <utility>

#include "errors.hh"
#include "index_manager.hh"
#include "store/errors.hh"
#include "store/matcher.hh"

static seastar::logger applog(__FILE__);

namespace gridfs {

seastar::future<std::optional<file_entry>> files_cursor::next() {
  auto doc = co_await with_store_context(
      "read file entry", _files_name, "cursor",
      [this] { return _cursor->next(); }
  );
  if (!doc) {
    co_return std::nullopt;
  }
  co_return file_entry::from_document(*doc);
}

bucket::bucket(store::database_ptr db, bucket_options opts)
    : _db(std::move(db)),
      _opts(std::move(opts)),
      _stats(seastar::make_lw_shared<stats::bucket_stats>()) {
  _opts.validate();
}

std::string bucket::files_collection_name() const {
  return fmt::format("{}.files", _opts.bucket_name);
}

std::string bucket::chunks_collection_name() const {
  return fmt::format("{}.chunks", _opts.bucket_name);
}

store::write_options bucket::write_opts() const {
  return store::write_options{_opts.write_concern};
}

store::query_options bucket::read_opts() const {
  store::query_options opts;
  opts.concern = _opts.read_concern;
  opts.preference = _opts.read_preference;
  return opts;
}

seastar::future<store::collection_ptr> bucket::collection(
    const std::string& name
) {
  return with_store_context("open collection", name, name, [this, name] {
    return _db->get_collection(name);
  });
}

seastar::future<> bucket::ensure_indexes() {
  auto files = co_await collection(files_collection_name());
  auto chunks = co_await collection(chunks_collection_name());
  co_await index_manager(files, chunks).ensure_indexes();
}

seastar::future<upload_stream> bucket::make_upload(
    object_id id, std::string filename, upload_options opts,
    bool check_existing
) {
  opts.validate();
  co_await ensure_indexes();

  auto files = co_await collection(files_collection_name());
  auto chunks = co_await collection(chunks_collection_name());

  if (check_existing) {
    store::document filter{{fields::id, id.to_hex()}};
    auto qopts = read_opts();
    auto existing = co_await with_store_context(
        "find file entry", files->name(), id.to_hex(),
        [&files, &filter, &qopts] { return files->find_one(filter, qopts); }
    );
    if (existing) {
      applog.warn("refuse to upload over existing file '{}'", id);
      throw file_exists_error(id);
    }
  }

  auto chunk_size = opts.chunk_size_bytes.value_or(_opts.chunk_size_bytes);
  applog.info("upload '{}' as '{}'", filename, id);
  co_return upload_stream(
      id, std::move(filename), chunk_size, std::move(opts), std::move(files),
      std::move(chunks), write_opts(), !_opts.disable_md5, _stats
  );
}

seastar::future<upload_stream> bucket::open_upload_stream(
    std::string filename, upload_options opts
) {
  return make_upload(
      object_id::generate(), std::move(filename), std::move(opts), false
  );
}

seastar::future<upload_stream> bucket::open_upload_stream_with_id(
    object_id id, std::string filename, upload_options opts
) {
  return make_upload(id, std::move(filename), std::move(opts), true);
}

seastar::future<object_id> bucket::drain(
    upload_stream stream, seastar::input_stream<char>& source
) {
  std::exception_ptr ep;
  try {
    while (true) {
      auto buf = co_await source.read();
      if (buf.empty()) {
        break;
      }
      co_await stream.write(std::move(buf));
    }
  } catch (...) {
    ep = std::current_exception();
  }
  if (ep) {
    co_await stream.abort();
    std::rethrow_exception(ep);
  }

  auto entry = co_await stream.close();
  co_return entry.id;
}

seastar::future<object_id> bucket::upload_from_stream(
    std::string filename, seastar::input_stream<char>& source,
    upload_options opts
) {
  auto stream =
      co_await open_upload_stream(std::move(filename), std::move(opts));
  co_return co_await drain(std::move(stream), source);
}

seastar::future<> bucket::upload_from_stream_with_id(
    object_id id, std::string filename, seastar::input_stream<char>& source,
    upload_options opts
) {
  auto stream = co_await open_upload_stream_with_id(
      id, std::move(filename), std::move(opts)
  );
  co_await drain(std::move(stream), source);
}

seastar::future<download_stream> bucket::make_download(file_entry entry) {
  auto chunks = co_await collection(chunks_collection_name());
  store::document filter{{fields::files_id, entry.id.to_hex()}};
  auto qopts = read_opts();
  qopts.sort = store::document{{fields::n, 1}};

  auto cursor = co_await with_store_context(
      "find chunks", chunks->name(), entry.id.to_hex(),
      [&chunks, &filter, &qopts] { return chunks->find(filter, qopts); }
  );
  co_return download_stream(
      std::move(entry), std::move(cursor), chunks->name(), _stats
  );
}

seastar::future<download_stream> bucket::open_download_stream(object_id id) {
  auto files = co_await collection(files_collection_name());
  store::document filter{{fields::id, id.to_hex()}};
  auto qopts = read_opts();

  auto doc = co_await with_store_context(
      "find file entry", files->name(), id.to_hex(),
      [&files, &filter, &qopts] { return files->find_one(filter, qopts); }
  );
  if (!doc) {
    applog.debug("no file entry for '{}'", id);
    throw file_not_found_error(id);
  }
  co_return co_await make_download(file_entry::from_document(*doc));
}

seastar::future<download_stream> bucket::open_download_stream_by_name(
    std::string filename, int32_t revision
) {
  auto files = co_await collection(files_collection_name());
  store::document filter{{fields::filename, filename}};
  auto qopts = read_opts();
  // ids break ties between uploads finished within the same millisecond
  int dir = revision >= 0 ? 1 : -1;
  qopts.sort = store::document{{fields::upload_date, dir}, {fields::id, dir}};
  if (revision >= 0) {
    qopts.skip = revision;
  } else {
    qopts.skip = -static_cast<int64_t>(revision) - 1;
  }

  auto doc = co_await with_store_context(
      "find file entry", files->name(), filename,
      [&files, &filter, &qopts] { return files->find_one(filter, qopts); }
  );
  if (!doc) {
    applog.debug("no revision {} of '{}'", revision, filename);
    throw file_not_found_error(filename, revision);
  }
  co_return co_await make_download(file_entry::from_document(*doc));
}

seastar::future<uint64_t> bucket::download_to_stream(
    object_id id, seastar::output_stream<char>& dest
) {
  auto stream = co_await open_download_stream(id);
  uint64_t written = 0;
  while (auto buf = co_await stream.next()) {
    written += buf->size();
    co_await dest.write(std::move(*buf));
  }
  co_await dest.flush();
  applog.debug("copied {} bytes of '{}' to stream", written, id);
  co_return written;
}

seastar::future<files_cursor> bucket::find(
    store::document filter, find_options opts
) {
  try {
    store::check_filter(filter);
  } catch (const store::document_format_error& e) {
    throw invalid_argument_error(fmt::format("invalid filter: {}", e.what()));
  }
  opts.validate();
  _stats->find();

  store::query_options qopts = read_opts();
  qopts.sort = opts.sort;
  qopts.skip = opts.skip;
  if (opts.limit) {
    qopts.limit = *opts.limit;
  }
  if (opts.batch_size) {
    qopts.batch_size = static_cast<uint32_t>(*opts.batch_size);
  }
  qopts.max_time = opts.max_time;
  qopts.no_cursor_timeout = opts.no_cursor_timeout;
  qopts.allow_disk_use = opts.allow_disk_use;

  auto files = co_await collection(files_collection_name());
  auto cursor = co_await with_store_context(
      "find file entries", files->name(), filter.dump(),
      [&files, &filter, &qopts] { return files->find(filter, qopts); }
  );
  co_return files_cursor(std::move(cursor), files->name());
}

seastar::future<> bucket::delete_file(object_id id) {
  auto files = co_await collection(files_collection_name());
  auto chunks = co_await collection(chunks_collection_name());
  auto wopts = write_opts();

  store::document entry_filter{{fields::id, id.to_hex()}};
  auto deleted = co_await with_store_context(
      "delete file entry", files->name(), id.to_hex(),
      [&files, &entry_filter, &wopts] {
        return files->delete_one(entry_filter, wopts);
      }
  );
  if (deleted == 0) {
    applog.debug("no file entry to delete for '{}'", id);
    throw file_not_found_error(id);
  }

  // the file is gone for readers; now drop its chunks.
  store::document chunks_filter{{fields::files_id, id.to_hex()}};
  auto removed = co_await with_store_context(
      "delete chunks", chunks->name(), id.to_hex(),
      [&chunks, &chunks_filter, &wopts] {
        return chunks->delete_many(chunks_filter, wopts);
      }
  );
  _stats->remove();
  applog.info("deleted file '{}' and {} chunks", id, removed);
}

seastar::future<> bucket::rename(object_id id, std::string new_filename) {
  auto files = co_await collection(files_collection_name());
  store::document filter{{fields::id, id.to_hex()}};
  store::document update{{fields::filename, new_filename}};
  auto wopts = write_opts();

  auto matched = co_await with_store_context(
      "rename file entry", files->name(), id.to_hex(),
      [&files, &filter, &update, &wopts] {
        return files->update_one(filter, update, wopts);
      }
  );
  if (matched == 0) {
    throw file_not_found_error(id);
  }
  _stats->rename();
  applog.info("renamed file '{}' to '{}'", id, new_filename);
}

seastar::future<> bucket::drop() {
  auto files = co_await collection(files_collection_name());
  auto chunks = co_await collection(chunks_collection_name());

  co_await with_store_context(
      "drop", files->name(), _opts.bucket_name,
      [&files] { return files->drop(); }
  );
  co_await with_store_context(
      "drop", chunks->name(), _opts.bucket_name,
      [&chunks] { return chunks->drop(); }
  );
  _stats->drop();
  applog.info("dropped bucket '{}'", _opts.bucket_name);
}

}  // namespace gridfs
