/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#include "schema.hh"

#include <fmt/format.h>

#include <limits>
#include <seastar/core/deleter.hh>
#include <utility>

#include "errors.hh"
#include "store/errors.hh"

namespace gridfs {

namespace {

object_id parse_id(const store::document& doc, const char* key) {
  auto it = doc.find(key);
  if (it == doc.end() || !it->is_string() ||
      !object_id::is_valid(it->get_ref<const std::string&>())) {
    throw store::document_format_error(
        fmt::format("document has no valid object id at '{}'", key)
    );
  }
  return object_id::from_hex(it->get_ref<const std::string&>());
}

template <typename T>
T integer_field(
    const store::document& doc, const char* key, const object_id& id,
    int64_t chunk
) {
  auto it = doc.find(key);
  if (it == doc.end() || !it->is_number_integer()) {
    throw corrupt_file_error(
        id, chunk, fmt::format("'{}' is missing or not an integer", key)
    );
  }
  int64_t value;
  if (it->is_number_unsigned()) {
    auto u = it->get<uint64_t>();
    if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      throw corrupt_file_error(
          id, chunk, fmt::format("'{}' is out of range: {}", key, u)
      );
    }
    value = static_cast<int64_t>(u);
  } else {
    value = it->get<int64_t>();
  }
  if (value < std::numeric_limits<T>::min() ||
      value > std::numeric_limits<T>::max()) {
    throw corrupt_file_error(
        id, chunk, fmt::format("'{}' is out of range: {}", key, value)
    );
  }
  return static_cast<T>(value);
}

}  // namespace

store::document file_entry::to_document() const {
  store::document doc{
      {fields::id, id.to_hex()},
      {fields::length, length},
      {fields::chunk_size, chunk_size},
      {fields::upload_date, upload_date.time_since_epoch().count()},
      {fields::filename, filename},
  };
  if (metadata) {
    doc[fields::metadata] = *metadata;
  }
  if (md5) {
    doc[fields::md5] = *md5;
  }
  return doc;
}

file_entry file_entry::from_document(const store::document& doc) {
  file_entry entry;
  entry.id = parse_id(doc, fields::id);
  entry.length = integer_field<int64_t>(doc, fields::length, entry.id, -1);
  entry.chunk_size =
      integer_field<int32_t>(doc, fields::chunk_size, entry.id, -1);
  entry.upload_date = upload_time(std::chrono::milliseconds(
      integer_field<int64_t>(doc, fields::upload_date, entry.id, -1)
  ));

  if (entry.length < 0 || entry.chunk_size <= 0) {
    throw corrupt_file_error(
        entry.id, -1,
        fmt::format(
            "invalid length {} or chunk size {}", entry.length,
            entry.chunk_size
        )
    );
  }

  auto fname = doc.find(fields::filename);
  if (fname != doc.end() && fname->is_string()) {
    entry.filename = fname->get<std::string>();
  }
  auto meta = doc.find(fields::metadata);
  if (meta != doc.end() && meta->is_object()) {
    entry.metadata = *meta;
  }
  auto md5 = doc.find(fields::md5);
  if (md5 != doc.end() && md5->is_string()) {
    entry.md5 = md5->get<std::string>();
  }
  return entry;
}

int64_t file_entry::chunk_count() const {
  if (length == 0) {
    return 0;
  }
  return length / chunk_size + (length % chunk_size != 0);
}

int64_t file_entry::expected_chunk_length(int64_t n) const {
  if (n + 1 < chunk_count()) {
    return chunk_size;
  }
  return length - (chunk_count() - 1) * chunk_size;
}

store::document chunk_record::to_document() && {
  return store::document{
      {fields::id, id.to_hex()},
      {fields::files_id, files_id.to_hex()},
      {fields::n, n},
      {fields::data, store::make_binary(std::move(data))},
  };
}

chunk_record chunk_record::from_document(
    store::document&& doc, const object_id& owner
) {
  chunk_record chunk;
  chunk.n = integer_field<int32_t>(doc, fields::n, owner, -1);
  try {
    chunk.id = parse_id(doc, fields::id);
    chunk.files_id = parse_id(doc, fields::files_id);
  } catch (const store::document_format_error& e) {
    throw corrupt_file_error(owner, chunk.n, e.what());
  }

  auto it = doc.find(fields::data);
  if (it == doc.end() || !it->is_binary()) {
    throw corrupt_file_error(owner, chunk.n, "chunk has no binary data");
  }
  chunk.data = std::move(static_cast<std::vector<uint8_t>&>(it->get_binary()));
  return chunk;
}

seastar::temporary_buffer<char> chunk_record::release_data() && {
  auto bytes = std::move(data);
  auto ptr = reinterpret_cast<char*>(bytes.data());
  auto len = bytes.size();
  return seastar::temporary_buffer<char>(
      ptr, len, seastar::make_object_deleter(std::move(bytes))
  );
}

}  // namespace gridfs
