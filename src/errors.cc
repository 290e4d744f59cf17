/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#include "errors.hh"

#include <fmt/format.h>

namespace gridfs {

file_not_found_error::file_not_found_error(const object_id& id)
    : gridfs_error(fmt::format("file '{}' not found", id)),
      _target(id.to_hex()) {}

file_not_found_error::file_not_found_error(
    const std::string& filename, int32_t revision
)
    : gridfs_error(fmt::format(
          "file with name '{}' and revision {} not found", filename, revision
      )),
      _target(filename) {}

corrupt_file_error::corrupt_file_error(
    const object_id& id, int64_t chunk, const std::string& why
)
    : gridfs_error(
          fmt::format("file '{}' is corrupt at chunk {}: {}", id, chunk, why)
      ),
      _id(id),
      _chunk(chunk) {}

file_exists_error::file_exists_error(const object_id& id)
    : gridfs_error(fmt::format("file '{}' already exists", id)), _id(id) {}

index_creation_error::index_creation_error(
    const std::string& collection, std::exception_ptr cause
)
    : gridfs_error(fmt::format(
          "unable to create indexes on '{}': {}", collection, describe(cause)
      )),
      _collection(collection),
      _cause(cause) {}

backing_store_error::backing_store_error(
    const std::string& op, const std::string& collection,
    const std::string& target, std::exception_ptr cause
)
    : gridfs_error(fmt::format(
          "{} on '{}' failed for '{}': {}", op, collection, target,
          describe(cause)
      )),
      _op(op),
      _collection(collection),
      _target(target),
      _cause(cause) {}

std::string describe(std::exception_ptr ep) {
  if (!ep) {
    return "no error";
  }
  try {
    std::rethrow_exception(ep);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "unknown exception";
  }
}

}  // namespace gridfs
