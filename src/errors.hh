/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#pragma once

#include <cstdint>
#include <exception>
#include <seastar/core/future.hh>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include "object_id.hh"

namespace gridfs {

class gridfs_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// No file entry matches the requested id or filename.
class file_not_found_error : public gridfs_error {
  std::string _target;

 public:
  explicit file_not_found_error(const object_id& id);
  file_not_found_error(const std::string& filename, int32_t revision);

  const std::string& target() const { return _target; }
};

// The chunks of a file don't add up to its file entry.
class corrupt_file_error : public gridfs_error {
  object_id _id;
  int64_t _chunk;

 public:
  corrupt_file_error(const object_id& id, int64_t chunk, const std::string& why);

  const object_id& id() const { return _id; }
  int64_t chunk() const { return _chunk; }
};

class invalid_argument_error : public gridfs_error {
 public:
  using gridfs_error::gridfs_error;
};

// An upload targets an id that already has a file entry.
class file_exists_error : public gridfs_error {
  object_id _id;

 public:
  explicit file_exists_error(const object_id& id);

  const object_id& id() const { return _id; }
};

class index_creation_error : public gridfs_error {
  std::string _collection;
  std::exception_ptr _cause;

 public:
  index_creation_error(const std::string& collection, std::exception_ptr cause);

  const std::string& collection() const { return _collection; }
  std::exception_ptr cause() const { return _cause; }
};

// A failure reported by the backing store, with what we were doing at the
// time.
class backing_store_error : public gridfs_error {
  std::string _op;
  std::string _collection;
  std::string _target;
  std::exception_ptr _cause;

 public:
  backing_store_error(
      const std::string& op, const std::string& collection,
      const std::string& target, std::exception_ptr cause
  );

  const std::string& op() const { return _op; }
  const std::string& collection() const { return _collection; }
  const std::string& target() const { return _target; }
  std::exception_ptr cause() const { return _cause; }
};

// Message of the exception held by 'ep'.
std::string describe(std::exception_ptr ep);

// Run 'func', reporting store failures as backing_store_error. Errors already
// in our taxonomy pass through untouched.
template <typename Func>
auto with_store_context(
    std::string op, std::string collection, std::string target, Func&& func
) {
  using futurator = seastar::futurize<std::invoke_result_t<Func>>;

  return futurator::invoke(std::forward<Func>(func))
      .handle_exception([op = std::move(op), collection = std::move(collection),
                         target = std::move(target)](std::exception_ptr ep) {
        try {
          std::rethrow_exception(ep);
        } catch (const gridfs_error&) {
          return futurator::make_exception_future(ep);
        } catch (...) {
          return futurator::make_exception_future(
              backing_store_error(op, collection, target, ep)
          );
        }
      });
}

}  // namespace gridfs
