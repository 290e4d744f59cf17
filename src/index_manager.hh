/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#pragma once

#include <seastar/core/future.hh>
#include <vector>

#include "store/collection.hh"

namespace gridfs {

// The unique {files_id: 1, n: 1} index on chunks and the
// {filename: 1, uploadDate: 1} index on file entries.
store::index_model chunks_index();
store::index_model files_index();

// Ensures a bucket's indexes exist. Indexes are recognized by their key
// specification, whatever their name, so running this again is a no-op.
class index_manager {
  store::collection_ptr _files;
  store::collection_ptr _chunks;

 public:
  index_manager(store::collection_ptr files, store::collection_ptr chunks)
      : _files(std::move(files)), _chunks(std::move(chunks)) {}

  // Fails with index_creation_error naming the collection at fault.
  seastar::future<> ensure_indexes();

 private:
  static seastar::future<> ensure_index(
      store::collection_ptr coll, store::index_model model
  );
};

// Whether 'existing' covers the keys of 'wanted', in the same order and
// direction.
bool same_keys(
    const store::index_model& existing, const store::index_model& wanted
);

}  // namespace gridfs
