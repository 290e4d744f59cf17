/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#include "index_manager.hh"

#include <seastar/core/coroutine.hh>
#include <seastar/util/log.hh>

#include "errors.hh"
#include "schema.hh"

static seastar::logger applog(__FILE__);

namespace gridfs {

store::index_model chunks_index() {
  return store::index_model{
      "files_id_1_n_1",
      store::document{{fields::files_id, 1}, {fields::n, 1}},
      true,
  };
}

store::index_model files_index() {
  return store::index_model{
      "filename_1_uploadDate_1",
      store::document{{fields::filename, 1}, {fields::upload_date, 1}},
      false,
  };
}

bool same_keys(
    const store::index_model& existing, const store::index_model& wanted
) {
  return existing.keys == wanted.keys;
}

seastar::future<> index_manager::ensure_indexes() {
  co_await ensure_index(_chunks, chunks_index());
  co_await ensure_index(_files, files_index());
}

seastar::future<> index_manager::ensure_index(
    store::collection_ptr coll, store::index_model model
) {
  try {
    auto existing = co_await coll->list_indexes();
    for (const auto& idx : existing) {
      if (same_keys(idx, model)) {
        applog.debug(
            "index '{}' on '{}' covers '{}'", idx.name, coll->name(),
            model.name
        );
        co_return;
      }
    }
    applog.info("create index '{}' on '{}'", model.name, coll->name());
    co_await coll->create_index(model);
  } catch (...) {
    auto ep = std::current_exception();
    applog.error(
        "unable to create index '{}' on '{}': {}", model.name, coll->name(), ep
    );
    throw index_creation_error(coll->name(), ep);
  }
}

}  // namespace gridfs
