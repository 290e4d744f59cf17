/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#include "store/collection.hh"

#include <seastar/core/coroutine.hh>

namespace gridfs {

namespace store {

seastar::future<std::optional<document>> collection::find_one(
    const document& filter, const query_options& opts
) {
  query_options one = opts;
  one.limit = 1;
  auto c = co_await find(filter, one);
  co_return co_await c->next();
}

}  // namespace store

}  // namespace gridfs
