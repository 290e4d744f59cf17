/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#include "store/memory.hh"

#include <fmt/format.h>

#include <seastar/core/later.hh>
#include <seastar/util/log.hh>

#include "store/errors.hh"

static seastar::logger applog(__FILE__);

namespace gridfs {

namespace store {

seastar::future<> memory_collection::persist(
    const std::string& key, document doc
) {
  // the catalog already holds the whole document.
  return seastar::yield();
}

seastar::future<document> memory_collection::load(const std::string& key) {
  return seastar::make_exception_future<document>(store_error(
      fmt::format("document '{}' of '{}' is held in memory", key, name())
  ));
}

seastar::future<> memory_collection::erase(const std::string& key) {
  return seastar::yield();
}

seastar::future<> memory_collection::erase_all() {
  return seastar::make_ready_future<>();
}

seastar::future<> memory_collection::persist_indexes() {
  return seastar::make_ready_future<>();
}

seastar::future<collection_ptr> memory_database::get_collection(
    const std::string& name
) {
  auto it = _collections.find(name);
  if (it == _collections.end()) {
    applog.debug("create in-memory collection '{}'", name);
    it = _collections
             .emplace(name, seastar::make_shared<memory_collection>(name))
             .first;
  }
  return seastar::make_ready_future<collection_ptr>(it->second);
}

}  // namespace store

}  // namespace gridfs
