/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#pragma once

#include <map>
#include <seastar/core/future.hh>
#include <seastar/core/shared_ptr.hh>
#include <string>

#include "store/local.hh"

namespace gridfs {

namespace store {

// Keeps whole documents in memory. Every write yields to the reactor once,
// so concurrent streams interleave the way they would against a remote
// store.
class memory_collection : public local_collection {
 public:
  explicit memory_collection(const std::string& name)
      : local_collection(name) {}

 protected:
  seastar::future<> persist(const std::string& key, document doc) override;
  seastar::future<document> load(const std::string& key) override;
  seastar::future<> erase(const std::string& key) override;
  seastar::future<> erase_all() override;
  seastar::future<> persist_indexes() override;
};

class memory_database : public database {
  std::map<std::string, seastar::shared_ptr<memory_collection>> _collections;

 public:
  memory_database() = default;
  memory_database(memory_database&) = delete;
  memory_database(const memory_database&) = delete;

  seastar::future<collection_ptr> get_collection(
      const std::string& name
  ) override;
};

}  // namespace store

}  // namespace gridfs
