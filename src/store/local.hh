/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#pragma once

#include <cstdint>
#include <map>
#include <seastar/core/future.hh>
#include <seastar/core/shared_ptr.hh>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "store/collection.hh"

namespace gridfs {

namespace store {

// Query engine shared by the bundled stores.
//
// Keeps a catalog of document headers in insertion order and evaluates
// filters, sorts and unique indexes against it. How documents are persisted,
// and what part of a document a header keeps, is up to the subclass.
class local_collection
    : public collection,
      public seastar::enable_shared_from_this<local_collection> {
  struct slot {
    std::string key;
    document header;
    // header lacks fields of the stored document
    bool partial = false;
    // reserved by a write that has not been acknowledged yet
    bool pending = false;
    // bumped by every update of the header
    uint64_t version = 0;
  };

  struct index_state {
    index_model model;
    // serialized key values, unique indexes only
    std::set<std::string> values;
  };

  const std::string _name;
  uint64_t _next_seq = 0;
  std::map<uint64_t, slot> _docs;
  std::unordered_map<std::string, uint64_t> _by_key;
  std::vector<index_state> _indexes;

  friend class local_cursor;

 public:
  explicit local_collection(const std::string& name) : _name(name) {}

  local_collection(local_collection&) = delete;
  local_collection(const local_collection&) = delete;

  virtual ~local_collection() = default;

  const std::string& name() const override { return _name; }

  seastar::future<> insert_one(
      document doc, const write_options& opts
  ) override;
  seastar::future<uint64_t> update_one(
      const document& filter, const document& fields, const write_options& opts
  ) override;
  seastar::future<uint64_t> delete_one(
      const document& filter, const write_options& opts
  ) override;
  seastar::future<uint64_t> delete_many(
      const document& filter, const write_options& opts
  ) override;
  seastar::future<cursor_ptr> find(
      const document& filter, const query_options& opts
  ) override;
  seastar::future<> create_index(const index_model& model) override;
  seastar::future<std::vector<index_model>> list_indexes() override;
  seastar::future<> drop() override;

  size_t size() const { return _docs.size(); }
  bool contains(const std::string& key) const { return _by_key.contains(key); }

 protected:
  // Part of 'doc' kept in memory and used to evaluate queries.
  virtual document header_of(const document& doc) const { return doc; }

  // Write 'doc' under 'key', replacing any previous version.
  virtual seastar::future<> persist(const std::string& key, document doc) = 0;
  // Obtain the full document for a partial catalog entry.
  virtual seastar::future<document> load(const std::string& key) = 0;
  virtual seastar::future<> erase(const std::string& key) = 0;
  virtual seastar::future<> erase_all() = 0;
  virtual seastar::future<> persist_indexes() = 0;

  // Catalog maintenance for subclasses restoring persisted state.
  virtual std::string key_of(const document& doc) const;
  void restore(const std::string& key, document header, bool partial);
  void restore_index(index_model model);
  std::vector<index_model> index_models() const;

 private:
  std::vector<uint64_t> matching(const document& filter, bool first_only);
  void add_index_keys(const document& header);
  void remove_index_keys(const document& header);
  void check_unique(const document& header) const;
  void remove_slot(uint64_t seq);
};

}  // namespace store

}  // namespace gridfs
