/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#pragma once

#include <cstdint>
#include <map>
#include <seastar/core/future.hh>
#include <seastar/core/semaphore.hh>
#include <seastar/core/shared_future.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/core/sstring.hh>
#include <string>
#include <vector>

#include "store/local.hh"

// Directory-backed document store.
//
// Layout:
//   <root>/format                on-disk format version
//   <root>/<collection>/         one directory per collection
//   <root>/<collection>/<id>     one BSON document, named by its object id
//   <root>/<collection>/indexes  index models, JSON
//
// Documents are written to '<id>.<n>.tmp' and renamed into place, so a crash
// leaves either the old or the new version of a document. Writes to the same
// file are applied one at a time, in the order they were issued.

namespace gridfs {

namespace store {

constexpr uint32_t file_store_format_version = 1;

// A collection living in its own directory. Document headers are loaded at
// init; binary payloads are read back from disk only when a cursor yields
// the document.
class file_collection : public local_collection {
  seastar::sstring _path;
  std::map<seastar::sstring, seastar::lw_shared_ptr<seastar::semaphore>>
      _writers;

 public:
  file_collection(const std::string& name, const seastar::sstring& path)
      : local_collection(name), _path(path) {}

  // create the collection directory, or load documents and indexes from it.
  seastar::future<> init();

 protected:
  document header_of(const document& doc) const override;
  std::string key_of(const document& doc) const override;

  seastar::future<> persist(const std::string& key, document doc) override;
  seastar::future<document> load(const std::string& key) override;
  seastar::future<> erase(const std::string& key) override;
  seastar::future<> erase_all() override;
  seastar::future<> persist_indexes() override;

 private:
  seastar::sstring doc_path(const std::string& key) const;
  seastar::sstring indexes_path() const;

  seastar::future<> write_locked(
      seastar::sstring path, std::vector<uint8_t> bytes
  );

  seastar::future<> load_documents();
  seastar::future<> load_indexes();
};

class file_database : public database {
  const seastar::sstring _path;
  std::map<std::string, seastar::shared_future<collection_ptr>> _collections;

 public:
  explicit file_database(const seastar::sstring& path) : _path(path) {}

  file_database(file_database&) = delete;
  file_database(const file_database&) = delete;

  ~file_database() = default;

  const seastar::sstring& path() const { return _path; }

  seastar::future<collection_ptr> get_collection(
      const std::string& name
  ) override;
};

// Either open the store at 'path' or create it, returning its format version.
seastar::future<uint32_t> open_or_create(const seastar::sstring& path);

// Open or create the store at 'path' and return a database over it.
seastar::future<seastar::shared_ptr<file_database>> open_database(
    const seastar::sstring& path
);

}  // namespace store

}  // namespace gridfs
