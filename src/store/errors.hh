/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#pragma once

#include <fmt/format.h>

#include <stdexcept>
#include <string>

namespace gridfs {

namespace store {

// Base for every failure reported by a backing store.
class store_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// A write would have produced two documents with the same key on a unique
// index.
class duplicate_key_error : public store_error {
  std::string _index;

 public:
  duplicate_key_error(const std::string& collection, const std::string& index)
      : store_error(fmt::format(
            "duplicate key in collection '{}' for index '{}'", collection, index
        )),
        _index(index) {}

  const std::string& index() const { return _index; }
};

// A filter, sort, projection or stored document is not understood.
class document_format_error : public store_error {
 public:
  using store_error::store_error;
};

}  // namespace store

}  // namespace gridfs
