/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#pragma once

#include <string_view>
#include <vector>

#include "store/document.hh"

// Filter, sort and projection evaluation for the bundled stores.
//
// Understood filter subset:
//   {field: value}                     equality, dotted paths allowed
//   {field: {$eq|$ne|$gt|$gte|$lt|$lte: value}}
//   {field: {$in|$nin: [values]}}
//   {field: {$exists: bool}}
//   {$and: [filters]}, {$or: [filters]}
// An equality against an array field matches when any element is equal.
// Anything else throws document_format_error.

namespace gridfs {

namespace store {

// Returns the value at a dotted path, or nullptr if any step is missing.
const document* lookup(const document& doc, std::string_view path);

bool matches(const document& doc, const document& filter);

// Validates a filter against the subset above without evaluating it, throws
// document_format_error.
void check_filter(const document& filter);

// Validates a sort specification, throws document_format_error.
void check_sort(const document& sort);

// Strict weak ordering of two documents according to 'sort'. Missing fields
// order before present ones.
bool sort_less(const document& a, const document& b, const document& sort);

// Keeps '_id' plus the fields named in 'projection'.
document project(const document& doc, const document& projection);

// Values of the index key fields of 'doc', missing fields as null.
document index_key(const document& doc, const document& keys);

}  // namespace store

}  // namespace gridfs
