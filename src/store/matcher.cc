/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#include "store/matcher.hh"

#include <fmt/format.h>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <string>

#include "store/errors.hh"

namespace gridfs {

namespace store {

namespace {

const document null_value;

int compare(const document* a, const document* b) {
  const document& lhs = a ? *a : null_value;
  const document& rhs = b ? *b : null_value;
  if (lhs == rhs) {
    return 0;
  }
  return lhs < rhs ? -1 : 1;
}

// Ordering operators only compare values of the same kind.
bool comparable(const document& a, const document& b) {
  if (a.is_number() && b.is_number()) {
    return true;
  }
  return a.type() == b.type();
}

bool equals(const document* value, const document& operand) {
  if (!value) {
    return operand.is_null();
  }
  if (value->is_array() && !operand.is_array()) {
    for (const auto& elem : *value) {
      if (elem == operand) {
        return true;
      }
    }
    return false;
  }
  return *value == operand;
}

bool is_operator_doc(const document& cond) {
  return cond.is_object() && !cond.empty() && !cond.begin().key().empty() &&
         cond.begin().key()[0] == '$';
}

const document& expect_array(const std::string& op, const document& arg) {
  if (!arg.is_array()) {
    throw document_format_error(fmt::format("{} expects an array", op));
  }
  return arg;
}

bool eval_operator(
    const document* value, const std::string& op, const document& arg
) {
  if (op == "$eq") {
    return equals(value, arg);
  } else if (op == "$ne") {
    return !equals(value, arg);
  } else if (op == "$gt" || op == "$gte" || op == "$lt" || op == "$lte") {
    if (!value || !comparable(*value, arg)) {
      return false;
    }
    int c = compare(value, &arg);
    if (op == "$gt") {
      return c > 0;
    } else if (op == "$gte") {
      return c >= 0;
    } else if (op == "$lt") {
      return c < 0;
    }
    return c <= 0;
  } else if (op == "$in") {
    for (const auto& candidate : expect_array(op, arg)) {
      if (equals(value, candidate)) {
        return true;
      }
    }
    return false;
  } else if (op == "$nin") {
    for (const auto& candidate : expect_array(op, arg)) {
      if (equals(value, candidate)) {
        return false;
      }
    }
    return true;
  } else if (op == "$exists") {
    if (!arg.is_boolean()) {
      throw document_format_error("$exists expects a boolean");
    }
    return arg.get<bool>() == (value != nullptr);
  }
  throw document_format_error(fmt::format("unknown operator '{}'", op));
}

}  // namespace

const document* lookup(const document& doc, std::string_view path) {
  std::vector<std::string> parts;
  boost::split(parts, std::string(path), boost::is_any_of("."));

  const document* cur = &doc;
  for (const auto& part : parts) {
    if (!cur->is_object()) {
      return nullptr;
    }
    auto it = cur->find(part);
    if (it == cur->end()) {
      return nullptr;
    }
    cur = &(*it);
  }
  return cur;
}

bool matches(const document& doc, const document& filter) {
  if (!filter.is_object()) {
    throw document_format_error("filter must be a document");
  }

  for (const auto& [key, cond] : filter.items()) {
    if (key == "$and" || key == "$or") {
      bool is_and = (key == "$and");
      bool any = false;
      for (const auto& sub : expect_array(key, cond)) {
        bool m = matches(doc, sub);
        if (is_and && !m) {
          return false;
        }
        any = any || m;
      }
      if (!is_and && !any) {
        return false;
      }
      continue;
    } else if (!key.empty() && key[0] == '$') {
      throw document_format_error(
          fmt::format("unknown top-level operator '{}'", key)
      );
    }

    const document* value = lookup(doc, key);
    if (is_operator_doc(cond)) {
      for (const auto& [op, arg] : cond.items()) {
        if (!eval_operator(value, op, arg)) {
          return false;
        }
      }
    } else if (!equals(value, cond)) {
      return false;
    }
  }
  return true;
}

void check_filter(const document& filter) {
  if (!filter.is_object()) {
    throw document_format_error("filter must be a document");
  }
  for (const auto& [key, cond] : filter.items()) {
    if (key == "$and" || key == "$or") {
      for (const auto& sub : expect_array(key, cond)) {
        check_filter(sub);
      }
      continue;
    } else if (!key.empty() && key[0] == '$') {
      throw document_format_error(
          fmt::format("unknown top-level operator '{}'", key)
      );
    }
    if (!is_operator_doc(cond)) {
      continue;
    }
    for (const auto& [op, arg] : cond.items()) {
      if (op == "$in" || op == "$nin") {
        expect_array(op, arg);
      } else if (op == "$exists") {
        if (!arg.is_boolean()) {
          throw document_format_error("$exists expects a boolean");
        }
      } else if (op != "$eq" && op != "$ne" && op != "$gt" && op != "$gte" &&
                 op != "$lt" && op != "$lte") {
        throw document_format_error(fmt::format("unknown operator '{}'", op));
      }
    }
  }
}

void check_sort(const document& sort) {
  if (!sort.is_object()) {
    throw document_format_error("sort must be a document");
  }
  for (const auto& [field, dir] : sort.items()) {
    if (!dir.is_number() || (dir != 1 && dir != -1)) {
      throw document_format_error(
          fmt::format("sort direction for '{}' must be 1 or -1", field)
      );
    }
  }
}

bool sort_less(const document& a, const document& b, const document& sort) {
  for (const auto& [field, dir] : sort.items()) {
    int c = compare(lookup(a, field), lookup(b, field));
    if (c == 0) {
      continue;
    }
    return dir == 1 ? c < 0 : c > 0;
  }
  return false;
}

document project(const document& doc, const document& projection) {
  if (!projection.is_object()) {
    throw document_format_error("projection must be a document");
  }

  document res = document::object();
  auto id = doc.find("_id");
  if (id != doc.end()) {
    res["_id"] = *id;
  }
  for (const auto& [field, include] : projection.items()) {
    bool on = include.is_boolean() ? include.get<bool>()
                                   : (include.is_number() && include != 0);
    if (field == "_id") {
      if (!on) {
        res.erase("_id");
      }
      continue;
    }
    if (!on) {
      throw document_format_error("only inclusion projections are supported");
    }
    auto it = doc.find(field);
    if (it != doc.end()) {
      res[field] = *it;
    }
  }
  return res;
}

document index_key(const document& doc, const document& keys) {
  document res = document::array();
  for (const auto& [field, dir] : keys.items()) {
    const document* value = lookup(doc, field);
    res.push_back(value ? *value : null_value);
  }
  return res;
}

}  // namespace store

}  // namespace gridfs
