/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#include "store/local.hh"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <seastar/core/coroutine.hh>
#include <seastar/util/log.hh>
#include <utility>

#include "object_id.hh"
#include "store/errors.hh"
#include "store/matcher.hh"

static seastar::logger applog(__FILE__);

namespace gridfs {

namespace store {

// Walks a snapshot of catalog sequence numbers. Documents removed after the
// snapshot was taken are skipped.
class local_cursor : public cursor {
  using clock_type = std::chrono::steady_clock;

  seastar::shared_ptr<local_collection> _owner;
  std::vector<uint64_t> _seqs;
  size_t _pos = 0;
  std::optional<document> _projection;
  std::optional<clock_type::time_point> _deadline;

 public:
  local_cursor(
      seastar::shared_ptr<local_collection> owner, std::vector<uint64_t> seqs,
      const query_options& opts
  )
      : _owner(std::move(owner)),
        _seqs(std::move(seqs)),
        _projection(opts.projection) {
    if (opts.max_time && opts.max_time->count() > 0) {
      _deadline = clock_type::now() + *opts.max_time;
    }
  }

  seastar::future<std::optional<document>> next() override {
    while (_pos < _seqs.size()) {
      if (_deadline && clock_type::now() > *_deadline) {
        throw store_error(fmt::format(
            "query on '{}' exceeded its time limit", _owner->name()
        ));
      }

      auto seq = _seqs[_pos++];
      auto it = _owner->_docs.find(seq);
      if (it == _owner->_docs.end()) {
        continue;
      }

      document doc;
      if (it->second.partial) {
        auto key = it->second.key;
        doc = co_await _owner->load(key);
      } else {
        doc = it->second.header;
      }

      if (_projection) {
        co_return project(doc, *_projection);
      }
      co_return doc;
    }
    co_return std::nullopt;
  }
};

std::string local_collection::key_of(const document& doc) const {
  auto it = doc.find("_id");
  if (it == doc.end()) {
    throw document_format_error("document has no '_id'");
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  return it->dump();
}

std::vector<uint64_t> local_collection::matching(
    const document& filter, bool first_only
) {
  std::vector<uint64_t> res;
  for (const auto& [seq, s] : _docs) {
    if (s.pending || !matches(s.header, filter)) {
      continue;
    }
    res.push_back(seq);
    if (first_only) {
      break;
    }
  }
  return res;
}

void local_collection::check_unique(const document& header) const {
  for (const auto& idx : _indexes) {
    if (!idx.model.unique) {
      continue;
    }
    if (idx.values.contains(index_key(header, idx.model.keys).dump())) {
      throw duplicate_key_error(_name, idx.model.name);
    }
  }
}

void local_collection::add_index_keys(const document& header) {
  for (auto& idx : _indexes) {
    if (idx.model.unique) {
      idx.values.insert(index_key(header, idx.model.keys).dump());
    }
  }
}

void local_collection::remove_index_keys(const document& header) {
  for (auto& idx : _indexes) {
    if (idx.model.unique) {
      idx.values.erase(index_key(header, idx.model.keys).dump());
    }
  }
}

void local_collection::remove_slot(uint64_t seq) {
  auto it = _docs.find(seq);
  if (it == _docs.end()) {
    return;
  }
  remove_index_keys(it->second.header);
  _by_key.erase(it->second.key);
  _docs.erase(it);
}

void local_collection::restore(
    const std::string& key, document header, bool partial
) {
  auto seq = _next_seq++;
  _by_key[key] = seq;
  _docs.emplace(seq, slot{key, std::move(header), partial, false});
}

void local_collection::restore_index(index_model model) {
  index_state st{std::move(model), {}};
  if (st.model.unique) {
    for (const auto& [seq, s] : _docs) {
      st.values.insert(index_key(s.header, st.model.keys).dump());
    }
  }
  _indexes.push_back(std::move(st));
}

std::vector<index_model> local_collection::index_models() const {
  std::vector<index_model> res;
  for (const auto& idx : _indexes) {
    res.push_back(idx.model);
  }
  return res;
}

seastar::future<> local_collection::insert_one(
    document doc, const write_options& opts
) {
  if (!doc.is_object()) {
    throw document_format_error("only documents can be inserted");
  }
  if (!doc.contains("_id")) {
    doc["_id"] = object_id::generate().to_hex();
  }

  auto key = key_of(doc);
  if (_by_key.contains(key)) {
    throw duplicate_key_error(_name, "_id_");
  }
  auto header = header_of(doc);
  bool partial = header.size() != doc.size();
  check_unique(header);

  // reserve the key before suspending, so concurrent writers collide on it.
  auto seq = _next_seq++;
  add_index_keys(header);
  _by_key.emplace(key, seq);
  _docs.emplace(seq, slot{key, std::move(header), partial, true});

  try {
    co_await persist(key, std::move(doc));
  } catch (...) {
    applog.debug("insert of '{}' into '{}' failed, release key", key, _name);
    remove_slot(seq);
    throw;
  }

  auto it = _docs.find(seq);
  if (it != _docs.end()) {
    it->second.pending = false;
  }
}

seastar::future<uint64_t> local_collection::update_one(
    const document& filter, const document& fields, const write_options& opts
) {
  if (!fields.is_object()) {
    throw document_format_error("update fields must be a document");
  }
  if (fields.contains("_id")) {
    throw document_format_error("'_id' cannot be updated");
  }

  auto seqs = matching(filter, true);
  if (seqs.empty()) {
    co_return 0;
  }
  auto seq = seqs.front();
  auto key = _docs.at(seq).key;

  document doc;
  if (_docs.at(seq).partial) {
    doc = co_await load(key);
  } else {
    doc = _docs.at(seq).header;
  }

  auto it = _docs.find(seq);
  if (it == _docs.end()) {
    // removed while we were reading it
    co_return 0;
  }

  for (const auto& [field, value] : fields.items()) {
    doc[field] = value;
  }
  auto header = header_of(doc);

  remove_index_keys(it->second.header);
  try {
    check_unique(header);
  } catch (...) {
    add_index_keys(it->second.header);
    throw;
  }
  add_index_keys(header);
  document previous = std::exchange(it->second.header, std::move(header));
  auto version = ++it->second.version;

  try {
    co_await persist(key, std::move(doc));
  } catch (...) {
    // a later update owns the header now
    auto cur = _docs.find(seq);
    if (cur != _docs.end() && cur->second.version == version) {
      remove_index_keys(cur->second.header);
      cur->second.header = std::move(previous);
      add_index_keys(cur->second.header);
    }
    throw;
  }

  if (!_docs.contains(seq)) {
    // deleted while being rewritten; don't leave the new version behind.
    co_await erase(key);
  }
  co_return 1;
}

seastar::future<uint64_t> local_collection::delete_one(
    const document& filter, const write_options& opts
) {
  auto seqs = matching(filter, true);
  if (seqs.empty()) {
    co_return 0;
  }
  auto key = _docs.at(seqs.front()).key;
  remove_slot(seqs.front());
  co_await erase(key);
  co_return 1;
}

seastar::future<uint64_t> local_collection::delete_many(
    const document& filter, const write_options& opts
) {
  std::vector<std::string> keys;
  for (auto seq : matching(filter, false)) {
    keys.push_back(_docs.at(seq).key);
    remove_slot(seq);
  }
  applog.debug("delete {} documents from '{}'", keys.size(), _name);
  for (const auto& key : keys) {
    co_await erase(key);
  }
  co_return keys.size();
}

seastar::future<cursor_ptr> local_collection::find(
    const document& filter, const query_options& opts
) {
  if (opts.sort) {
    check_sort(*opts.sort);
  }
  if (opts.skip < 0) {
    throw document_format_error("skip must not be negative");
  }

  auto seqs = matching(filter, false);
  if (opts.sort && !opts.sort->empty()) {
    const document& sort = *opts.sort;
    std::stable_sort(
        seqs.begin(), seqs.end(),
        [this, &sort](uint64_t a, uint64_t b) {
          return sort_less(_docs.at(a).header, _docs.at(b).header, sort);
        }
    );
  }

  auto skip = std::min<size_t>(opts.skip, seqs.size());
  seqs.erase(seqs.begin(), seqs.begin() + skip);
  if (opts.limit && *opts.limit != 0) {
    // a negative limit means the same as its absolute value
    size_t limit = *opts.limit < 0 ? -*opts.limit : *opts.limit;
    if (seqs.size() > limit) {
      seqs.resize(limit);
    }
  }

  applog.debug(
      "find on '{}' matched {} documents", _name, seqs.size()
  );
  co_return std::make_unique<local_cursor>(
      shared_from_this(), std::move(seqs), opts
  );
}

seastar::future<> local_collection::create_index(const index_model& model) {
  if (model.name.empty()) {
    throw document_format_error("index name must not be empty");
  }
  if (!model.keys.is_object() || model.keys.empty()) {
    throw document_format_error("index keys must be a non-empty document");
  }
  check_sort(model.keys);

  for (const auto& idx : _indexes) {
    if (idx.model.name != model.name) {
      continue;
    }
    if (idx.model.keys == model.keys && idx.model.unique == model.unique) {
      co_return;
    }
    throw store_error(fmt::format(
        "index '{}' on '{}' already exists with different keys", model.name,
        _name
    ));
  }

  index_state st{model, {}};
  if (model.unique) {
    for (const auto& [seq, s] : _docs) {
      if (!st.values.insert(index_key(s.header, model.keys).dump()).second) {
        throw duplicate_key_error(_name, model.name);
      }
    }
  }
  applog.debug("create index '{}' on '{}'", model.name, _name);
  _indexes.push_back(std::move(st));

  try {
    co_await persist_indexes();
  } catch (...) {
    std::erase_if(_indexes, [&model](const index_state& idx) {
      return idx.model.name == model.name;
    });
    throw;
  }
}

seastar::future<std::vector<index_model>> local_collection::list_indexes() {
  std::vector<index_model> res;
  res.push_back(index_model{"_id_", document{{"_id", 1}}, true});
  for (const auto& idx : _indexes) {
    res.push_back(idx.model);
  }
  return seastar::make_ready_future<std::vector<index_model>>(std::move(res));
}

seastar::future<> local_collection::drop() {
  applog.debug("drop '{}', {} documents", _name, _docs.size());
  _docs.clear();
  _by_key.clear();
  _indexes.clear();
  return erase_all();
}

}  // namespace store

}  // namespace gridfs
