/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#include "store/file.hh"

#include <fmt/format.h>

#include <algorithm>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>
#include <exception>
#include <optional>
#include <seastar/core/coroutine.hh>
#include <seastar/core/file-types.hh>
#include <seastar/core/file.hh>
#include <seastar/core/fstream.hh>
#include <seastar/core/reactor.hh>
#include <seastar/core/seastar.hh>
#include <seastar/core/temporary_buffer.hh>
#include <seastar/util/log.hh>
#include <utility>
#include <vector>

#include "object_id.hh"
#include "store/errors.hh"

static seastar::logger applog(__FILE__);

namespace gridfs {

namespace store {

namespace {

constexpr const char* tmp_suffix = ".tmp";
constexpr const char* indexes_fname = "indexes";
constexpr const char* format_fname = "format";

uint64_t tmp_seq = 0;

// Write 'bytes' to 'path' through a temporary file, replacing 'path' once
// the contents are on disk.
seastar::future<> write_file(
    seastar::sstring path, std::vector<uint8_t> bytes
) {
  auto tmp_path = fmt::format("{}.{}{}", path, tmp_seq++, tmp_suffix);
  auto flags = seastar::open_flags::create | seastar::open_flags::truncate |
               seastar::open_flags::wo;

  auto f = co_await seastar::open_file_dma(tmp_path, flags);
  auto out = co_await seastar::make_file_output_stream(std::move(f));
  std::exception_ptr ex;
  try {
    co_await out.write(
        reinterpret_cast<const char*>(bytes.data()), bytes.size()
    );
    co_await out.flush();
  } catch (...) {
    ex = std::current_exception();
  }
  co_await out.close();
  if (ex) {
    std::rethrow_exception(ex);
  }
  co_await seastar::rename_file(tmp_path, path);
}

seastar::future<seastar::temporary_buffer<char>> read_file(
    const seastar::sstring& path
) {
  return seastar::with_file(
      seastar::open_file_dma(path, seastar::open_flags::ro),
      [](seastar::file& f) {
        return f.size().then([&f](uint64_t fsize) {
          return f.dma_read_exactly<char>(0, fsize);
        });
      }
  );
}

// Names of the regular entries in the directory at 'path'.
seastar::future<std::vector<std::string>> list_entries(
    seastar::sstring path
) {
  std::vector<std::string> names;
  co_await seastar::with_file(
      seastar::open_directory(path),
      [&names](seastar::file& dir) {
        auto lister = seastar::make_lw_shared<
            seastar::subscription<seastar::directory_entry>>(
            dir.list_directory([&names](seastar::directory_entry de) {
              if (!de.type ||
                  *de.type == seastar::directory_entry_type::regular) {
                names.emplace_back(de.name.begin(), de.name.end());
              }
              return seastar::make_ready_future<>();
            })
        );
        return lister->done().finally([lister] {});
      }
  );
  std::sort(names.begin(), names.end());
  co_return names;
}

document parse_bson(
    const seastar::temporary_buffer<char>& buf, const seastar::sstring& path
) {
  try {
    return document::from_bson(buf.begin(), buf.end());
  } catch (const nlohmann::json::exception& e) {
    throw document_format_error(
        fmt::format("malformed document at '{}': {}", path, e.what())
    );
  }
}

// Writes the control file holding the on-disk format version.
seastar::future<> write_format(const seastar::sstring& path) {
  auto fname = fmt::format("{}/{}", path, format_fname);
  auto str = fmt::format("{}", file_store_format_version);
  applog.debug("write format version {} to {}", str, fname);
  return write_file(fname, std::vector<uint8_t>(str.begin(), str.end()));
}

seastar::future<uint32_t> read_format(const seastar::sstring& path) {
  auto fname = fmt::format("{}/{}", path, format_fname);
  applog.debug("read format version at {}", fname);
  auto tbuf = co_await read_file(fname);
  try {
    co_return boost::lexical_cast<uint32_t>(tbuf.get(), tbuf.size());
  } catch (const boost::bad_lexical_cast&) {
    throw store_error(
        fmt::format("unable to obtain format version of store at {}", path)
    );
  }
}

}  // namespace

seastar::sstring file_collection::doc_path(const std::string& key) const {
  return fmt::format("{}/{}", _path, key);
}

seastar::sstring file_collection::indexes_path() const {
  return fmt::format("{}/{}", _path, indexes_fname);
}

seastar::future<> file_collection::init() {
  applog.debug("init collection '{}' at '{}'", name(), _path);
  auto st = co_await seastar::engine().file_type(_path);
  if (!st.has_value()) {
    applog.debug("create collection directory at {}", _path);
    co_await seastar::make_directory(_path);
    co_return;
  } else if (*st != seastar::directory_entry_type::directory) {
    throw store_error(
        fmt::format("path {} exists but is not a directory", _path)
    );
  }

  co_await load_documents();
  co_await load_indexes();
  applog.debug("loaded {} documents into '{}'", size(), name());
}

seastar::future<> file_collection::load_documents() {
  auto names = co_await list_entries(_path);
  for (const auto& fname : names) {
    if (boost::algorithm::ends_with(fname, tmp_suffix)) {
      // left behind by an interrupted write
      applog.info("remove stale file '{}' from '{}'", fname, name());
      co_await seastar::remove_file(doc_path(fname));
      continue;
    }
    if (!object_id::is_valid(fname)) {
      continue;
    }

    auto doc = co_await load(fname);
    auto header = header_of(doc);
    bool partial = header.size() != doc.size();
    restore(fname, std::move(header), partial);
  }
}

seastar::future<> file_collection::load_indexes() {
  auto path = indexes_path();
  if (!co_await seastar::file_exists(path)) {
    co_return;
  }

  auto buf = co_await read_file(path);
  document models;
  try {
    models = document::parse(buf.begin(), buf.end());
  } catch (const nlohmann::json::exception& e) {
    throw document_format_error(
        fmt::format("malformed index list at '{}': {}", path, e.what())
    );
  }
  if (!models.is_array()) {
    throw document_format_error(
        fmt::format("malformed index list at '{}'", path)
    );
  }

  for (const auto& m : models) {
    restore_index(index_model{
        m.value("name", std::string{}), m.value("key", document::object()),
        m.value("unique", false)
    });
  }
}

document file_collection::header_of(const document& doc) const {
  document header = doc;
  for (auto it = doc.begin(); it != doc.end(); ++it) {
    if (it->is_binary()) {
      header.erase(it.key());
    }
  }
  return header;
}

std::string file_collection::key_of(const document& doc) const {
  auto key = local_collection::key_of(doc);
  if (!object_id::is_valid(key)) {
    throw document_format_error(
        "'_id' of a file store document must be an object id"
    );
  }
  return key;
}

seastar::future<> file_collection::persist(
    const std::string& key, document doc
) {
  auto bytes = document::to_bson(doc);
  applog.debug(
      "write document '{}' to '{}', {} bytes", key, _path, bytes.size()
  );
  co_await write_locked(doc_path(key), std::move(bytes));
}

seastar::future<document> file_collection::load(const std::string& key) {
  auto fpath = doc_path(key);
  applog.debug("read document '{}' at '{}'", key, fpath);
  auto buf = co_await read_file(fpath);
  co_return parse_bson(buf, fpath);
}

seastar::future<> file_collection::erase(const std::string& key) {
  auto fpath = doc_path(key);
  if (co_await seastar::file_exists(fpath)) {
    co_await seastar::remove_file(fpath);
  }
}

seastar::future<> file_collection::erase_all() {
  auto names = co_await list_entries(_path);
  applog.debug("remove {} files from '{}'", names.size(), _path);
  for (const auto& fname : names) {
    co_await seastar::remove_file(doc_path(fname));
  }
}

seastar::future<> file_collection::persist_indexes() {
  auto models = document::array();
  for (const auto& m : index_models()) {
    models.push_back(document{
        {"name", m.name},
        {"key", m.keys},
        {"unique", m.unique},
    });
  }
  auto str = models.dump();
  co_await write_locked(
      indexes_path(), std::vector<uint8_t>(str.begin(), str.end())
  );
}

seastar::future<> file_collection::write_locked(
    seastar::sstring path, std::vector<uint8_t> bytes
) {
  auto it = _writers.find(path);
  if (it == _writers.end()) {
    it = _writers.emplace(path, seastar::make_lw_shared<seastar::semaphore>(1))
             .first;
  }
  auto sem = it->second;
  std::exception_ptr ex;
  {
    auto units = co_await seastar::get_units(*sem, 1);
    try {
      co_await write_file(path, std::move(bytes));
    } catch (...) {
      ex = std::current_exception();
    }
  }
  if (sem->waiters() == 0 && sem->available_units() == 1) {
    _writers.erase(path);
  }
  if (ex) {
    std::rethrow_exception(ex);
  }
}

seastar::future<collection_ptr> file_database::get_collection(
    const std::string& name
) {
  if (name.empty() || name == "." || name == ".." || name == format_fname ||
      name.find('/') != std::string::npos) {
    return seastar::make_exception_future<collection_ptr>(
        store_error(fmt::format("invalid collection name '{}'", name))
    );
  }

  auto it = _collections.find(name);
  if (it == _collections.end() ||
      (it->second.available() && it->second.failed())) {
    auto coll = seastar::make_shared<file_collection>(
        name, fmt::format("{}/{}", _path, name)
    );
    auto f = coll->init().then([coll] {
      return seastar::make_ready_future<collection_ptr>(coll);
    });
    it = _collections
             .insert_or_assign(
                 name, seastar::shared_future<collection_ptr>(std::move(f))
             )
             .first;
  }
  return it->second.get_future();
}

seastar::future<uint32_t> open_or_create(const seastar::sstring& path) {
  auto st = co_await seastar::engine().file_type(path);
  if (!st.has_value()) {
    applog.info("creating store at {}", path);
    co_await seastar::make_directory(path);
    co_await write_format(path);
    co_return file_store_format_version;
  } else if (*st != seastar::directory_entry_type::directory) {
    throw store_error(
        fmt::format("path {} exists but is not a directory", path)
    );
  }

  auto format_path = fmt::format("{}/{}", path, format_fname);
  if (!co_await seastar::file_exists(format_path)) {
    // an existing directory we haven't initialized yet
    applog.info("initializing store at {}", path);
    co_await write_format(path);
    co_return file_store_format_version;
  }

  auto version = co_await read_format(path);
  if (version != file_store_format_version) {
    throw store_error(fmt::format(
        "store at {} has format version {}, expected {}", path, version,
        file_store_format_version
    ));
  }
  co_return version;
}

seastar::future<seastar::shared_ptr<file_database>> open_database(
    const seastar::sstring& path
) {
  auto version = co_await open_or_create(path);
  applog.debug("opened store at {}, format version {}", path, version);
  co_return seastar::make_shared<file_database>(path);
}

}  // namespace store

}  // namespace gridfs
