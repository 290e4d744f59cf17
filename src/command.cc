/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#include "command.hh"

#include <fmt/format.h>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/lexical_cast.hpp>
#include <chrono>
#include <exception>
#include <seastar/core/coroutine.hh>
#include <seastar/core/file.hh>
#include <seastar/core/fstream.hh>
#include <seastar/core/lowres_clock.hh>
#include <seastar/core/seastar.hh>
#include <seastar/util/log.hh>
#include <stdexcept>

#include "download.hh"
#include "errors.hh"

static seastar::logger applog(__FILE__);

namespace gridfs {

namespace tool {

using clock_type = seastar::lowres_clock;

namespace {

object_id parse_id(const std::string& hex) {
  try {
    return object_id::from_hex(hex);
  } catch (const std::invalid_argument&) {
    throw invalid_argument_error(fmt::format("'{}' is not a file id", hex));
  }
}

std::string base_name(const std::string& path) {
  std::vector<std::string> parts;
  boost::split(parts, path, boost::is_any_of("/"));
  return parts.back();
}

seastar::future<seastar::output_stream<char>> create_output(
    const std::string& path
) {
  auto flags = seastar::open_flags::create | seastar::open_flags::truncate |
               seastar::open_flags::wo;
  auto f = co_await seastar::open_file_dma(path, flags);
  co_return co_await seastar::make_file_output_stream(std::move(f));
}

// PATH is only created once the file has been resolved.
seastar::future<uint64_t> copy_to_file(
    download_stream& stream, const std::string& path
) {
  auto os = co_await create_output(path);
  std::exception_ptr ep;
  uint64_t written = 0;
  try {
    while (auto buf = co_await stream.next()) {
      written += buf->size();
      co_await os.write(std::move(*buf));
    }
    co_await os.flush();
  } catch (...) {
    ep = std::current_exception();
  }
  co_await os.close();
  if (ep) {
    std::rethrow_exception(ep);
  }
  co_return written;
}

}  // namespace

store::document parse_sort(const std::string& sort) {
  store::document doc;
  try {
    doc = store::document::parse(sort);
  } catch (const nlohmann::json::exception& e) {
    throw invalid_argument_error(
        fmt::format("unable to parse sort '{}': {}", sort, e.what())
    );
  }
  if (!doc.is_object()) {
    throw invalid_argument_error(
        fmt::format("sort '{}' is not a document", sort)
    );
  }
  return doc;
}

seastar::future<> command_handler::handle(
    const command_args& args, std::ostream& out
) {
  if (args.size() < min_args() || args.size() > max_args()) {
    throw invalid_argument_error(fmt::format("usage: {}", usage()));
  }

  auto start = clock_type::now();
  co_await handle_command(args, out);
  auto end = clock_type::now();

  auto diff =
      std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
  applog.debug("'{}' took {} ms", usage(), diff.count());
}

seastar::future<> upload_command::handle_command(
    const command_args& args, std::ostream& out
) {
  const auto& path = args[0];
  auto filename = args.size() > 1 ? args[1] : base_name(path);
  applog.info("upload '{}' as '{}'", path, filename);

  auto f = co_await seastar::open_file_dma(path, seastar::open_flags::ro);
  auto in = seastar::make_file_input_stream(std::move(f));

  std::exception_ptr ep;
  object_id id;
  try {
    id = co_await _bucket.upload_from_stream(filename, in);
  } catch (...) {
    ep = std::current_exception();
  }
  co_await in.close();
  if (ep) {
    std::rethrow_exception(ep);
  }
  out << id << std::endl;
}

seastar::future<> download_command::handle_command(
    const command_args& args, std::ostream& out
) {
  auto id = parse_id(args[0]);
  const auto& path = args[1];
  applog.info("download '{}' to '{}'", id, path);

  auto stream = co_await _bucket.open_download_stream(id);
  auto written = co_await copy_to_file(stream, path);
  applog.debug("wrote {} bytes to '{}'", written, path);
}

seastar::future<> download_name_command::handle_command(
    const command_args& args, std::ostream& out
) {
  const auto& filename = args[0];
  const auto& path = args[1];
  int32_t revision = -1;
  if (args.size() > 2) {
    try {
      revision = boost::lexical_cast<int32_t>(args[2]);
    } catch (const boost::bad_lexical_cast&) {
      throw invalid_argument_error(
          fmt::format("'{}' is not a revision", args[2])
      );
    }
  }
  applog.info("download '{}' revision {} to '{}'", filename, revision, path);

  auto stream =
      co_await _bucket.open_download_stream_by_name(filename, revision);
  auto written = co_await copy_to_file(stream, path);
  applog.debug("wrote {} bytes to '{}'", written, path);
}

seastar::future<> find_command::handle_command(
    const command_args& args, std::ostream& out
) {
  auto filter = store::document::object();
  if (!args.empty()) {
    filter[fields::filename] = args[0];
  }

  auto cursor = co_await _bucket.find(filter, _opts);
  size_t count = 0;
  while (auto entry = co_await cursor.next()) {
    out << entry->to_document().dump() << std::endl;
    ++count;
  }
  applog.debug("found {} files", count);
}

seastar::future<> delete_command::handle_command(
    const command_args& args, std::ostream& out
) {
  auto id = parse_id(args[0]);
  applog.info("delete '{}'", id);
  co_await _bucket.delete_file(id);
}

seastar::future<> rename_command::handle_command(
    const command_args& args, std::ostream& out
) {
  auto id = parse_id(args[0]);
  applog.info("rename '{}' to '{}'", id, args[1]);
  co_await _bucket.rename(id, args[1]);
}

seastar::future<> drop_command::handle_command(
    const command_args& args, std::ostream& out
) {
  applog.info("drop bucket '{}'", _bucket.options().bucket_name);
  co_await _bucket.drop();
}

seastar::future<> indexes_command::handle_command(
    const command_args& args, std::ostream& out
) {
  applog.info("ensure indexes of '{}'", _bucket.options().bucket_name);
  co_await _bucket.ensure_indexes();
}

std::unique_ptr<command_handler> make_command(
    const std::string& name, gridfs::bucket& b, find_options find_opts
) {
  if (name == "upload") {
    return std::make_unique<upload_command>(b);
  } else if (name == "download") {
    return std::make_unique<download_command>(b);
  } else if (name == "download-name") {
    return std::make_unique<download_name_command>(b);
  } else if (name == "find") {
    return std::make_unique<find_command>(b, std::move(find_opts));
  } else if (name == "delete") {
    return std::make_unique<delete_command>(b);
  } else if (name == "rename") {
    return std::make_unique<rename_command>(b);
  } else if (name == "drop") {
    return std::make_unique<drop_command>(b);
  } else if (name == "indexes") {
    return std::make_unique<indexes_command>(b);
  }
  throw invalid_argument_error(fmt::format("unknown command '{}'", name));
}

}  // namespace tool

}  // namespace gridfs
