/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#include <fmt/core.h>
#include <fmt/format.h>

#include <cstdint>
#include <exception>
#include <iostream>
#include <seastar/core/app-template.hh>
#include <seastar/core/future.hh>
#include <seastar/core/reactor.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/core/sstring.hh>
#include <seastar/core/thread.hh>
#include <seastar/util/log.hh>
#include <sstream>
#include <string>
#include <vector>

#include "bucket.hh"
#include "command.hh"
#include "options.hh"
#include "store/file.hh"

using namespace seastar;

namespace bpo = boost::program_options;

static logger applog(__FILE__);

int main(int argc, char** argv) {
  app_template::config cfg;
  cfg.name = "gridfs-tool";
  cfg.description =
      "Store and retrieve files in a GridFS bucket.\n\n"
      "Commands:\n"
      "  upload PATH [FILENAME]\n"
      "  download ID PATH\n"
      "  download-name NAME PATH [REVISION]\n"
      "  find [FILENAME]\n"
      "  delete ID\n"
      "  rename ID NAME\n"
      "  drop\n"
      "  indexes\n";
  app_template app(std::move(cfg));

  app.add_options()(
      "store-path", bpo::value<seastar::sstring>()->required(), "path to store"
  );
  app.add_options()(
      "bucket", bpo::value<std::string>()->default_value("fs"), "bucket name"
  );
  app.add_options()(
      "chunk-size",
      bpo::value<int32_t>()->default_value(gridfs::default_chunk_size),
      "chunk size, in bytes, for new uploads"
  );
  app.add_options()(
      "disable-md5", bpo::bool_switch()->default_value(false),
      "don't compute the md5 of uploads"
  );
  app.add_options()(
      "skip", bpo::value<int32_t>()->default_value(0),
      "number of file entries 'find' skips"
  );
  app.add_options()(
      "limit", bpo::value<int32_t>(),
      "maximum number of file entries 'find' returns"
  );
  app.add_options()(
      "sort", bpo::value<std::string>(),
      "sort document for 'find', e.g. '{\"uploadDate\": -1}'"
  );
  app.add_positional_options({
      {"command", bpo::value<std::string>()->required(), "command to run", 1},
      {"args",
       bpo::value<std::vector<std::string>>()->default_value(
           std::vector<std::string>{}, ""
       ),
       "command arguments", -1},
  });

  try {
    return app.run(argc, argv, [&] {
      auto&& config = app.configuration();

      seastar::sstring store_path = config["store-path"].as<seastar::sstring>();
      auto command = config["command"].as<std::string>();
      auto args = config["args"].as<std::vector<std::string>>();

      gridfs::bucket_options bopts;
      bopts.bucket_name = config["bucket"].as<std::string>();
      bopts.chunk_size_bytes = config["chunk-size"].as<int32_t>();
      bopts.disable_md5 = config["disable-md5"].as<bool>();

      applog.debug(
          "store path: {}, bucket: {}, chunk size: {}, md5: {}", store_path,
          bopts.bucket_name, bopts.chunk_size_bytes, !bopts.disable_md5
      );

      return seastar::async([=, &config] {
        try {
          gridfs::find_options fopts;
          fopts.skip = config["skip"].as<int32_t>();
          if (config.count("limit")) {
            fopts.limit = config["limit"].as<int32_t>();
          }
          if (config.count("sort")) {
            fopts.sort =
                gridfs::tool::parse_sort(config["sort"].as<std::string>());
          }

          auto db = gridfs::store::open_database(store_path).get();
          applog.info("opened store at {}", store_path);

          gridfs::bucket b(db, bopts);
          auto handler = gridfs::tool::make_command(command, b, fopts);
          handler->handle(args, std::cout).get();

          std::ostringstream oss;
          b.get_stats().print(oss);
          applog.debug("stats: {}", oss.str());
          return 0;
        } catch (...) {
          applog.error("{} failed: {}", command, std::current_exception());
          return 1;
        }
      });
    });
  } catch (...) {
    applog.error("couldn't start application: {}", std::current_exception());
    return 1;
  }
}
