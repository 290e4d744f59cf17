/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#pragma once

#include <memory>
#include <ostream>
#include <seastar/core/future.hh>
#include <string>
#include <vector>

#include "bucket.hh"
#include "options.hh"

namespace gridfs {

namespace tool {

using command_args = std::vector<std::string>;

// One gridfs-tool command, operating on a bucket. Results meant for the
// user are written to 'out'; wrong arguments fail with
// invalid_argument_error.
class command_handler {
 protected:
  gridfs::bucket& _bucket;

 public:
  command_handler(gridfs::bucket& b) : _bucket(b) {}
  virtual ~command_handler() = default;

  virtual const char* usage() const = 0;

  // Checks the number of arguments, then runs and times the command.
  seastar::future<> handle(const command_args& args, std::ostream& out);

  virtual seastar::future<> handle_command(
      const command_args& args, std::ostream& out
  ) = 0;

 protected:
  virtual size_t min_args() const { return 0; }
  virtual size_t max_args() const { return min_args(); }
};

// upload PATH [FILENAME]
class upload_command : public command_handler {
 public:
  upload_command(gridfs::bucket& b) : command_handler(b) {}

  const char* usage() const override { return "upload PATH [FILENAME]"; }

  seastar::future<> handle_command(
      const command_args& args, std::ostream& out
  ) override;

 protected:
  size_t min_args() const override { return 1; }
  size_t max_args() const override { return 2; }
};

// download ID PATH
class download_command : public command_handler {
 public:
  download_command(gridfs::bucket& b) : command_handler(b) {}

  const char* usage() const override { return "download ID PATH"; }

  seastar::future<> handle_command(
      const command_args& args, std::ostream& out
  ) override;

 protected:
  size_t min_args() const override { return 2; }
};

// download-name NAME PATH [REVISION]
class download_name_command : public command_handler {
 public:
  download_name_command(gridfs::bucket& b) : command_handler(b) {}

  const char* usage() const override {
    return "download-name NAME PATH [REVISION]";
  }

  seastar::future<> handle_command(
      const command_args& args, std::ostream& out
  ) override;

 protected:
  size_t min_args() const override { return 2; }
  size_t max_args() const override { return 3; }
};

// find [FILENAME]
class find_command : public command_handler {
  find_options _opts;

 public:
  find_command(gridfs::bucket& b, find_options opts)
      : command_handler(b), _opts(std::move(opts)) {}

  const char* usage() const override { return "find [FILENAME]"; }

  seastar::future<> handle_command(
      const command_args& args, std::ostream& out
  ) override;

 protected:
  size_t max_args() const override { return 1; }
};

// delete ID
class delete_command : public command_handler {
 public:
  delete_command(gridfs::bucket& b) : command_handler(b) {}

  const char* usage() const override { return "delete ID"; }

  seastar::future<> handle_command(
      const command_args& args, std::ostream& out
  ) override;

 protected:
  size_t min_args() const override { return 1; }
};

// rename ID NAME
class rename_command : public command_handler {
 public:
  rename_command(gridfs::bucket& b) : command_handler(b) {}

  const char* usage() const override { return "rename ID NAME"; }

  seastar::future<> handle_command(
      const command_args& args, std::ostream& out
  ) override;

 protected:
  size_t min_args() const override { return 2; }
};

// drop
class drop_command : public command_handler {
 public:
  drop_command(gridfs::bucket& b) : command_handler(b) {}

  const char* usage() const override { return "drop"; }

  seastar::future<> handle_command(
      const command_args& args, std::ostream& out
  ) override;
};

// indexes
class indexes_command : public command_handler {
 public:
  indexes_command(gridfs::bucket& b) : command_handler(b) {}

  const char* usage() const override { return "indexes"; }

  seastar::future<> handle_command(
      const command_args& args, std::ostream& out
  ) override;
};

// Obtain the handler for 'name'; throws invalid_argument_error for unknown
// commands.
std::unique_ptr<command_handler> make_command(
    const std::string& name, gridfs::bucket& b, find_options find_opts
);

// Parses a sort specification such as '{"uploadDate": -1}'.
store::document parse_sort(const std::string& sort);

}  // namespace tool

}  // namespace gridfs
