/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#include <gtest/gtest.h>

#include <boost/algorithm/string/trim.hpp>
#include <chrono>
#include <seastar/core/seastar.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/core/sleep.hh>
#include <seastar/util/tmp_file.hh>
#include <sstream>
#include <string>
#include <vector>

#include "bucket.hh"
#include "command.hh"
#include "errors.hh"
#include "store/memory.hh"
#include "test_util.hh"

namespace gridfs {

namespace tool {

namespace {

store::database_ptr memory_db() {
  return seastar::make_shared<store::memory_database>();
}

std::string run(
    bucket& b, const std::string& name, const command_args& args,
    find_options find_opts = {}
) {
  std::ostringstream out;
  make_command(name, b, std::move(find_opts))->handle(args, out).get();
  return out.str();
}

std::vector<store::document> run_find(
    bucket& b, const command_args& args, find_options find_opts = {}
) {
  std::istringstream in(run(b, "find", args, std::move(find_opts)));
  std::vector<store::document> res;
  std::string line;
  while (std::getline(in, line)) {
    res.push_back(store::document::parse(line));
  }
  return res;
}

}  // namespace

TEST(CommandTest, UploadFindDownload) {
  seastar::tmp_dir::do_with_thread([](seastar::tmp_dir& t) {
    auto src = (t.get_path() / "report.pdf").native();
    auto dst = (t.get_path() / "copy").native();
    auto data = test::make_payload(1000);
    test::write_local_file(src, data);

    bucket b(memory_db());
    auto printed = boost::algorithm::trim_copy(run(b, "upload", {src}));
    ASSERT_TRUE(object_id::is_valid(printed));

    auto found = run_find(b, {});
    ASSERT_EQ(1u, found.size());
    EXPECT_EQ(printed, found[0]["_id"]);
    EXPECT_EQ("report.pdf", found[0]["filename"]);
    EXPECT_EQ(1000, found[0]["length"]);

    EXPECT_EQ("", run(b, "download", {printed, dst}));
    EXPECT_EQ(data, test::read_local_file(dst));
  }).get();
}

TEST(CommandTest, UploadWithFilename) {
  seastar::tmp_dir::do_with_thread([](seastar::tmp_dir& t) {
    auto src = (t.get_path() / "src").native();
    test::write_local_file(src, test::make_payload(10));

    bucket b(memory_db());
    run(b, "upload", {src, "named"});
    EXPECT_EQ(1u, run_find(b, {"named"}).size());
    EXPECT_TRUE(run_find(b, {"src"}).empty());
  }).get();
}

TEST(CommandTest, DownloadByName) {
  seastar::tmp_dir::do_with_thread([](seastar::tmp_dir& t) {
    auto dst = (t.get_path() / "out").native();
    bucket b(memory_db());
    test::upload_bytes(b, "doc", test::make_payload(10, 1));
    seastar::sleep(std::chrono::milliseconds(2)).get();
    test::upload_bytes(b, "doc", test::make_payload(10, 2));

    run(b, "download-name", {"doc", dst});
    EXPECT_EQ(test::make_payload(10, 2), test::read_local_file(dst));

    run(b, "download-name", {"doc", dst, "0"});
    EXPECT_EQ(test::make_payload(10, 1), test::read_local_file(dst));

    EXPECT_THROW(
        run(b, "download-name", {"doc", dst, "first"}), invalid_argument_error
    );
    EXPECT_THROW(
        run(b, "download-name", {"doc", dst, "5"}), file_not_found_error
    );
  }).get();
}

TEST(CommandTest, UnknownIdLeavesNoOutput) {
  seastar::tmp_dir::do_with_thread([](seastar::tmp_dir& t) {
    auto dst = (t.get_path() / "out").native();
    bucket b(memory_db());
    EXPECT_THROW(
        run(b, "download", {object_id::generate().to_hex(), dst}),
        file_not_found_error
    );
    EXPECT_THROW(
        run(b, "download-name", {"missing", dst}), file_not_found_error
    );
    EXPECT_FALSE(seastar::file_exists(dst).get());
  }).get();
}

TEST(CommandTest, FindHonorsOptions) {
  bucket b(memory_db());
  for (auto name : {"b", "c", "a"}) {
    test::upload_bytes(b, name, test::make_payload(10));
  }

  find_options opts;
  opts.sort = parse_sort(R"({"filename": -1})");
  opts.limit = 2;
  auto found = run_find(b, {}, opts);
  ASSERT_EQ(2u, found.size());
  EXPECT_EQ("c", found[0]["filename"]);
  EXPECT_EQ("b", found[1]["filename"]);
}

TEST(CommandTest, RenameAndDelete) {
  bucket b(memory_db());
  auto id = test::upload_bytes(b, "old", test::make_payload(10));

  run(b, "rename", {id.to_hex(), "new"});
  EXPECT_TRUE(run_find(b, {"old"}).empty());
  EXPECT_EQ(1u, run_find(b, {"new"}).size());

  run(b, "delete", {id.to_hex()});
  EXPECT_TRUE(run_find(b, {}).empty());
  EXPECT_THROW(run(b, "delete", {id.to_hex()}), file_not_found_error);
}

TEST(CommandTest, IndexesAndDrop) {
  auto db = memory_db();
  bucket b(db);
  run(b, "indexes", {});
  auto chunks = db->get_collection(b.chunks_collection_name()).get();
  EXPECT_EQ(2u, chunks->list_indexes().get().size());

  test::upload_bytes(b, "a", test::make_payload(10));
  run(b, "drop", {});
  EXPECT_TRUE(run_find(b, {}).empty());
  EXPECT_EQ(1u, chunks->list_indexes().get().size());
}

TEST(CommandTest, UnknownCommand) {
  bucket b(memory_db());
  EXPECT_THROW(make_command("explode", b, {}), invalid_argument_error);
}

TEST(CommandTest, WrongArguments) {
  bucket b(memory_db());
  try {
    run(b, "upload", {});
    FAIL() << "upload needs a path";
  } catch (const invalid_argument_error& e) {
    EXPECT_EQ(std::string("usage: upload PATH [FILENAME]"), e.what());
  }
  EXPECT_THROW(run(b, "download", {"only-one"}), invalid_argument_error);
  EXPECT_THROW(run(b, "drop", {"extra"}), invalid_argument_error);
  EXPECT_THROW(run(b, "find", {"a", "b"}), invalid_argument_error);
  EXPECT_THROW(run(b, "delete", {"not-an-id"}), invalid_argument_error);
  EXPECT_THROW(
      run(b, "rename", {"5f1a2b3c4d5e6f7081920a0", "x"}), invalid_argument_error
  );
}

TEST(CommandTest, ParseSort) {
  auto sort = parse_sort(R"({"uploadDate": -1, "filename": 1})");
  ASSERT_EQ(2u, sort.size());
  EXPECT_EQ("uploadDate", sort.begin().key());

  EXPECT_THROW(parse_sort("{"), invalid_argument_error);
  EXPECT_THROW(parse_sort("[1, 2]"), invalid_argument_error);
}

}  // namespace tool

}  // namespace gridfs
