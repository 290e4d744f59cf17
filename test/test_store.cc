/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#include <fmt/format.h>
#include <gtest/gtest.h>

#include <functional>
#include <seastar/core/seastar.hh>
#include <seastar/core/when_all.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/core/sstring.hh>
#include <seastar/util/tmp_file.hh>
#include <string>
#include <vector>

#include "object_id.hh"
#include "store/collection.hh"
#include "store/errors.hh"
#include "store/file.hh"
#include "store/memory.hh"
#include "test_util.hh"

namespace gridfs {

namespace store {

namespace {

using test::find_all;

document make_doc(const std::string& name, int n) {
  return document{
      {"_id", object_id::generate().to_hex()},
      {"name", name},
      {"n", n},
  };
}

collection_ptr get(database_ptr db, const std::string& name) {
  return db->get_collection(name).get();
}

void with_memory_database(std::function<void(database_ptr)> func) {
  func(seastar::make_shared<memory_database>());
}

void with_file_database(std::function<void(database_ptr)> func) {
  seastar::tmp_dir::do_with_thread([&func](seastar::tmp_dir& t) {
    func(open_database(seastar::sstring(t.get_path().native())).get());
  }).get();
}

void check_insert_and_find(database_ptr db) {
  auto coll = get(db, "things");
  write_options wopts;
  coll->insert_one(make_doc("a", 3), wopts).get();
  coll->insert_one(make_doc("b", 1), wopts).get();
  coll->insert_one(make_doc("c", 2), wopts).get();

  auto all = find_all(db, "things");
  ASSERT_EQ(3u, all.size());
  EXPECT_EQ("a", all[0]["name"]);
  EXPECT_EQ("b", all[1]["name"]);
  EXPECT_EQ("c", all[2]["name"]);

  auto some = find_all(db, "things", document{{"n", {{"$gte", 2}}}});
  EXPECT_EQ(2u, some.size());

  auto one = coll->find_one(document{{"name", "b"}}, {}).get();
  ASSERT_TRUE(one.has_value());
  EXPECT_EQ(1, (*one)["n"]);

  auto none = coll->find_one(document{{"name", "z"}}, {}).get();
  EXPECT_FALSE(none.has_value());
}

void check_sort_skip_limit(database_ptr db) {
  auto coll = get(db, "things");
  for (int i = 0; i < 5; ++i) {
    coll->insert_one(make_doc("x", (i * 3) % 5), {}).get();
  }

  query_options opts;
  opts.sort = document{{"n", -1}};
  auto sorted = find_all(db, "things", document::object(), opts);
  ASSERT_EQ(5u, sorted.size());
  for (int i = 0; i < 5; ++i) {
    EXPECT_EQ(4 - i, sorted[i]["n"]);
  }

  opts.skip = 1;
  opts.limit = 2;
  auto page = find_all(db, "things", document::object(), opts);
  ASSERT_EQ(2u, page.size());
  EXPECT_EQ(3, page[0]["n"]);
  EXPECT_EQ(2, page[1]["n"]);

  opts.skip = 10;
  EXPECT_TRUE(find_all(db, "things", document::object(), opts).empty());

  query_options bad;
  bad.sort = document{{"n", 5}};
  EXPECT_THROW(
      coll->find(document::object(), bad).get(), document_format_error
  );
}

void check_generated_and_duplicate_ids(database_ptr db) {
  auto coll = get(db, "things");
  coll->insert_one(document{{"name", "no id"}}, {}).get();
  auto all = find_all(db, "things");
  ASSERT_EQ(1u, all.size());
  ASSERT_TRUE(all[0]["_id"].is_string());
  EXPECT_TRUE(object_id::is_valid(all[0]["_id"].get<std::string>()));

  auto doc = make_doc("dup", 1);
  coll->insert_one(doc, {}).get();
  EXPECT_THROW(coll->insert_one(doc, {}).get(), duplicate_key_error);
  EXPECT_EQ(2u, find_all(db, "things").size());
}

void check_unique_index(database_ptr db) {
  auto coll = get(db, "things");
  index_model model{"name_1_n_1", document{{"name", 1}, {"n", 1}}, true};
  coll->create_index(model).get();
  // same model again is fine
  coll->create_index(model).get();

  auto indexes = coll->list_indexes().get();
  ASSERT_EQ(2u, indexes.size());
  EXPECT_EQ("_id_", indexes[0].name);
  EXPECT_EQ("name_1_n_1", indexes[1].name);
  EXPECT_TRUE(indexes[1].unique);

  coll->insert_one(make_doc("a", 1), {}).get();
  coll->insert_one(make_doc("a", 2), {}).get();
  EXPECT_THROW(
      coll->insert_one(make_doc("a", 1), {}).get(), duplicate_key_error
  );
  EXPECT_EQ(2u, find_all(db, "things").size());

  index_model other_keys{"name_1_n_1", document{{"name", 1}}, true};
  EXPECT_THROW(coll->create_index(other_keys).get(), store_error);

  index_model clashing{"name_1", document{{"name", 1}}, true};
  EXPECT_THROW(coll->create_index(clashing).get(), duplicate_key_error);
  EXPECT_EQ(2u, coll->list_indexes().get().size());
}

void check_update_one(database_ptr db) {
  auto coll = get(db, "things");
  auto doc = make_doc("a", 1);
  auto id = doc["_id"];
  coll->insert_one(doc, {}).get();
  coll->insert_one(make_doc("a", 2), {}).get();

  EXPECT_EQ(
      1u, coll->update_one(document{{"_id", id}}, {{"name", "b"}}, {}).get()
  );
  auto res = find_all(db, "things", document{{"_id", id}});
  ASSERT_EQ(1u, res.size());
  EXPECT_EQ("b", res[0]["name"]);
  EXPECT_EQ(1, res[0]["n"]);

  EXPECT_EQ(
      0u, coll->update_one(document{{"name", "z"}}, {{"name", "y"}}, {}).get()
  );
  EXPECT_THROW(
      coll->update_one(document{{"_id", id}}, {{"_id", "x"}}, {}).get(),
      document_format_error
  );
}

void check_delete(database_ptr db) {
  auto coll = get(db, "things");
  for (int i = 0; i < 4; ++i) {
    coll->insert_one(make_doc(i % 2 ? "odd" : "even", i), {}).get();
  }

  EXPECT_EQ(1u, coll->delete_one(document{{"name", "odd"}}, {}).get());
  EXPECT_EQ(3u, find_all(db, "things").size());
  EXPECT_EQ(1u, coll->delete_many(document{{"name", "odd"}}, {}).get());
  EXPECT_EQ(2u, coll->delete_many(document{{"name", "even"}}, {}).get());
  EXPECT_EQ(0u, coll->delete_one(document::object(), {}).get());
  EXPECT_TRUE(find_all(db, "things").empty());
}

void check_drop(database_ptr db) {
  auto coll = get(db, "things");
  coll->create_index({"name_1", document{{"name", 1}}, false}).get();
  coll->insert_one(make_doc("a", 1), {}).get();

  coll->drop().get();
  EXPECT_TRUE(find_all(db, "things").empty());
  EXPECT_EQ(1u, coll->list_indexes().get().size());

  // dropping twice, or something never used, is fine
  coll->drop().get();
  get(db, "never.used")->drop().get();
}

void check_projection(database_ptr db) {
  auto coll = get(db, "things");
  coll->insert_one(make_doc("a", 1), {}).get();

  query_options opts;
  opts.projection = document{{"n", 1}};
  auto res = find_all(db, "things", document::object(), opts);
  ASSERT_EQ(1u, res.size());
  EXPECT_EQ(2u, res[0].size());
  EXPECT_TRUE(res[0].contains("_id"));
  EXPECT_FALSE(res[0].contains("name"));
}

void check_cursor_skips_removed(database_ptr db) {
  auto coll = get(db, "things");
  auto first = make_doc("a", 1);
  coll->insert_one(first, {}).get();
  coll->insert_one(make_doc("b", 2), {}).get();

  auto cursor = coll->find(document::object(), {}).get();
  coll->delete_one(document{{"_id", first["_id"]}}, {}).get();
  auto doc = cursor->next().get();
  ASSERT_TRUE(doc.has_value());
  EXPECT_EQ("b", (*doc)["name"]);
  EXPECT_FALSE(cursor->next().get().has_value());
}

}  // namespace

TEST(MemoryStoreTest, InsertAndFind) {
  with_memory_database(check_insert_and_find);
}

TEST(MemoryStoreTest, SortSkipLimit) {
  with_memory_database(check_sort_skip_limit);
}

TEST(MemoryStoreTest, GeneratedAndDuplicateIds) {
  with_memory_database(check_generated_and_duplicate_ids);
}

TEST(MemoryStoreTest, UniqueIndex) { with_memory_database(check_unique_index); }

TEST(MemoryStoreTest, UpdateOne) { with_memory_database(check_update_one); }

TEST(MemoryStoreTest, Delete) { with_memory_database(check_delete); }

TEST(MemoryStoreTest, Drop) { with_memory_database(check_drop); }

TEST(MemoryStoreTest, Projection) { with_memory_database(check_projection); }

TEST(MemoryStoreTest, CursorSkipsRemoved) {
  with_memory_database(check_cursor_skips_removed);
}

TEST(FileStoreTest, InsertAndFind) {
  with_file_database(check_insert_and_find);
}

TEST(FileStoreTest, SortSkipLimit) { with_file_database(check_sort_skip_limit); }

TEST(FileStoreTest, GeneratedAndDuplicateIds) {
  with_file_database(check_generated_and_duplicate_ids);
}

TEST(FileStoreTest, UniqueIndex) { with_file_database(check_unique_index); }

TEST(FileStoreTest, UpdateOne) { with_file_database(check_update_one); }

TEST(FileStoreTest, Delete) { with_file_database(check_delete); }

TEST(FileStoreTest, Drop) { with_file_database(check_drop); }

TEST(FileStoreTest, Projection) { with_file_database(check_projection); }

TEST(FileStoreTest, CursorSkipsRemoved) {
  with_file_database(check_cursor_skips_removed);
}

TEST(FileStoreTest, ReopenKeepsDocumentsAndIndexes) {
  seastar::tmp_dir::do_with_thread([](seastar::tmp_dir& t) {
    seastar::sstring path(t.get_path().native());
    auto keep = make_doc("keep", 1);
    auto drop = make_doc("drop", 2);
    {
      database_ptr db = open_database(path).get();
      auto coll = get(db, "things");
      coll->create_index({"name_1", document{{"name", 1}}, true}).get();
      coll->insert_one(keep, {}).get();
      coll->insert_one(drop, {}).get();
      coll->update_one(document{{"_id", keep["_id"]}}, {{"n", 10}}, {}).get();
      coll->delete_one(document{{"_id", drop["_id"]}}, {}).get();
    }

    database_ptr db = open_database(path).get();
    auto res = find_all(db, "things");
    ASSERT_EQ(1u, res.size());
    EXPECT_EQ(keep["_id"], res[0]["_id"]);
    EXPECT_EQ(10, res[0]["n"]);

    auto coll = get(db, "things");
    auto indexes = coll->list_indexes().get();
    ASSERT_EQ(2u, indexes.size());
    EXPECT_EQ("name_1", indexes[1].name);
    EXPECT_THROW(
        coll->insert_one(make_doc("keep", 5), {}).get(), duplicate_key_error
    );
  }).get();
}

TEST(FileStoreTest, BinaryDataIsReadBack) {
  seastar::tmp_dir::do_with_thread([](seastar::tmp_dir& t) {
    seastar::sstring path(t.get_path().native());
    auto id = object_id::generate().to_hex();
    {
      database_ptr db = open_database(path).get();
      auto coll = get(db, "chunks");
      document doc{{"_id", id}, {"n", 0}};
      doc["data"] = make_binary({0, 1, 2, 250, 255});
      coll->insert_one(std::move(doc), {}).get();
    }

    database_ptr db = open_database(path).get();
    auto res = find_all(db, "chunks", document{{"n", 0}});
    ASSERT_EQ(1u, res.size());
    ASSERT_TRUE(res[0]["data"].is_binary());
    const std::vector<uint8_t>& bytes = res[0]["data"].get_binary();
    EXPECT_EQ((std::vector<uint8_t>{0, 1, 2, 250, 255}), bytes);

    // binary fields can't be queried, but everything else can
    EXPECT_EQ(1u, find_all(db, "chunks", document{{"_id", id}}).size());
  }).get();
}

TEST(FileStoreTest, StaleTemporaryFilesAreRemoved) {
  seastar::tmp_dir::do_with_thread([](seastar::tmp_dir& t) {
    seastar::sstring path(t.get_path().native());
    {
      database_ptr db = open_database(path).get();
      get(db, "things")->insert_one(make_doc("a", 1), {}).get();
    }
    auto stale = fmt::format(
        "{}/things/{}.3.tmp", path, object_id::generate().to_hex()
    );
    test::write_local_file(stale, {'x'});

    database_ptr db = open_database(path).get();
    EXPECT_EQ(1u, find_all(db, "things").size());
    EXPECT_FALSE(seastar::file_exists(stale).get());
  }).get();
}

TEST(FileStoreTest, OverlappingUpdatesOfOneDocument) {
  seastar::tmp_dir::do_with_thread([](seastar::tmp_dir& t) {
    seastar::sstring path(t.get_path().native());
    auto doc = make_doc("a", 0);
    document filter{{"_id", doc["_id"]}};
    {
      database_ptr db = open_database(path).get();
      auto coll = get(db, "things");
      coll->insert_one(doc, {}).get();

      std::vector<document> fields;
      for (int n = 1; n <= 4; ++n) {
        fields.push_back(document{{"n", n}});
      }
      write_options wopts;
      std::vector<seastar::future<uint64_t>> updates;
      for (const auto& f : fields) {
        updates.push_back(coll->update_one(filter, f, wopts));
      }
      auto counts = seastar::when_all_succeed(updates.begin(), updates.end())
                        .get();
      for (auto c : counts) {
        EXPECT_EQ(1u, c);
      }

      auto res = find_all(db, "things");
      ASSERT_EQ(1u, res.size());
      EXPECT_EQ(4, res[0]["n"]);
    }

    // disk holds the same version as memory did
    database_ptr db = open_database(path).get();
    auto res = find_all(db, "things");
    ASSERT_EQ(1u, res.size());
    EXPECT_EQ(4, res[0]["n"]);
  }).get();
}

TEST(FileStoreTest, DocumentsNeedObjectIds) {
  with_file_database([](database_ptr db) {
    auto coll = get(db, "things");
    EXPECT_THROW(
        coll->insert_one(document{{"_id", "plain"}}, {}).get(),
        document_format_error
    );
    EXPECT_TRUE(find_all(db, "things").empty());
  });
}

TEST(FileStoreTest, RejectsBadCollectionNames) {
  with_file_database([](database_ptr db) {
    EXPECT_THROW(db->get_collection("").get(), store_error);
    EXPECT_THROW(db->get_collection("..").get(), store_error);
    EXPECT_THROW(db->get_collection("a/b").get(), store_error);
    EXPECT_THROW(db->get_collection("format").get(), store_error);
  });
}

TEST(FileStoreTest, FormatVersion) {
  seastar::tmp_dir::do_with_thread([](seastar::tmp_dir& t) {
    seastar::sstring path(t.get_path().native());
    EXPECT_EQ(file_store_format_version, open_or_create(path).get());
    EXPECT_EQ(file_store_format_version, open_or_create(path).get());

    auto fresh = fmt::format("{}/nested", path);
    EXPECT_EQ(file_store_format_version, open_or_create(fresh).get());

    auto bad_version = fmt::format("{}/format", fresh);
    test::write_local_file(bad_version, {'9', '9'});
    EXPECT_THROW(open_or_create(fresh).get(), store_error);

    auto plain = fmt::format("{}/plain", path);
    test::write_local_file(plain, {'x'});
    EXPECT_THROW(open_or_create(plain).get(), store_error);
  }).get();
}

}  // namespace store

}  // namespace gridfs
