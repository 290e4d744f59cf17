/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <set>
#include <stdexcept>
#include <string>

#include "digest.hh"
#include "errors.hh"
#include "object_id.hh"

namespace gridfs {

TEST(ObjectIdTest, GeneratedIdsAreUnique) {
  std::set<object_id> ids;
  for (int i = 0; i < 1000; ++i) {
    EXPECT_TRUE(ids.insert(object_id::generate()).second);
  }
}

TEST(ObjectIdTest, HexRoundTrip) {
  auto id = object_id::generate();
  auto hex = id.to_hex();
  EXPECT_EQ(24u, hex.size());
  EXPECT_TRUE(object_id::is_valid(hex));
  EXPECT_EQ(id, object_id::from_hex(hex));
  EXPECT_EQ(hex, fmt::format("{}", id));
}

TEST(ObjectIdTest, ParseKnownValue) {
  auto id = object_id::from_hex("5f1a2b3c4d5e6f7081920a0b");
  EXPECT_EQ(0x5f1a2b3cu, id.timestamp());
  EXPECT_EQ(0x0b, id.bytes()[11]);
  EXPECT_EQ("5f1a2b3c4d5e6f7081920a0b", id.to_hex());
}

TEST(ObjectIdTest, UppercaseIsAccepted) {
  auto id = object_id::from_hex("5F1A2B3C4D5E6F7081920A0B");
  EXPECT_EQ("5f1a2b3c4d5e6f7081920a0b", id.to_hex());
}

TEST(ObjectIdTest, RejectsMalformedHex) {
  EXPECT_FALSE(object_id::is_valid(""));
  EXPECT_FALSE(object_id::is_valid("5f1a2b3c4d5e6f7081920a0"));
  EXPECT_FALSE(object_id::is_valid("5f1a2b3c4d5e6f7081920a0b0"));
  EXPECT_FALSE(object_id::is_valid("5f1a2b3c4d5e6f7081920a0g"));
  EXPECT_THROW(object_id::from_hex("not an id"), std::invalid_argument);
}

TEST(ObjectIdTest, TimestampIsNow) {
  auto now = std::chrono::duration_cast<std::chrono::seconds>(
                 std::chrono::system_clock::now().time_since_epoch()
  )
                 .count();
  auto ts = object_id::generate().timestamp();
  EXPECT_LE(std::abs(static_cast<int64_t>(ts) - now), 2);
}

TEST(ObjectIdTest, ProcessBytesAreShared) {
  auto a = object_id::generate();
  auto b = object_id::generate();
  for (size_t i = 4; i < 9; ++i) {
    EXPECT_EQ(a.bytes()[i], b.bytes()[i]);
  }
}

TEST(Md5DigestTest, KnownDigests) {
  md5_digest empty;
  EXPECT_EQ("d41d8cd98f00b204e9800998ecf8427e", empty.finish());

  md5_digest abc;
  abc.update("a", 1);
  abc.update("bc", 2);
  EXPECT_EQ("900150983cd24fb0d6963f7d28e17f72", abc.finish());
}

TEST(Md5DigestTest, FinishOnlyOnce) {
  md5_digest d;
  d.update("abc", 3);
  d.finish();
  EXPECT_THROW(d.update("abc", 3), gridfs_error);
  EXPECT_THROW(d.finish(), gridfs_error);
}

}  // namespace gridfs
