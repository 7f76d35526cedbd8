/*
 * Copyright 2012 Facebook, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Tests for RegionInfo and the RegionCache.

#include <memory>
#include <string>

#include "hbrc/Counters.h"
#include "hbrc/RegionCache.h"
#include "hbrc/RegionInfo.h"

#include <gflags/gflags.h>
#include <gtest/gtest.h>

namespace h = hbrc;
using std::shared_ptr;
using std::string;

namespace {

shared_ptr<const h::RegionInfo> makeRegion(const string& table,
                                           const string& start_key,
                                           const string& stop_key) {
  return std::make_shared<h::RegionInfo>(
    table, table + "," + start_key + ",1434573235908.56f833d5569a27c7a4.",
    start_key, stop_key);
}

// Clients are never connected here; the cache only hands them back.
shared_ptr<h::RegionClient> makeClient(const string& host) {
  return std::make_shared<h::RegionClient>(host, 16020);
}

}  // namespace

TEST(RegionInfo, Contains) {
  auto region = makeRegion("test", "foo", "gohbase");
  EXPECT_FALSE(region->contains("bar"));
  EXPECT_TRUE(region->contains("foo"));
  EXPECT_TRUE(region->contains(string("foo\x00", 4)));
  EXPECT_TRUE(region->contains("go"));
  EXPECT_FALSE(region->contains("gohbase"));

  auto last = makeRegion("test", "gohbase", "");
  EXPECT_TRUE(last->contains("gohbase"));
  EXPECT_TRUE(last->contains("zzzzz"));
  EXPECT_FALSE(last->contains("foo"));
}

TEST(RegionInfo, ParseRegionName) {
  string table;
  string start_key;
  EXPECT_TRUE(h::ParseRegionName("test,foo,1434573235908.56f8.", &table,
                                 &start_key));
  EXPECT_EQ("test", table);
  EXPECT_EQ("foo", start_key);

  // start keys may contain commas
  EXPECT_TRUE(h::ParseRegionName("test,a,b,c,1434573235908.56f8.", &table,
                                 &start_key));
  EXPECT_EQ("test", table);
  EXPECT_EQ("a,b,c", start_key);

  EXPECT_TRUE(h::ParseRegionName("test,,1434573235908.", &table,
                                 &start_key));
  EXPECT_EQ("", start_key);

  EXPECT_FALSE(h::ParseRegionName("test,1434573235908", &table, &start_key));
  EXPECT_FALSE(h::ParseRegionName("test", &table, &start_key));
}

TEST(RegionInfo, FromRegionName) {
  auto region = h::RegionInfo::fromRegionName("t1,row5,1434573235908.ab.",
                                              "row9");
  ASSERT_TRUE(region != nullptr);
  EXPECT_EQ("t1", region->table);
  EXPECT_EQ("row5", region->start_key);
  EXPECT_EQ("row9", region->stop_key);
  EXPECT_EQ("t1,row5,1434573235908.ab.", region->region_name);
  EXPECT_EQ("t1 [row5, row9)", region->debugString());

  EXPECT_TRUE(h::RegionInfo::fromRegionName("bogus", "") == nullptr);
}

TEST(RegionCache, EmptyCacheMisses) {
  h::RegionCache cache;
  EXPECT_TRUE(cache.lookup("test", "theKey") == nullptr);
  EXPECT_TRUE(cache.lookup("test", "") == nullptr);
  EXPECT_EQ(0, cache.size());
}

TEST(RegionCache, InsertThenLookup) {
  h::SimpleCounter counters;
  h::RegionCache cache(&counters);
  auto region = makeRegion("test", "", "");
  auto client = makeClient("regionserver1");
  cache.insert(region, client);

  auto found = cache.lookup("test", "theKey");
  ASSERT_TRUE(found != nullptr);
  EXPECT_EQ(region, found->region);
  EXPECT_EQ(client, found->client);
  EXPECT_EQ(1, cache.size());

  EXPECT_EQ(1, counters.getCounter("regions_inserted"));
  EXPECT_EQ(1, counters.getCounter("cache_hits"));
  EXPECT_TRUE(cache.lookup("otherTable", "theKey") == nullptr);
  EXPECT_EQ(1, counters.getCounter("cache_misses"));
}

TEST(RegionCache, FloorLookup) {
  h::RegionCache cache;
  auto r1 = makeRegion("test", "", "foo");
  auto r2 = makeRegion("test", "foo", "gohbase");
  auto r3 = makeRegion("test", "gohbase", "");
  // insertion order does not matter
  cache.insert(r3, makeClient("rs3"));
  cache.insert(r1, makeClient("rs1"));
  cache.insert(r2, makeClient("rs2"));

  struct {
    string key;
    shared_ptr<const h::RegionInfo> region;
  } cases[] = {
    { "", r1 },
    { "bar", r1 },
    { "fon\xff", r1 },
    { "foo", r2 },
    { string("foo\x00", 4), r2 },
    { "gohbase", r3 },
    { "theKey", r3 },
  };
  for (const auto& c : cases) {
    auto found = cache.lookup("test", c.key);
    ASSERT_TRUE(found != nullptr) << "key " << c.key;
    EXPECT_EQ(c.region, found->region) << "key " << c.key;
  }
}

TEST(RegionCache, SplitUpdate) {
  h::RegionCache cache;
  auto r1 = makeRegion("test", "", "foo");
  auto r2 = makeRegion("test", "foo", "gohbase");
  auto r3 = makeRegion("test", "gohbase", "");
  cache.insert(r1, makeClient("rs1"));
  cache.insert(r2, makeClient("rs2"));
  cache.insert(r3, makeClient("rs3"));
  ASSERT_TRUE(cache.lookup("test", "zoo") != nullptr);

  // r3 split; we only learned about the lower half so far.
  auto r3_lower = makeRegion("test", "gohbase", "zab");
  auto client = makeClient("rs4");
  cache.insert(r3_lower, client);
  EXPECT_EQ(3, cache.size());

  EXPECT_TRUE(cache.lookup("test", "zoo") == nullptr);
  EXPECT_TRUE(cache.lookup("test", "zab") == nullptr);
  auto found = cache.lookup("test", "theKey");
  ASSERT_TRUE(found != nullptr);
  EXPECT_EQ(r3_lower, found->region);
  EXPECT_EQ(client, found->client);
  // the other regions are untouched
  EXPECT_EQ(r1, cache.lookup("test", "bar")->region);
  EXPECT_EQ(r2, cache.lookup("test", "foo")->region);

  // now the upper half
  auto r3_upper = makeRegion("test", "zab", "");
  cache.insert(r3_upper, makeClient("rs5"));
  found = cache.lookup("test", "zoo");
  ASSERT_TRUE(found != nullptr);
  EXPECT_EQ(r3_upper, found->region);
}

TEST(RegionCache, Remove) {
  h::SimpleCounter counters;
  h::RegionCache cache(&counters);
  auto r1 = makeRegion("test", "", "foo");
  auto r2 = makeRegion("test", "foo", "");
  cache.insert(r1, makeClient("rs1"));
  cache.insert(r2, makeClient("rs2"));

  EXPECT_TRUE(cache.remove("test", "foo"));
  EXPECT_FALSE(cache.remove("test", "foo"));
  EXPECT_FALSE(cache.remove("nosuchtable", ""));
  EXPECT_EQ(1, counters.getCounter("regions_removed"));

  EXPECT_TRUE(cache.lookup("test", "foo") == nullptr);
  EXPECT_TRUE(cache.lookup("test", "zzz") == nullptr);
  ASSERT_TRUE(cache.lookup("test", "bar") != nullptr);
  EXPECT_EQ(r1, cache.lookup("test", "bar")->region);
  EXPECT_EQ(1, cache.size());
}

TEST(RegionCache, TablesAreSeparate) {
  h::RegionCache cache;
  auto a = makeRegion("tableA", "", "");
  auto b = makeRegion("tableB", "m", "");
  cache.insert(a, makeClient("rs1"));
  cache.insert(b, makeClient("rs2"));

  EXPECT_EQ(a, cache.lookup("tableA", "a")->region);
  EXPECT_TRUE(cache.lookup("tableB", "a") == nullptr);
  EXPECT_EQ(b, cache.lookup("tableB", "x")->region);
  EXPECT_TRUE(cache.lookup("tableC", "x") == nullptr);
  EXPECT_EQ(2, cache.size());
}

int main(int argc, char *argv[]) {
  testing::InitGoogleTest(&argc, argv);
  google::ParseCommandLineFlags(&argc, &argv, true);
  return RUN_ALL_TESTS();
}
