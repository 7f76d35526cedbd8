/* Copyright 2012 Facebook, Inc.
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

// Cache of which RegionServer holds which rows.
//
// Per table, regions are kept ordered by start key; a row belongs to
// the region with the greatest start key not above it, provided the
// row is also below that region's stop key.  Nothing here talks to
// META: callers insert what they learn and remove what turns out to be
// stale.
//
// On the use of Mutexes: regions_mutex_ is taken before a table's
// map_mutex_, never after it.

#ifndef HBRC_SRC_REGIONCACHE_H
#define HBRC_SRC_REGIONCACHE_H

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "boost/noncopyable.hpp"

#include "hbrc/Counters.h"
#include "hbrc/RegionClient.h"
#include "hbrc/RegionInfo.h"

namespace hbrc {

using std::shared_ptr;
using std::string;

// What we know about a region: its key range and who serves it.
struct CachedRegion {
  CachedRegion(shared_ptr<const RegionInfo> region_in,
               shared_ptr<RegionClient> client_in)
      : region(region_in), client(client_in) { }

  const shared_ptr<const RegionInfo> region;
  const shared_ptr<RegionClient> client;
};

// map: start key -> region, with lock protection
class TableRegions : private boost::noncopyable {
public:
  /**
   * Add the region to the map, replacing whatever was cached for the
   * same start key.
   */
  void addRegion(shared_ptr<const CachedRegion> region);

  /**
   * Find the region holding this key.
   * @returns the region, otherwise NULL if not cached
   */
  shared_ptr<const CachedRegion> findRegion(const string& key) const;

  // Returns true if a region with this start key was cached.
  bool removeRegion(const string& start_key);

  size_t size() const;

private:
  mutable std::mutex map_mutex_;  // protect local map
  std::map<string, shared_ptr<const CachedRegion>> regions_;
};

class RegionCache : private boost::noncopyable {
public:
  explicit RegionCache(CounterBase* counters = NULL);

  /**
   * Find the cached region of table that contains key.
   *
   * @param table the table name
   * @param key row key; the empty key is the first row of the table
   * @returns the region and its client, or NULL on a miss
   */
  shared_ptr<const CachedRegion> lookup(const string& table,
                                        const string& key);

  /**
   * Cache region as being served by client.  A region already cached
   * with the same table and start key is replaced; other entries are
   * left alone, even if they overlap the new one.
   */
  void insert(shared_ptr<const RegionInfo> region,
              shared_ptr<RegionClient> client);

  /**
   * Forget the region of table starting at start_key, e.g. after the
   * server reported it as moved.
   *
   * @returns true if such a region was cached
   */
  bool remove(const string& table, const string& start_key);

  // Number of regions cached, over all tables.
  size_t size();

private:
  TableRegions* findTable(const string& table, bool create);

  CounterBase null_counters_;
  CounterBase* counters_;  // unowned

  std::mutex regions_mutex_;
  // map: table name -> TableRegions; entries are never removed
  std::unordered_map<string, std::unique_ptr<TableRegions>> regions_;
};

}  // namespace hbrc

#endif  // HBRC_SRC_REGIONCACHE_H
