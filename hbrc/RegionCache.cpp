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

#include "hbrc/RegionCache.h"

#include <glog/logging.h>

#include "folly/String.h"

using folly::humanify;

namespace hbrc {

void TableRegions::addRegion(shared_ptr<const CachedRegion> region) {
  std::lock_guard<std::mutex> lock(map_mutex_);
  regions_[region->region->start_key] = region;
}

shared_ptr<const CachedRegion>
TableRegions::findRegion(const string& key) const {
  std::lock_guard<std::mutex> lock(map_mutex_);
  // upper_bound is the first region starting after key; the one
  // before it, if any, is the only candidate.
  auto iter = regions_.upper_bound(key);
  if (iter == regions_.begin()) {
    return shared_ptr<const CachedRegion>();
  }
  --iter;
  if (iter->second->region->contains(key)) {
    return iter->second;
  }
  return shared_ptr<const CachedRegion>();
}

bool TableRegions::removeRegion(const string& start_key) {
  std::lock_guard<std::mutex> lock(map_mutex_);
  return regions_.erase(start_key) > 0;
}

size_t TableRegions::size() const {
  std::lock_guard<std::mutex> lock(map_mutex_);
  return regions_.size();
}

RegionCache::RegionCache(CounterBase* counters)
    : counters_(counters ? counters : &null_counters_) {
}

TableRegions* RegionCache::findTable(const string& table, bool create) {
  std::lock_guard<std::mutex> g(regions_mutex_);
  auto it = regions_.find(table);
  if (it != regions_.end()) {
    return it->second.get();
  }
  if (!create) {
    return NULL;
  }
  TableRegions* table_entry = new TableRegions;
  regions_[table].reset(table_entry);
  return table_entry;
}

shared_ptr<const CachedRegion> RegionCache::lookup(const string& table,
                                                   const string& key) {
  TableRegions* table_entry = findTable(table, false);
  shared_ptr<const CachedRegion> ret;
  if (table_entry) {
    ret = table_entry->findRegion(key);
  }

  if (!ret) {
    counters_->incrementCounter("cache_misses");
    VLOG(1) << "Cache miss finding region for " << table << " row "
            << humanify(key);
    return ret;
  }
  counters_->incrementCounter("cache_hits");
  VLOG(1) << "Cache hit finding region for " << table << " row "
          << humanify(key) << " (region range is "
          << humanify(ret->region->start_key) << "-"
          << humanify(ret->region->stop_key) << ")";
  return ret;
}

void RegionCache::insert(shared_ptr<const RegionInfo> region,
                         shared_ptr<RegionClient> client) {
  CHECK(region);
  TableRegions* table_entry = findTable(region->table, true);
  VLOG(1) << "Caching region " << region->debugString() << " on "
          << (client ? client->host() : string("<none>")) << ":"
          << (client ? client->port() : 0);
  table_entry->addRegion(std::make_shared<CachedRegion>(region, client));
  counters_->incrementCounter("regions_inserted");
}

bool RegionCache::remove(const string& table, const string& start_key) {
  TableRegions* table_entry = findTable(table, false);
  if (!table_entry || !table_entry->removeRegion(start_key)) {
    return false;
  }
  VLOG(1) << "Removed region of " << table << " starting at "
          << humanify(start_key);
  counters_->incrementCounter("regions_removed");
  return true;
}

size_t RegionCache::size() {
  std::lock_guard<std::mutex> g(regions_mutex_);
  size_t total = 0;
  for (const auto& kv : regions_) {
    total += kv.second->size();
  }
  return total;
}

}  // namespace hbrc
