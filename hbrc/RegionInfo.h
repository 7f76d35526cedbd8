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

#ifndef HBRC_SRC_REGIONINFO_H
#define HBRC_SRC_REGIONINFO_H

#include <memory>
#include <string>

#include "boost/noncopyable.hpp"

namespace hbrc {

using std::string;

// A contiguous range of rows of one table: [start_key, stop_key).  An
// empty stop_key means the region runs to the end of the table.  This
// class is basically just a struct; it is immutable.
class RegionInfo : private boost::noncopyable {
public:
  RegionInfo(const string& table_in, const string& region_name_in,
             const string& start_key_in, const string& stop_key_in)
      : table(table_in), region_name(region_name_in),
        start_key(start_key_in), stop_key(stop_key_in) { }

  /**
   * Build a RegionInfo from a region name as stored in META, e.g.
   * "table,start_key,1234567890042.56f833d5569a27c7a43fbf547b4924a4.".
   *
   * @param region_name the full region name
   * @param stop_key the region's (exclusive) stop key
   * @returns the region, or NULL if region_name is malformed
   */
  static std::shared_ptr<const RegionInfo> fromRegionName(
    const string& region_name, const string& stop_key);

  bool contains(const string& key) const {
    return key >= start_key && (stop_key.empty() || key < stop_key);
  }

  // table [start, stop) with binary keys escaped.
  string debugString() const;

  const string table;
  const string region_name;
  const string start_key;
  const string stop_key;
};

// Split a region name into its table and start key.  The start key
// may itself contain commas; the table is everything before the first
// comma and the region id everything after the last one.  Returns
// false if the name has fewer than two commas.
bool ParseRegionName(const string& region_name, string* table_out,
                     string* start_key_out);

}  // namespace hbrc

#endif  // HBRC_SRC_REGIONINFO_H
