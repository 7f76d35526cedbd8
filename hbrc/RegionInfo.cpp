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

#include "hbrc/RegionInfo.h"

#include "folly/Conv.h"
#include "folly/String.h"

namespace hbrc {

using folly::humanify;
using folly::to;

bool ParseRegionName(const string& region_name, string* table_out,
                     string* start_key_out) {
  const size_t first_comma = region_name.find(',');
  const size_t last_comma = region_name.rfind(',');
  if (first_comma == string::npos || first_comma == last_comma) {
    return false;
  }
  *table_out = region_name.substr(0, first_comma);
  *start_key_out = region_name.substr(first_comma + 1,
                                      last_comma - first_comma - 1);
  return true;
}

std::shared_ptr<const RegionInfo> RegionInfo::fromRegionName(
  const string& region_name, const string& stop_key) {
  string table;
  string start_key;
  if (!ParseRegionName(region_name, &table, &start_key)) {
    return std::shared_ptr<const RegionInfo>();
  }
  return std::make_shared<RegionInfo>(table, region_name, start_key,
                                            stop_key);
}

string RegionInfo::debugString() const {
  return to<string>(table, " [", humanify(start_key), ", ",
                    stop_key.empty() ? string("<end>") : humanify(stop_key),
                    ")");
}

}  // namespace hbrc
