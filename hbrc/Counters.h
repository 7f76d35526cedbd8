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

// Stats tracking for the region client.  CounterBase is the interface
// (and a no-op implementation, used when the caller does not care
// about stats); SimpleCounter keeps everything in a mutex-protected
// hash map.  Exporting stats elsewhere is up to subclasses.
//
// Counters bumped by the library:
//
//   RegionClient:  rpcs_queued, rpcs_sent, rpcs_skipped_cancelled,
//                  rpc_serialization_failures, responses_received,
//                  retryable_errors, remote_exceptions,
//                  connection_failures
//   RegionCache:   cache_hits, cache_misses, regions_inserted,
//                  regions_removed
//   ConnectionPool: created_connections, reused_connections,
//                  discarded_connections, connect_failures
//
// and the histograms rpc_batch_size and rpc_time_micros.

#ifndef HBRC_SRC_COUNTERS_H
#define HBRC_SRC_COUNTERS_H

#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "boost/noncopyable.hpp"

#include "folly/String.h"
#include "folly/stats/Histogram.h"

namespace hbrc {

using std::map;
using std::string;
using std::unordered_map;

typedef folly::Histogram<int64_t> CounterHistogram;

class CounterBase : private boost::noncopyable {
 public:
  // Counters may or may not have prefixes; if specified, the prefix
  // is prepended to every value when snapshotted and should *not* be
  // part of the "counter" to increment via incrementCounter.
  explicit CounterBase(const string& prefix) : prefix_(prefix) { }
  CounterBase() { }
  virtual ~CounterBase() { }

  const string fieldName(const string& field) const {
    if (prefix_.empty()) {
      return field;
    }
    return prefix_ + "_" + field;
  }

  virtual void incrementCounter(const string& counter, int64_t incr = 1) { }
  virtual void addHistogramValue(const string& counter, int64_t value) { }
  virtual int64_t getCounter(const string& counter) const { return 0; }

  virtual void snapshot(map<string, int64_t>* output,
                        map<string, string>* output_buckets) { }

 private:
  const string prefix_;
};

class SimpleCounter : public CounterBase {
 public:
  explicit SimpleCounter(const string& prefix) : CounterBase(prefix) {
    init();
  }
  SimpleCounter() : CounterBase() { init(); }
  virtual ~SimpleCounter() { }

  void init() {
    addHistogram("rpc_batch_size", 8, 0, 1024);
    addHistogram("rpc_time_micros", 1000, 0, 1000 * 1000);
  }

  void addHistogram(const string& key, int bucket_width, int lower,
                    int upper) {
    std::lock_guard<std::mutex> lock(mutex_);
    histogram_stats_[key].reset(
      new CounterHistogram(bucket_width, lower, upper));
  }

  virtual void incrementCounter(const string& counter, int64_t incr = 1) {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_[counter] += incr;
  }

  virtual void addHistogramValue(const string& counter, int64_t value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = histogram_stats_.find(counter);
    if (it != histogram_stats_.end()) {
      it->second->addValue(value);
    }
  }

  virtual int64_t getCounter(const string& counter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stats_.find(counter);
    return it == stats_.end() ? 0 : it->second;
  }

  virtual void snapshot(map<string, int64_t>* output,
                        map<string, string>* output_buckets) {
    std::lock_guard<std::mutex> lock(mutex_);

    output->clear();
    output_buckets->clear();
    for (auto& kv : stats_) {
      output->insert(make_pair(fieldName(kv.first), kv.second));
    }
    for (auto& kv : histogram_stats_) {
      const string field_name = fieldName(kv.first);
      const CounterHistogram* h = kv.second.get();

      // Percentiles are plain numbers, so they go to output.
      output->insert(make_pair(field_name + ".p50",
                               h->getPercentileEstimate(0.50)));
      output->insert(make_pair(field_name + ".p99",
                               h->getPercentileEstimate(0.99)));

      string bucket_string;
      for (size_t i = 0; i < h->getNumBuckets(); ++i) {
        const auto& bucket = h->getBucketByIndex(i);
        if (bucket.count == 0) {
          continue;
        }
        if (!bucket_string.empty()) bucket_string += ",";
        int64_t bucket_min = std::numeric_limits<int64_t>::min();
        if (i > 0) {
          bucket_min = h->getMin() + (i - 1) * h->getBucketSize();
        }
        folly::stringAppendf(&bucket_string, "%ld:%ld",
                             static_cast<long>(bucket_min),
                             static_cast<long>(bucket.count));
      }
      output_buckets->insert(make_pair(field_name, bucket_string));
    }
  }

 private:
  mutable std::mutex mutex_;
  unordered_map<string, int64_t> stats_;
  unordered_map<string, std::unique_ptr<CounterHistogram>> histogram_stats_;
};

}  // namespace hbrc

#endif  // HBRC_SRC_COUNTERS_H
