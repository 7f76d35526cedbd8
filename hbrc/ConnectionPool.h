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

// A small templetized pool of shared connections.
//
// Region clients multiplex any number of callers over one socket, so
// the pool holds at most one live connection per key and hands out
// shared references to it.  A connection that reports itself
// unhealthy is dropped on the next lookup and replaced through the
// factory callback.  Callers still holding the dead one keep it alive
// until they let go.  See the test case for basic usage.

#ifndef HBRC_SRC_CONNECTIONPOOL_H
#define HBRC_SRC_CONNECTIONPOOL_H

#include <functional>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <unordered_map>
#include <utility>

#include "boost/noncopyable.hpp"

#include <glog/logging.h>

#include "folly/GLog.h"

#include "hbrc/Counters.h"

// This needs to be declared before the template below for clang (ADL
// rules, see http://clang.llvm.org/compatibility.html, somewhat
// complicated by 'const std::pair<std::string, int>' being the
// typedef target of HostMapKey).
std::ostream& operator<<(std::ostream& out,
                         const std::pair<std::string, int>& key);

namespace hbrc {

template<class Key, class Conn, class Hash = std::hash<Key>>
class ConnectionPool : private boost::noncopyable {
public:
  // Returns a connected Conn, or NULL on failure.  Ownership passes
  // to the pool.
  typedef std::function<Conn*(const Key&)> ConnectionFactory;

  explicit ConnectionPool(ConnectionFactory factory,
                          CounterBase* counters = NULL)
      : connection_factory_(factory),
        stats_counters_(counters) {
  }

  ~ConnectionPool() {
    std::lock_guard<std::mutex> g(connections_mutex_);
    VLOG(1) << "Clearing out " << connections_.size()
            << " entries in the connection pool.";
  }

  // Given a key, return the live connection for it, creating one if
  // there is none.  The factory runs without the lock held, so two
  // threads may both create a connection for the same key; the first
  // one stored wins and the other is thrown away.
  std::shared_ptr<Conn> lookup(const Key& key) {
    {
      std::lock_guard<std::mutex> g(connections_mutex_);
      auto p = connections_.find(key);
      if (p != connections_.end()) {
        if (p->second->isHealthy()) {
          incrementCounter("reused_connections");
          VLOG(1) << "Using already created connection for " << key;
          return p->second;
        }
        incrementCounter("discarded_connections");
        LOG(WARNING) << "Discarding unhealthy connection "
                     << p->second.get() << " for " << key;
        connections_.erase(p);
      }
    }

    std::shared_ptr<Conn> created(connection_factory_(key));
    if (!created) {
      FB_LOG_EVERY_MS(ERROR, 500)
        << "ConnectionPool factory failed to create connection for key:"
        << key;
      return std::shared_ptr<Conn>();
    }
    incrementCounter("created_connections");
    VLOG(1) << "Creating connection for " << key;

    std::lock_guard<std::mutex> g(connections_mutex_);
    auto inserted = connections_.insert(std::make_pair(key, created));
    if (!inserted.second) {
      if (inserted.first->second->isHealthy()) {
        VLOG(1) << "Lost the race to create a connection for " << key;
        return inserted.first->second;
      }
      inserted.first->second = created;
    }
    return created;
  }

  // Number of connections held, healthy or not.
  size_t size() {
    std::lock_guard<std::mutex> g(connections_mutex_);
    return connections_.size();
  }

 private:
  void incrementCounter(const std::string& name) {
    if (stats_counters_) {
      stats_counters_->incrementCounter(name);
    }
  }

  const ConnectionFactory connection_factory_;

  std::mutex connections_mutex_;
  std::unordered_map<Key, std::shared_ptr<Conn>, Hash> connections_;

  CounterBase* stats_counters_;  // unowned
};

}  // namespace hbrc

#endif  // HBRC_SRC_CONNECTIONPOOL_H
