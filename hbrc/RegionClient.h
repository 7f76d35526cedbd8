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

// A RegionClient is the one connection we keep to a RegionServer.  Any
// number of threads may queue RPCs on it; two threads owned by the
// client do the I/O:
//
//  - the sender wakes up every flush interval, or as soon as the queue
//    grows past the configured size, takes the whole queue, and writes
//    each RPC to the socket after assigning it a call ID;
//  - the receiver reads one response frame at a time and completes the
//    RPC whose call ID it carries.
//
// Responses may come back in any order.  The first socket or protocol
// error kills the connection for good: every RPC still queued or
// waiting for a response fails with an UnrecoverableError, and so does
// every later queueRpc().  Callers build a new RegionClient.
//
// On the use of Mutexes: rpcs_mutex_ guards the queue and the terminal
// error, sent_rpcs_mutex_ guards the calls awaiting a response.  They
// are never held at the same time.

#ifndef HBRC_SRC_REGIONCLIENT_H
#define HBRC_SRC_REGIONCLIENT_H

#include <stdint.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "boost/noncopyable.hpp"

#include <gflags/gflags.h>

#include "folly/hash/Hash.h"

#include "hbrc/Call.h"
#include "hbrc/ConnectionPool.h"
#include "hbrc/Counters.h"

DECLARE_int32(hbase_rpc_queue_size);
DECLARE_int32(hbase_flush_interval_ms);
DECLARE_string(hbase_effective_user);
DECLARE_int32(hbase_rpc_send_timeout_ms);

namespace hbrc {

using std::shared_ptr;
using std::string;
using std::vector;

struct RegionClientOptions {
  // Defaults come from the --hbase_* flags.
  RegionClientOptions();

  // Flush as soon as more than this many RPCs are queued.
  size_t queue_size;
  // Longest an RPC waits in the queue before being written.
  std::chrono::milliseconds flush_interval;
  string effective_user;
  string service_name;
  // Bounds connect() and every write; 0 for no limit.
  int send_timeout_ms;
};

class RegionClient : private boost::noncopyable {
public:
  RegionClient(const string& host, int port,
               const RegionClientOptions& options = RegionClientOptions(),
               CounterBase* counters = NULL);

  // Fails whatever is still outstanding and stops both threads.
  ~RegionClient();

  /**
   * Dial the RegionServer, send the connection preamble and start the
   * sender and receiver threads.
   *
   * @returns true if successful; on failure the client is dead
   */
  bool connect();

  /**
   * Queue an RPC to be sent.  Its result is delivered to
   * rpc->resultSink().
   *
   * Throws UnrecoverableError, without queueing, if the connection is
   * already dead.
   */
  void queueRpc(shared_ptr<Call> rpc);

  /**
   * Kill the connection: every queued and outstanding RPC fails with
   * an UnrecoverableError.  No-op if already dead.
   */
  void close();

  const string& host() const { return host_; }
  int port() const { return port_; }
  bool isHealthy() const { return !dead_.load(); }

  // The error that killed the connection, or null while healthy.
  std::exception_ptr terminalError();

private:
  struct SentRpc {
    shared_ptr<Call> rpc;
    std::chrono::steady_clock::time_point sent_time;
  };

  // Sender thread.
  void processRpcs();
  // Receiver thread.
  void receiveRpcs();

  void handleResponse(const string& frame);

  // Put rpcs[first..] back at the front of the queue and kill the
  // connection; they are failed along with everything else.
  void failRemaining(vector<shared_ptr<Call>>* rpcs, size_t first,
                     std::exception_ptr error);

  // Deliver the terminal error to everything queued or outstanding
  // and shut the socket down.  The first error recorded wins.
  void errorEncountered(std::exception_ptr error);

  // Returns false if the connection died underneath us.
  bool registerRpc(uint32_t call_id, const shared_ptr<Call>& rpc);
  // Returns false if the call was already completed elsewhere.
  bool unregisterRpc(uint32_t call_id);

  int dial();
  void write(const string& data);
  void readFully(char* buffer, size_t length);

  const string host_;
  const int port_;
  const RegionClientOptions options_;
  CounterBase null_counters_;
  CounterBase* counters_;  // unowned

  int fd_;
  std::atomic<bool> dead_;
  std::atomic<bool> closing_;  // close() was called
  std::thread sender_;
  std::thread receiver_;

  uint32_t call_id_;  // only touched by the sender

  std::mutex rpcs_mutex_;
  std::condition_variable process_cv_;
  vector<shared_ptr<Call>> rpcs_;
  bool flush_requested_;
  std::exception_ptr send_err_;

  std::mutex sent_rpcs_mutex_;
  std::unordered_map<uint32_t, SentRpc> sent_rpcs_;
  bool sent_rpcs_closed_;
};

// pair of host, port
typedef std::pair<string, int> HostMapKey;

// one live RegionClient per RegionServer
typedef ConnectionPool<HostMapKey, RegionClient, folly::hasher<HostMapKey>>
  RegionClientPool;

/**
 * Connect to host:port with the given options.  Intended as the
 * factory of a RegionClientPool.
 *
 * @returns the connected client, or NULL if the connection failed
 */
RegionClient* makeRegionClient(const HostMapKey& key,
                               const RegionClientOptions& options,
                               CounterBase* counters);

}  // namespace hbrc

#endif  // HBRC_SRC_REGIONCLIENT_H
