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

// A Call is one RPC to a RegionServer.  Operation-specific layers
// (get, put, scan...) subclass Call to supply the method name, the
// serialized request and an empty response of the right type; the
// RegionClient only ever deals with this interface.
//
// Every Call owns a ResultSink.  The RegionClient writes exactly one
// RpcResult into it (a response, or an error), and the caller waits
// on it.

#ifndef HBRC_SRC_CALL_H
#define HBRC_SRC_CALL_H

#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <string>

#include "boost/noncopyable.hpp"

#include <google/protobuf/message.h>

#include "hbrc/Exceptions.h"

namespace hbrc {

using google::protobuf::Message;
using std::string;
using std::unique_ptr;

struct RpcResult {
  RpcResult() { }
  explicit RpcResult(unique_ptr<Message> response_in)
      : response(std::move(response_in)) { }
  explicit RpcResult(std::exception_ptr error_in) : error(error_in) { }

  bool ok() const { return !error; }

  // Rethrows the error, if any; otherwise returns the response.
  Message* get() const;

  unique_ptr<Message> response;
  std::exception_ptr error;
};

// Single-slot, single-use channel between the RegionClient (writer)
// and the thread waiting for the RPC (reader).
class ResultSink : private boost::noncopyable {
 public:
  ResultSink();

  /**
   * Store the result of the RPC and wake the waiter.
   *
   * @returns false, dropping the result, if a result was already
   *          delivered
   */
  bool deliver(RpcResult result);

  bool delivered() const { return delivered_.load(); }

  /// Block until the result is delivered; may only be called once.
  RpcResult wait();

  /**
   * Wait up to timeout for the result. Like wait(), a result can only
   * be taken once.
   *
   * @returns false if nothing was delivered in time, or if the result
   *          was already taken
   */
  bool waitFor(std::chrono::milliseconds timeout, RpcResult* output);

 private:
  std::atomic<bool> delivered_;
  std::promise<RpcResult> promise_;
  std::future<RpcResult> future_;
};

class Call : private boost::noncopyable {
 public:
  typedef std::chrono::steady_clock Clock;
  typedef Clock::time_point Deadline;

  explicit Call(Deadline deadline = Deadline::max())
      : deadline_(deadline), cancelled_(false) { }
  virtual ~Call() { }

  /// Name of the RegionServer method, e.g. "Get" or "Mutate".
  virtual const string& methodName() const = 0;

  /// Serialize the request parameter into output; throws on failure.
  virtual void serialize(string* output) const = 0;

  /// An empty instance of the response message for this RPC.
  virtual unique_ptr<Message> newResponse() const = 0;

  // The caller gave up on this RPC.  A call cancelled before it is
  // written to the wire is dropped; one cancelled afterwards still
  // gets its result.
  void cancel() { cancelled_ = true; }
  bool isCancelled() const {
    return cancelled_.load() || Clock::now() >= deadline_;
  }
  Deadline deadline() const { return deadline_; }

  ResultSink* resultSink() { return &result_sink_; }

 private:
  const Deadline deadline_;
  std::atomic<bool> cancelled_;
  ResultSink result_sink_;
};

// A Call for a protobuf request/response pair.
template<class Request, class Response>
class ProtobufCall : public Call {
 public:
  ProtobufCall(const string& method_name, const Request& request,
               Deadline deadline = Deadline::max())
      : Call(deadline), method_name_(method_name), request_(request) { }

  const string& methodName() const { return method_name_; }

  void serialize(string* output) const {
    if (!request_.SerializeToString(output)) {
      throw SerializationError("Failed to serialize " + method_name_ +
                               " request: " +
                               request_.InitializationErrorString());
    }
  }

  unique_ptr<Message> newResponse() const {
    return unique_ptr<Message>(new Response);
  }

  const Request& request() const { return request_; }

  // Blocks until the RPC completes; rethrows any error.
  unique_ptr<Response> waitForResponse() {
    RpcResult result = resultSink()->wait();
    if (result.error) {
      std::rethrow_exception(result.error);
    }
    return unique_ptr<Response>(
      static_cast<Response*>(result.response.release()));
  }

 private:
  const string method_name_;
  const Request request_;
};

}  // namespace hbrc

#endif  // HBRC_SRC_CALL_H
