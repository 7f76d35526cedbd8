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

#include "hbrc/Call.h"

#include <glog/logging.h>

namespace hbrc {

Message* RpcResult::get() const {
  if (error) {
    std::rethrow_exception(error);
  }
  return response.get();
}

ResultSink::ResultSink()
    : delivered_(false), future_(promise_.get_future()) {
}

bool ResultSink::deliver(RpcResult result) {
  bool expected = false;
  if (!delivered_.compare_exchange_strong(expected, true)) {
    LOG(ERROR) << "Attempt to deliver a second result for an RPC; "
               << "dropping it (error: "
               << describeException(result.error) << ")";
    return false;
  }
  promise_.set_value(std::move(result));
  return true;
}

RpcResult ResultSink::wait() {
  return future_.get();
}

bool ResultSink::waitFor(std::chrono::milliseconds timeout,
                         RpcResult* output) {
  if (!future_.valid()) {
    LOG(ERROR) << "The result of this RPC was already taken";
    return false;
  }
  if (future_.wait_for(timeout) != std::future_status::ready) {
    return false;
  }
  *output = future_.get();
  return true;
}

}  // namespace hbrc
