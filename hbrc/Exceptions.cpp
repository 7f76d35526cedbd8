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

#include "hbrc/Exceptions.h"

#include <string.h>

#include <unordered_set>

#include "folly/Conv.h"
#include "folly/String.h"

namespace hbrc {

using folly::to;

RegionServerConnectionError::RegionServerConnectionError(
  const string& host, int port, const string& reason)
    : HbaseException() {
  message_ = folly::stringPrintf(
    "Could not connect to region server: %s:%d (%s)",
    host.c_str(), port, reason.c_str());
}

TransportError::TransportError(const string& message, int errno_value)
    : HbaseException(message), errno_(errno_value) {
  if (errno_ != 0) {
    message_ = to<string>(message, ": ", strerror(errno_));
  }
}

ShortWriteError::ShortWriteError(size_t expected, size_t written)
    : TransportError(to<string>("short write occurred while writing to "
                                "socket: wrote ", written, " of ", expected,
                                " bytes")) {
}

UnrecoverableError::UnrecoverableError(std::exception_ptr cause)
    : HbaseException(), cause_(cause) {
  message_ = to<string>("Unrecoverable error on region server connection: ",
                        describeException(cause));
}

RemoteException::RemoteException(const string& class_name,
                                 const string& stack_trace)
    : HbaseException(), class_name_(class_name), stack_trace_(stack_trace) {
  message_ = to<string>("HBase Java exception ", class_name, ": \n",
                        stack_trace);
}

bool isRetryableException(const string& class_name) {
  static const std::unordered_set<string> kRetryableExceptions = {
    "org.apache.hadoop.hbase.NotServingRegionException",
    "org.apache.hadoop.hbase.exceptions.RegionMovedException",
    "org.apache.hadoop.hbase.exceptions.RegionOpeningException",
  };
  return kRetryableExceptions.count(class_name) > 0;
}

std::exception_ptr makeRemoteException(const string& class_name,
                                       const string& stack_trace) {
  if (isRetryableException(class_name)) {
    return std::make_exception_ptr(RetryableError(class_name, stack_trace));
  }
  return std::make_exception_ptr(RemoteException(class_name, stack_trace));
}

string describeException(std::exception_ptr error) {
  if (!error) {
    return "no error";
  }
  try {
    std::rethrow_exception(error);
  }
  catch (const std::exception& e) {
    return e.what();
  }
}

}  // namespace hbrc
