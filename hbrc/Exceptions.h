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

// Exceptions thrown by, or delivered through, the region client.
//
// There are four families of failures:
//
//  - UnrecoverableError: the connection to the RegionServer is dead.
//    Every queued and outstanding RPC on that connection receives one,
//    wrapping the error that killed the connection (a TransportError or
//    a ProtocolError).  The connection must be rebuilt.
//  - RetryableError: the RegionServer reported a transient condition
//    (region moved, not serving, still opening).  Only the one RPC is
//    affected; the caller may resend it, possibly elsewhere.
//  - RemoteException: any other exception reported by the RegionServer.
//  - SerializationError: a single RPC could not be encoded or its
//    response decoded.  The connection is unaffected.

#ifndef HBRC_SRC_EXCEPTIONS_H
#define HBRC_SRC_EXCEPTIONS_H

#include <exception>
#include <string>

namespace hbrc {

using std::string;

class HbaseException : public std::exception {
public:
  HbaseException() { }
  explicit HbaseException(const string& message) : message_(message) { }
  virtual ~HbaseException() throw() { }
  virtual const char* what() const throw() {
    return message_.c_str();
  }

protected:
  string message_;
};

class RegionServerConnectionError : public HbaseException {
public:
  RegionServerConnectionError(const string& host, int port,
                              const string& reason);
};

// A socket level failure.  errno_value is 0 when the failure did not
// come from a system call (for instance, the peer closed the socket).
class TransportError : public HbaseException {
public:
  explicit TransportError(const string& message, int errno_value = 0);
  int errnoValue() const { return errno_; }

private:
  int errno_;
};

class ShortWriteError : public TransportError {
public:
  ShortWriteError(size_t expected, size_t written);
};

// The RegionServer sent something we cannot make sense of.
class ProtocolError : public HbaseException {
public:
  explicit ProtocolError(const string& message) : HbaseException(message) { }
};

class MissingCallIdError : public ProtocolError {
public:
  MissingCallIdError()
      : ProtocolError("HBase responded without a call ID") { }
};

class UnrecoverableError : public HbaseException {
public:
  explicit UnrecoverableError(std::exception_ptr cause);

  // The error that terminated the connection.
  std::exception_ptr cause() const { return cause_; }

private:
  std::exception_ptr cause_;
};

class SerializationError : public HbaseException {
public:
  explicit SerializationError(const string& message)
      : HbaseException(message) { }
};

class RemoteException : public HbaseException {
public:
  RemoteException(const string& class_name, const string& stack_trace);

  const string& exceptionClassName() const { return class_name_; }
  const string& stackTrace() const { return stack_trace_; }

private:
  string class_name_;
  string stack_trace_;
};

class RetryableError : public RemoteException {
public:
  RetryableError(const string& class_name, const string& stack_trace)
      : RemoteException(class_name, stack_trace) { }
};

// Returns true if a RegionServer exception of this Java class means
// the RPC should be sent again.
bool isRetryableException(const string& class_name);

// Builds a RetryableError or a RemoteException for an exception
// reported by the RegionServer.
std::exception_ptr makeRemoteException(const string& class_name,
                                       const string& stack_trace);

// what() of the exception held by error, for logging.
string describeException(std::exception_ptr error);

}  // namespace hbrc

#endif  // HBRC_SRC_EXCEPTIONS_H
