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

#include "hbrc/RegionClient.h"

#include <errno.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <string.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <glog/logging.h>

#include "folly/Conv.h"
#include "folly/GLog.h"
#include "folly/ScopeGuard.h"
#include "folly/String.h"

#include "hbrc/Exceptions.h"
#include "hbrc/RpcFraming.h"

DEFINE_int32(hbase_rpc_queue_size, 100,
             "number of queued RPCs per region server connection that "
             "triggers an immediate flush, rather than waiting for "
             "--hbase_flush_interval_ms");
DEFINE_int32(hbase_flush_interval_ms, 20,
             "maximum time, in ms, an RPC waits in the queue before being "
             "written to the region server");
DEFINE_string(hbase_effective_user, "hbrc",
              "user the region servers perform our RPCs as");
DEFINE_int32(hbase_rpc_send_timeout_ms, 60000,
             "timeout, in ms, for connecting and writing to region "
             "servers (0 for no timeout)");

using folly::to;
using std::chrono::duration_cast;
using std::chrono::microseconds;
using std::chrono::milliseconds;
using std::chrono::steady_clock;

std::ostream& operator<<(std::ostream& out,
                         const std::pair<std::string, int>& key) {
  out << key.first << ":" << key.second;
  return out;
}

namespace hbrc {

static const char* const kClientServiceName = "ClientService";

RegionClientOptions::RegionClientOptions()
    : queue_size(FLAGS_hbase_rpc_queue_size),
      flush_interval(FLAGS_hbase_flush_interval_ms),
      effective_user(FLAGS_hbase_effective_user),
      service_name(kClientServiceName),
      send_timeout_ms(FLAGS_hbase_rpc_send_timeout_ms) {
}

RegionClient::RegionClient(const string& host, int port,
                           const RegionClientOptions& options,
                           CounterBase* counters)
    : host_(host), port_(port), options_(options),
      counters_(counters ? counters : &null_counters_),
      fd_(-1), dead_(false), closing_(false), call_id_(0),
      flush_requested_(false), sent_rpcs_closed_(false) {
}

RegionClient::~RegionClient() {
  close();
  if (sender_.joinable()) {
    sender_.join();
  }
  if (receiver_.joinable()) {
    receiver_.join();
  }
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

bool RegionClient::connect() {
  CHECK(!sender_.joinable()) << "connect() called twice for "
                             << host_ << ":" << port_;
  if (dead_) {
    return false;
  }
  if (host_.empty()) {
    FB_LOG_EVERY_MS(ERROR, 1000) << "Request to connect to invalid host; "
                                 << "empty host specified?!";
    errorEncountered(std::make_exception_ptr(
      RegionServerConnectionError(host_, port_, "empty host")));
    return false;
  }
  if (port_ <= 0) {
    FB_LOG_EVERY_MS(ERROR, 1000) << "Invalid port for host " << host_;
    errorEncountered(std::make_exception_ptr(
      RegionServerConnectionError(host_, port_, "invalid port")));
    return false;
  }
  VLOG(1) << "Connecting to " << host_ << ":" << port_ << "...";

  try {
    fd_ = dial();
    string hello;
    buildConnectionPreamble(options_.effective_user, options_.service_name,
                            &hello);
    write(hello);
  }
  catch (const HbaseException& e) {
    LOG(ERROR) << "Unable to connect to " << host_ << ":" << port_ << ": "
               << e.what();
    errorEncountered(std::make_exception_ptr(
      RegionServerConnectionError(host_, port_, e.what())));
    return false;
  }

  sender_ = std::thread(&RegionClient::processRpcs, this);
  receiver_ = std::thread(&RegionClient::receiveRpcs, this);
  VLOG(1) << "done";
  return true;
}

void RegionClient::queueRpc(shared_ptr<Call> rpc) {
  CHECK(rpc);
  std::unique_lock<std::mutex> lock(rpcs_mutex_);
  if (send_err_) {
    const std::exception_ptr error = send_err_;
    lock.unlock();
    throw UnrecoverableError(error);
  }
  rpcs_.push_back(std::move(rpc));
  if (rpcs_.size() > options_.queue_size && !flush_requested_) {
    // The sender takes the whole queue in one swap when it wakes up,
    // so it never drains a queue that is being appended to.
    flush_requested_ = true;
    process_cv_.notify_one();
  }
  lock.unlock();
  counters_->incrementCounter("rpcs_queued");
}

void RegionClient::close() {
  if (dead_) {
    return;
  }
  VLOG(1) << "Closing connection to " << host_ << ":" << port_;
  closing_ = true;
  errorEncountered(std::make_exception_ptr(
    TransportError("Connection closed by the client")));
}

std::exception_ptr RegionClient::terminalError() {
  std::lock_guard<std::mutex> g(rpcs_mutex_);
  return send_err_;
}

void RegionClient::processRpcs() {
  vector<shared_ptr<Call>> rpcs;
  while (true) {
    {
      std::unique_lock<std::mutex> lock(rpcs_mutex_);
      // One wait covers both wake-up sources: the flush interval
      // elapsing, and a producer pushing the queue over its size.
      process_cv_.wait_for(lock, options_.flush_interval, [this] {
          return flush_requested_ || send_err_;
        });
      if (send_err_) {
        return;
      }
      flush_requested_ = false;
      rpcs.swap(rpcs_);
    }
    if (rpcs.empty()) {
      continue;
    }
    counters_->addHistogramValue("rpc_batch_size", rpcs.size());

    for (size_t i = 0; i < rpcs.size(); ++i) {
      const shared_ptr<Call>& rpc = rpcs[i];
      // Whoever queued this RPC has stopped waiting for it.
      if (rpc->isCancelled()) {
        counters_->incrementCounter("rpcs_skipped_cancelled");
        VLOG(2) << "Skipping cancelled " << rpc->methodName() << " RPC to "
                << host_ << ":" << port_;
        continue;
      }

      const uint32_t call_id = ++call_id_;
      string frame;
      try {
        string payload;
        rpc->serialize(&payload);
        buildRequestFrame(call_id, rpc->methodName(), payload, &frame);
      }
      catch (const std::exception& e) {
        counters_->incrementCounter("rpc_serialization_failures");
        LOG(ERROR) << "Failed to serialize " << rpc->methodName()
                   << " RPC to " << host_ << ":" << port_ << ": "
                   << e.what();
        rpc->resultSink()->deliver(RpcResult(std::make_exception_ptr(
          SerializationError(to<string>("Failed to serialize RPC: ",
                                        e.what())))));
        continue;
      }

      if (!registerRpc(call_id, rpc)) {
        failRemaining(&rpcs, i, std::make_exception_ptr(
          TransportError("Connection failed while sending")));
        return;
      }

      try {
        write(frame);
      }
      catch (const TransportError& e) {
        // If the RPC is no longer registered, it was already failed by
        // the receiver and must not be failed a second time.
        const size_t first = unregisterRpc(call_id) ? i : i + 1;
        failRemaining(&rpcs, first, std::current_exception());
        return;
      }
      counters_->incrementCounter("rpcs_sent");
      VLOG(2) << "Sent " << rpc->methodName() << " RPC, call ID " << call_id
              << ", to " << host_ << ":" << port_;
    }
    rpcs.clear();
  }
}

void RegionClient::failRemaining(vector<shared_ptr<Call>>* rpcs,
                                 size_t first, std::exception_ptr error) {
  {
    std::lock_guard<std::mutex> g(rpcs_mutex_);
    rpcs_.insert(rpcs_.begin(), rpcs->begin() + first, rpcs->end());
  }
  rpcs->clear();
  errorEncountered(error);
}

bool RegionClient::registerRpc(uint32_t call_id,
                               const shared_ptr<Call>& rpc) {
  std::lock_guard<std::mutex> g(sent_rpcs_mutex_);
  if (sent_rpcs_closed_ || dead_) {
    return false;
  }
  SentRpc& sent = sent_rpcs_[call_id];
  sent.rpc = rpc;
  sent.sent_time = steady_clock::now();
  return true;
}

bool RegionClient::unregisterRpc(uint32_t call_id) {
  std::lock_guard<std::mutex> g(sent_rpcs_mutex_);
  return sent_rpcs_.erase(call_id) > 0;
}

void RegionClient::receiveRpcs() {
  char length_buffer[kFrameLengthSize];
  string frame;
  try {
    while (true) {
      readFully(length_buffer, sizeof(length_buffer));
      const uint32_t length = decodeFrameLength(length_buffer);
      if (length > kMaxResponseFrameSize) {
        throw ProtocolError(to<string>("Response frame of ", length,
                                       " bytes is too large"));
      }
      frame.resize(length);
      readFully(&frame[0], length);
      handleResponse(frame);
    }
  }
  catch (const std::exception& e) {
    VLOG(1) << "Receiver for " << host_ << ":" << port_ << " stopping: "
            << e.what();
    errorEncountered(std::current_exception());
  }
}

void RegionClient::handleResponse(const string& frame) {
  pb::ResponseHeader header;
  size_t body_offset = 0;
  if (!parseResponseHeader(frame, &header, &body_offset)) {
    throw ProtocolError("Failed to deserialize the response header");
  }
  if (!header.has_call_id()) {
    LOG(ERROR) << "Response from " << host_ << ":" << port_
               << " doesn't have a call ID!";
    throw MissingCallIdError();
  }
  const uint32_t call_id = header.call_id();

  SentRpc sent;
  vector<uint32_t> outstanding;
  {
    std::lock_guard<std::mutex> g(sent_rpcs_mutex_);
    auto it = sent_rpcs_.find(call_id);
    if (it != sent_rpcs_.end()) {
      sent = std::move(it->second);
      sent_rpcs_.erase(it);
    } else {
      for (const auto& kv : sent_rpcs_) {
        outstanding.push_back(kv.first);
      }
    }
  }
  if (!sent.rpc) {
    LOG(ERROR) << "Received a response with an unexpected call ID "
               << call_id << " from " << host_ << ":" << port_;
    LOG(WARNING) << "Waiting for responses to the following calls: "
                 << folly::join(", ", outstanding);
    throw ProtocolError(to<string>(
      "HBase sent a response with an unexpected call ID: ", call_id));
  }

  counters_->incrementCounter("responses_received");
  counters_->addHistogramValue(
    "rpc_time_micros",
    duration_cast<microseconds>(steady_clock::now() - sent.sent_time).count());

  RpcResult result;
  if (header.has_exception()) {
    const pb::ExceptionResponse& exception = header.exception();
    result.error = makeRemoteException(exception.exception_class_name(),
                                       exception.stack_trace());
    if (isRetryableException(exception.exception_class_name())) {
      counters_->incrementCounter("retryable_errors");
    } else {
      counters_->incrementCounter("remote_exceptions");
    }
    VLOG(1) << "Call " << call_id << " (" << sent.rpc->methodName()
            << ") to " << host_ << ":" << port_ << " failed with "
            << exception.exception_class_name();
  } else {
    unique_ptr<Message> response;
    try {
      response = sent.rpc->newResponse();
    }
    catch (const std::exception& e) {
      LOG(ERROR) << "Failed to allocate the " << sent.rpc->methodName()
                 << " response for call " << call_id << ": " << e.what();
    }
    if (!response) {
      result.error = std::make_exception_ptr(SerializationError(
        "No response object for " + sent.rpc->methodName() + " call"));
    } else if (parseResponseBody(frame, body_offset, response.get())) {
      result.response = std::move(response);
    } else {
      LOG(ERROR) << "Failed to deserialize the " << sent.rpc->methodName()
                 << " response for call " << call_id << " from " << host_
                 << ":" << port_;
      result.error = std::make_exception_ptr(SerializationError(
        "Failed to deserialize " + sent.rpc->methodName() + " response"));
    }
  }
  sent.rpc->resultSink()->deliver(std::move(result));
}

void RegionClient::errorEncountered(std::exception_ptr error) {
  vector<shared_ptr<Call>> queued;
  std::exception_ptr terminal;
  bool first = false;
  {
    std::lock_guard<std::mutex> g(rpcs_mutex_);
    if (!send_err_) {
      send_err_ = error;
      dead_ = true;
      first = true;
    }
    terminal = send_err_;
    queued.swap(rpcs_);
    flush_requested_ = false;
  }
  process_cv_.notify_all();

  if (first) {
    counters_->incrementCounter("connection_failures");
    if (!closing_) {
      FB_LOG_EVERY_MS(ERROR, 1000)
        << "Connection to region server " << host_ << ":" << port_
        << " failed: " << describeException(terminal);
    }
  }

  vector<SentRpc> outstanding;
  {
    std::lock_guard<std::mutex> g(sent_rpcs_mutex_);
    sent_rpcs_closed_ = true;
    outstanding.reserve(sent_rpcs_.size());
    for (auto& kv : sent_rpcs_) {
      outstanding.push_back(std::move(kv.second));
    }
    sent_rpcs_.clear();
  }

  if (!queued.empty() || !outstanding.empty()) {
    VLOG(1) << "Failing " << queued.size() << " queued and "
            << outstanding.size() << " outstanding RPCs to " << host_ << ":"
            << port_;
  }
  const std::exception_ptr failure =
    std::make_exception_ptr(UnrecoverableError(terminal));
  for (auto& rpc : queued) {
    rpc->resultSink()->deliver(RpcResult(failure));
  }
  for (auto& sent : outstanding) {
    sent.rpc->resultSink()->deliver(RpcResult(failure));
  }

  // Wakes the receiver; the descriptor itself is closed by the
  // destructor once both threads are gone.
  if (first && fd_ >= 0) {
    ::shutdown(fd_, SHUT_RDWR);
  }
}

int RegionClient::dial() {
  struct addrinfo hints;
  memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  struct addrinfo* addrs = NULL;
  const string port = to<string>(port_);
  const int rc = getaddrinfo(host_.c_str(), port.c_str(), &hints, &addrs);
  if (rc != 0) {
    throw TransportError(to<string>("Unable to resolve ", host_, ": ",
                                    gai_strerror(rc)));
  }
  SCOPE_EXIT { freeaddrinfo(addrs); };

  int last_errno = 0;
  for (struct addrinfo* ai = addrs; ai != NULL; ai = ai->ai_next) {
    const int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC,
                            ai->ai_protocol);
    if (fd < 0) {
      last_errno = errno;
      continue;
    }
    if (options_.send_timeout_ms > 0) {
      // Linux applies SO_SNDTIMEO to connect() as well.
      struct timeval tv;
      tv.tv_sec = options_.send_timeout_ms / 1000;
      tv.tv_usec = (options_.send_timeout_ms % 1000) * 1000;
      if (setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
        PLOG(WARNING) << "Unable to set send timeout for " << host_ << ":"
                      << port_;
      }
    }
    const int one = 1;
    if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) != 0) {
      PLOG(WARNING) << "Unable to set TCP_NODELAY for " << host_ << ":"
                    << port_;
    }
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      return fd;
    }
    last_errno = errno;
    ::close(fd);
  }
  throw TransportError(to<string>("Failed to connect to the RegionServer at ",
                                  host_, ":", port_),
                       last_errno);
}

void RegionClient::write(const string& data) {
  ssize_t n;
  do {
    n = ::send(fd_, data.data(), data.size(), MSG_NOSIGNAL);
  } while (n < 0 && errno == EINTR);
  if (n < 0) {
    throw TransportError("Failed to write to the RegionServer", errno);
  }
  if (static_cast<size_t>(n) != data.size()) {
    throw ShortWriteError(data.size(), n);
  }
}

// Short reads are not retried: MSG_WAITALL only comes back early on
// EOF, error or signal, and all of those kill the connection.
void RegionClient::readFully(char* buffer, size_t length) {
  if (length == 0) {
    return;
  }
  ssize_t n;
  do {
    n = ::recv(fd_, buffer, length, MSG_WAITALL);
  } while (n < 0 && errno == EINTR);
  if (n < 0) {
    throw TransportError("Failed to read from the RegionServer", errno);
  }
  if (n == 0) {
    throw TransportError("RegionServer closed the connection");
  }
  if (static_cast<size_t>(n) != length) {
    throw TransportError(to<string>("Failed to read everything from the "
                                    "RegionServer: got ", n, " of ", length,
                                    " bytes"));
  }
}

RegionClient* makeRegionClient(const HostMapKey& key,
                               const RegionClientOptions& options,
                               CounterBase* counters) {
  std::unique_ptr<RegionClient> client(
    new RegionClient(key.first, key.second, options, counters));
  if (!client->connect()) {
    if (counters) {
      counters->incrementCounter("connect_failures");
    }
    LOG(ERROR) << "Connect to region server failed: " << key;
    return NULL;
  }
  return client.release();
}

}  // namespace hbrc
