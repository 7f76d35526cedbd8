/*
 * Copyright 2012 Facebook, Inc.
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

// Tests for Call, ResultSink and the exception helpers.

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <google/protobuf/wrappers.pb.h>

#include "hbrc/Call.h"
#include "hbrc/Exceptions.h"

#include <gflags/gflags.h>
#include <gtest/gtest.h>

namespace h = hbrc;
using google::protobuf::StringValue;
using std::chrono::milliseconds;
using std::string;

typedef h::ProtobufCall<StringValue, StringValue> StringCall;

static StringValue makeValue(const string& value) {
  StringValue ret;
  ret.set_value(value);
  return ret;
}

TEST(ResultSink, DeliversOnce) {
  h::ResultSink sink;
  EXPECT_FALSE(sink.delivered());
  std::unique_ptr<h::Message> response(new StringValue(makeValue("first")));
  EXPECT_TRUE(sink.deliver(h::RpcResult(std::move(response))));
  EXPECT_TRUE(sink.delivered());

  // The second result is dropped.
  EXPECT_FALSE(sink.deliver(h::RpcResult(
    std::make_exception_ptr(h::ProtocolError("late")))));

  h::RpcResult result = sink.wait();
  ASSERT_TRUE(result.ok());
  EXPECT_EQ("first", static_cast<StringValue*>(result.get())->value());
}

TEST(ResultSink, WaitForTimesOut) {
  h::ResultSink sink;
  h::RpcResult result;
  EXPECT_FALSE(sink.waitFor(milliseconds(10), &result));

  std::thread deliverer([&sink] {
      sink.deliver(h::RpcResult(
        std::make_exception_ptr(h::TransportError("gone"))));
    });
  EXPECT_TRUE(sink.waitFor(milliseconds(5000), &result));
  deliverer.join();
  EXPECT_FALSE(result.ok());
  EXPECT_THROW(result.get(), h::TransportError);
}

TEST(ResultSink, ResultIsTakenOnce) {
  h::ResultSink sink;
  std::unique_ptr<h::Message> response(new StringValue(makeValue("only")));
  sink.deliver(h::RpcResult(std::move(response)));

  h::RpcResult result;
  ASSERT_TRUE(sink.waitFor(milliseconds(10), &result));
  EXPECT_EQ("only", static_cast<StringValue*>(result.get())->value());

  h::RpcResult again;
  EXPECT_FALSE(sink.waitFor(milliseconds(10), &again));
  EXPECT_TRUE(again.response == nullptr);
  EXPECT_FALSE(again.error);
}

TEST(ResultSink, ConcurrentDeliveryKeepsOne) {
  for (int round = 0; round < 20; ++round) {
    h::ResultSink sink;
    std::atomic<int> accepted(0);
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
      threads.emplace_back([&sink, &accepted] {
          if (sink.deliver(h::RpcResult(
                std::make_exception_ptr(h::ProtocolError("x"))))) {
            ++accepted;
          }
        });
    }
    for (auto& t : threads) {
      t.join();
    }
    EXPECT_EQ(1, accepted.load());
  }
}

TEST(Call, Cancellation) {
  StringCall call("Get", makeValue("row"));
  EXPECT_FALSE(call.isCancelled());
  EXPECT_EQ("Get", call.methodName());
  call.cancel();
  EXPECT_TRUE(call.isCancelled());
}

TEST(Call, DeadlineCancels) {
  StringCall expired("Get", makeValue("row"),
                     h::Call::Clock::now() - milliseconds(1));
  EXPECT_TRUE(expired.isCancelled());

  StringCall pending("Get", makeValue("row"),
                     h::Call::Clock::now() + std::chrono::hours(1));
  EXPECT_FALSE(pending.isCancelled());
}

TEST(Call, ProtobufCall) {
  StringCall call("Scan", makeValue("payload"));
  string serialized;
  call.serialize(&serialized);
  StringValue parsed;
  ASSERT_TRUE(parsed.ParseFromString(serialized));
  EXPECT_EQ("payload", parsed.value());

  std::unique_ptr<h::Message> response = call.newResponse();
  ASSERT_TRUE(response != nullptr);
  EXPECT_EQ(StringValue::descriptor(), response->GetDescriptor());

  static_cast<StringValue*>(response.get())->set_value("answer");
  call.resultSink()->deliver(h::RpcResult(std::move(response)));
  std::unique_ptr<StringValue> result = call.waitForResponse();
  EXPECT_EQ("answer", result->value());
}

TEST(Call, ProtobufCallRethrows) {
  StringCall call("Get", makeValue("row"));
  call.resultSink()->deliver(h::RpcResult(h::makeRemoteException(
    "org.apache.hadoop.hbase.UnknownScannerException", "at Foo")));
  EXPECT_THROW(call.waitForResponse(), h::RemoteException);
}

TEST(Exceptions, RetryableClassification) {
  EXPECT_TRUE(h::isRetryableException(
    "org.apache.hadoop.hbase.NotServingRegionException"));
  EXPECT_TRUE(h::isRetryableException(
    "org.apache.hadoop.hbase.exceptions.RegionMovedException"));
  EXPECT_TRUE(h::isRetryableException(
    "org.apache.hadoop.hbase.exceptions.RegionOpeningException"));
  EXPECT_FALSE(h::isRetryableException(
    "org.apache.hadoop.hbase.UnknownScannerException"));
  EXPECT_FALSE(h::isRetryableException("NotServingRegionException"));
  EXPECT_FALSE(h::isRetryableException(""));
}

TEST(Exceptions, MakeRemoteException) {
  const string retryable = "org.apache.hadoop.hbase.NotServingRegionException";
  try {
    std::rethrow_exception(h::makeRemoteException(retryable, "trace"));
    FAIL() << "expected an exception";
  }
  catch (const h::RetryableError& e) {
    EXPECT_EQ(retryable, e.exceptionClassName());
    EXPECT_EQ("trace", e.stackTrace());
  }

  const string plain = "org.apache.hadoop.hbase.DoNotRetryIOException";
  try {
    std::rethrow_exception(h::makeRemoteException(plain, "trace"));
    FAIL() << "expected an exception";
  }
  catch (const h::RetryableError& e) {
    FAIL() << "not retryable: " << e.what();
  }
  catch (const h::RemoteException& e) {
    EXPECT_EQ(plain, e.exceptionClassName());
    EXPECT_NE(string::npos, string(e.what()).find(plain));
  }
}

TEST(Exceptions, UnrecoverableWrapsCause) {
  h::UnrecoverableError error(
    std::make_exception_ptr(h::ShortWriteError(10, 4)));
  EXPECT_THROW(std::rethrow_exception(error.cause()), h::ShortWriteError);
  EXPECT_NE(string::npos, h::describeException(error.cause()).find("4"));
  EXPECT_EQ("no error", h::describeException(std::exception_ptr()));
}

int main(int argc, char *argv[]) {
  testing::InitGoogleTest(&argc, argv);
  google::ParseCommandLineFlags(&argc, &argv, true);
  return RUN_ALL_TESTS();
}
