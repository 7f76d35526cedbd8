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

#include "hbrc/RpcFraming.h"

#include <string.h>

#include <limits>

#include <google/protobuf/io/coded_stream.h>

#include "folly/Conv.h"
#include "folly/lang/Bits.h"

#include "hbrc/Exceptions.h"

namespace hbrc {

using folly::Endian;
using folly::to;
using google::protobuf::io::CodedInputStream;
using google::protobuf::io::CodedOutputStream;

const char kRpcMagic[4] = { 'H', 'B', 'a', 's' };

namespace {

// Largest RequestHeader whose length is a single varint byte.
const size_t kMaxRequestHeaderSize = 0x7f;
const int kMaxVarint32Bytes = 5;

const uint8_t* asBytes(const char* data) {
  return reinterpret_cast<const uint8_t*>(data);
}

}  // namespace

void appendFrameLength(uint32_t length, string* output) {
  const uint32_t big_endian = Endian::big32(length);
  output->append(reinterpret_cast<const char*>(&big_endian),
                 sizeof(big_endian));
}

uint32_t decodeFrameLength(const char* data) {
  uint32_t big_endian;
  memcpy(&big_endian, data, sizeof(big_endian));
  return Endian::big32(big_endian);
}

void buildConnectionPreamble(const string& effective_user,
                             const string& service_name,
                             string* output) {
  pb::ConnectionHeader header;
  header.mutable_user_info()->set_effective_user(effective_user);
  header.set_service_name(service_name);

  string data;
  if (!header.SerializeToString(&data)) {
    throw SerializationError("Failed to serialize connection header");
  }

  output->append(kRpcMagic, sizeof(kRpcMagic));
  output->push_back(static_cast<char>(kRpcVersion));
  output->push_back(static_cast<char>(kSimpleAuth));
  appendFrameLength(data.size(), output);
  output->append(data);
}

void buildRequestFrame(uint32_t call_id, const string& method_name,
                       const string& payload, string* output) {
  pb::RequestHeader header;
  header.set_call_id(call_id);
  header.set_method_name(method_name);
  header.set_request_param(true);

  string header_data;
  if (!header.SerializeToString(&header_data)) {
    throw SerializationError("Failed to serialize request header for " +
                             method_name);
  }
  if (header_data.size() > kMaxRequestHeaderSize) {
    throw SerializationError(
      to<string>("Request header for ", method_name, " is ",
                 header_data.size(), " bytes, at most ",
                 kMaxRequestHeaderSize, " fit in a request frame"));
  }

  uint8_t payload_length[kMaxVarint32Bytes];
  const uint8_t* payload_length_end = CodedOutputStream::WriteVarint32ToArray(
    static_cast<uint32_t>(payload.size()), payload_length);
  const size_t payload_length_size = payload_length_end - payload_length;

  const uint64_t total = 1 + header_data.size() + payload_length_size +
    payload.size();
  if (total > std::numeric_limits<uint32_t>::max()) {
    throw SerializationError(
      to<string>("Request for ", method_name, " is too large: ", total,
                 " bytes"));
  }

  output->reserve(output->size() + kFrameLengthSize + total);
  appendFrameLength(static_cast<uint32_t>(total), output);
  output->push_back(static_cast<char>(header_data.size()));
  output->append(header_data);
  output->append(reinterpret_cast<const char*>(payload_length),
                 payload_length_size);
  output->append(payload);
}

bool parseResponseHeader(const string& frame, pb::ResponseHeader* header,
                         size_t* body_offset) {
  CodedInputStream in(asBytes(frame.data()), static_cast<int>(frame.size()));
  uint32_t header_length;
  if (!in.ReadVarint32(&header_length)) {
    return false;
  }
  const CodedInputStream::Limit limit = in.PushLimit(header_length);
  // A header running past the end of the frame leaves bytes before the
  // limit unread.
  if (!header->ParseFromCodedStream(&in) || in.BytesUntilLimit() != 0) {
    return false;
  }
  in.PopLimit(limit);
  *body_offset = in.CurrentPosition();
  return true;
}

bool parseResponseBody(const string& frame, size_t offset,
                       google::protobuf::Message* response) {
  if (offset >= frame.size()) {
    return offset == frame.size();
  }
  const size_t remaining = frame.size() - offset;
  CodedInputStream in(asBytes(frame.data() + offset),
                      static_cast<int>(remaining));
  uint32_t body_length;
  if (!in.ReadVarint32(&body_length)) {
    return false;
  }
  if (in.CurrentPosition() + static_cast<size_t>(body_length) > remaining) {
    return false;
  }
  const CodedInputStream::Limit limit = in.PushLimit(body_length);
  const bool ok = response->ParseFromCodedStream(&in) &&
    in.BytesUntilLimit() == 0;
  in.PopLimit(limit);
  return ok;
}

}  // namespace hbrc
