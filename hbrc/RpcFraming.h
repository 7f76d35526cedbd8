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

// Encoding and decoding of the byte streams exchanged with a
// RegionServer.  Nothing here touches a socket.
//
// Connection preamble:
//   "HBas" | version (0) | auth method (0x50, simple) |
//   4-byte big-endian length | ConnectionHeader
//
// Request frame:
//   4-byte big-endian length of what follows |
//   1-byte RequestHeader length | RequestHeader |
//   varint parameter length | parameter
//
// Response frame (after its 4-byte big-endian length):
//   varint ResponseHeader length | ResponseHeader |
//   [varint response length | response]   (absent on exceptions)

#ifndef HBRC_SRC_RPCFRAMING_H
#define HBRC_SRC_RPCFRAMING_H

#include <stdint.h>

#include <string>

#include <google/protobuf/message.h>

#include "hbrc/protobuf/RPC.pb.h"

namespace hbrc {

using std::string;

extern const char kRpcMagic[4];
const uint8_t kRpcVersion = 0;
const uint8_t kSimpleAuth = 0x50;
const size_t kFrameLengthSize = 4;

// Refuse frames larger than this rather than trying to allocate them.
const uint32_t kMaxResponseFrameSize = 256 * 1024 * 1024;

/**
 * Append the connection preamble and ConnectionHeader to output.
 *
 * @param effective_user user the RegionServer should act as
 * @param service_name RPC service, normally "ClientService"
 * @param output where the bytes are appended
 */
void buildConnectionPreamble(const string& effective_user,
                             const string& service_name,
                             string* output);

/**
 * Append a complete request frame to output.  Throws
 * SerializationError if the header does not fit the one-byte length.
 *
 * @param call_id identifier the response will carry
 * @param method_name RegionServer method to invoke
 * @param payload the serialized request parameter
 * @param output where the frame is appended
 */
void buildRequestFrame(uint32_t call_id, const string& method_name,
                       const string& payload, string* output);

// Big-endian frame length helpers.
void appendFrameLength(uint32_t length, string* output);
uint32_t decodeFrameLength(const char* data);

/**
 * Parse the ResponseHeader at the front of a response frame (the
 * bytes following the frame length).
 *
 * @param frame the frame contents
 * @param header set to the parsed header
 * @param body_offset set to the offset of the response body
 * @returns false if the header is truncated or malformed
 */
bool parseResponseHeader(const string& frame, pb::ResponseHeader* header,
                         size_t* body_offset);

/**
 * Parse the delimited response body starting at offset.  An empty
 * remainder leaves response untouched.
 *
 * @returns false if the body is truncated or malformed
 */
bool parseResponseBody(const string& frame, size_t offset,
                       google::protobuf::Message* response);

}  // namespace hbrc

#endif  // HBRC_SRC_RPCFRAMING_H
