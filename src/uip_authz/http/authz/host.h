/* Copyright 2017 Istio Authors. All Rights Reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *    http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "google/protobuf/stubs/status.h"

namespace UipAuthz {
namespace Http {
namespace Authz {

// Header name/value pairs in host order. Pseudo-headers keep their leading
// colon, e.g. {":path", "/v1/items"}.
typedef std::vector<std::pair<std::string, std::string>> HeaderPairs;

// Correlation token of a dispatched gRPC call.
typedef uint32_t CallToken;

// Returned from the request headers hook.
enum class FilterHeadersStatus {
  // Forward the request to the next filter.
  Continue,
  // Hold the request until the filter resumes or rejects it.
  StopIteration,
};

// gRPC status code reported with a call completion. 0 is OK.
typedef uint32_t GrpcStatus;
const GrpcStatus kGrpcStatusOk = 0;

// The services the host runtime provides to one filter instance. The host
// adapter implements this once per request and routes its events to the
// filter.
class HostCallbacks {
 public:
  virtual ~HostCallbacks() {}

  // The request headers, pseudo-headers included.
  virtual HeaderPairs GetRequestHeaders() const = 0;

  // Sets a request header, replacing any existing value.
  virtual void SetRequestHeader(const std::string& name,
                                const std::string& value) = 0;

  // Sets a response header, replacing any existing value.
  virtual void SetResponseHeader(const std::string& name,
                                 const std::string& value) = 0;

  // Continues a request held by FilterHeadersStatus::StopIteration.
  virtual void ResumeRequest() = 0;

  // Terminates the request with a locally generated response.
  virtual void SendLocalReply(int code, const std::string& body,
                              const HeaderPairs& headers) = 0;

  // Starts a gRPC call without blocking. On success *token identifies the
  // call and exactly one completion carrying it will be delivered later.
  // The completion may also be delivered before this returns, in which case
  // *token may still be unwritten when it arrives.
  virtual ::google::protobuf::util::Status DispatchGrpcCall(
      const std::string& target, const std::string& service,
      const std::string& method, const std::string& payload,
      std::chrono::milliseconds timeout, CallToken* token) = 0;

  // Copies the first `size` bytes of the current call response into *body.
  // Returns false if no body is available.
  virtual bool GetGrpcCallResponseBody(size_t size, std::string* body) = 0;

  // Cancels an in-flight call; its completion will not be delivered.
  virtual void CancelGrpcCall(CallToken token) = 0;
};

}  // namespace Authz
}  // namespace Http
}  // namespace UipAuthz
