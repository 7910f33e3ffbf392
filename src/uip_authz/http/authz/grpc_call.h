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
#include <memory>
#include <string>

#include "google/protobuf/stubs/status.h"
#include "src/uip_authz/http/authz/host.h"

namespace UipAuthz {
namespace Http {
namespace Authz {

class GrpcCall;
typedef std::unique_ptr<GrpcCall> GrpcCallPtr;

// One authorization call of a request, dispatched through the host.
class GrpcCall {
 public:
  virtual ~GrpcCall() {}

  /*
   * Dispatches the serialized FilterRequest. On success *token identifies
   * the pending call. Fails with FAILED_PRECONDITION while a call is pending.
   */
  virtual ::google::protobuf::util::Status Dispatch(const std::string& payload,
                                                    CallToken* token) = 0;

  /*
   * Records the completion of a call. Returns false if `token` is not the
   * pending call, in which case the completion must be ignored. While
   * Dispatch is on the stack any token of the pending call is accepted.
   */
  virtual bool Complete(CallToken token) = 0;

  /*
   * Cancel any in-flight call.
   */
  virtual void Cancel() = 0;

  virtual bool pending() const = 0;

  /*
   * Factory method for creating a GrpcCall.
   * @param host the host used to dispatch the call
   * @param target the target endpoint of the authorization service, copied
   * @return a GrpcCall instance
   */
  static GrpcCallPtr create(HostCallbacks& host, const std::string& target);

  static const std::string kServiceName;
  static const std::string kMethodName;
  static const std::chrono::milliseconds kTimeout;
};

}  // namespace Authz
}  // namespace Http
}  // namespace UipAuthz
