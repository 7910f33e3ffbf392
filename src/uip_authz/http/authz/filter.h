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

#include <string>

#include "google/protobuf/stubs/status.h"
#include "src/uip_authz/common/logger.h"
#include "src/uip_authz/http/authz/authz.pb.h"
#include "src/uip_authz/http/authz/decision.h"
#include "src/uip_authz/http/authz/filter_config.h"
#include "src/uip_authz/http/authz/grpc_call.h"
#include "src/uip_authz/http/authz/host.h"
#include "src/uip_authz/http/authz/observer.h"

namespace UipAuthz {
namespace Http {
namespace Authz {

// The authorization filter of one HTTP request. The host adapter creates one
// instance per request and routes the request events to it.
class Filter : public Logger::Loggable<Logger::Id::filter> {
 public:
  enum class State {
    // No request headers seen yet.
    Idle,
    // The authorization call is pending and the request is held.
    AwaitingAuthorization,
    // The request was forwarded upstream.
    Resumed,
    // The request was answered with a local reply.
    Rejected,
  };

  // `observer` may be null.
  Filter(FilterConfigSharedPtr config, HostCallbacks& host,
         RequestObserverSharedPtr observer);
  virtual ~Filter();

  // Request headers are available. Dispatches the authorization call and
  // holds the request, or lets it through if the call cannot be made.
  FilterHeadersStatus OnRequestHeaders();

  // Response headers are available. Attaches the policy message.
  FilterHeadersStatus OnResponseHeaders();

  // Completion of the authorization call identified by `token`.
  void OnAuthorizationReply(CallToken token, GrpcStatus status,
                            size_t body_size);

  // The stream was reset. Cancels a pending call.
  void OnDestroy();

  State state() const { return state_; }
  const RequestState& request_state() const { return request_state_; }

 protected:
  // Encodes the authorization request; a failure lets the request through.
  virtual ::google::protobuf::util::Status SerializeRequest(
      const ::authengine::FilterRequest& request, std::string* payload);

 private:
  // Lets the request through without authorization.
  FilterHeadersStatus PassThrough();
  void Allow(const Decision& decision);
  void Reject(const Decision& decision);

  void Observe(Checkpoint checkpoint);
  // Reports RequestEnd once.
  void Finish();

  FilterConfigSharedPtr config_;
  HostCallbacks& host_;
  RequestObserverSharedPtr observer_;
  GrpcCallPtr grpc_call_;

  State state_ = State::Idle;
  RequestState request_state_;

  // True while the call is being dispatched; a completion delivered inline
  // must not resume the request.
  bool initiating_call_ = false;
  // Mark if the stream has been reset.
  bool destroyed_ = false;
  bool started_ = false;
  bool finished_ = false;
};

const char* StateName(Filter::State state);

}  // namespace Authz
}  // namespace Http
}  // namespace UipAuthz
