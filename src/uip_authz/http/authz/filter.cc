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

#include "src/uip_authz/http/authz/filter.h"

#include <utility>

#include "absl/strings/match.h"
#include "src/uip_authz/http/authz/header_names.h"
#include "src/uip_authz/http/authz/header_transformer.h"
#include "src/uip_authz/http/authz/request_builder.h"

using ::google::protobuf::util::Status;

namespace UipAuthz {
namespace Http {
namespace Authz {
namespace {

uint64_t MappingBytes(const HeaderMapping& mapping) {
  uint64_t bytes = 0;
  for (const auto& it : mapping) {
    bytes += it.first.size() + it.second.size();
  }
  return bytes;
}

}  // namespace

const char* StateName(Filter::State state) {
  switch (state) {
    case Filter::State::Idle:
      return "Idle";
    case Filter::State::AwaitingAuthorization:
      return "AwaitingAuthorization";
    case Filter::State::Resumed:
      return "Resumed";
    case Filter::State::Rejected:
      return "Rejected";
  }
  return "Unknown";
}

Filter::Filter(FilterConfigSharedPtr config, HostCallbacks& host,
               RequestObserverSharedPtr observer)
    : config_(std::move(config)),
      host_(host),
      observer_(std::move(observer)),
      grpc_call_(GrpcCall::create(host_, config_->target())) {}

Filter::~Filter() { Finish(); }

FilterHeadersStatus Filter::OnRequestHeaders() {
  UIP_AUTHZ_LOG(debug, "Called Authz Filter : {}", __func__);
  if (state_ != State::Idle) {
    UIP_AUTHZ_LOG(debug, "Authorization already started, state: {}",
                  StateName(state_));
    return state_ == State::AwaitingAuthorization
               ? FilterHeadersStatus::StopIteration
               : FilterHeadersStatus::Continue;
  }

  started_ = true;
  Observe(Checkpoint::RequestStart);

  const HeaderPairs headers = host_.GetRequestHeaders();
  HeaderMapping mapping = BuildHeaderMapping(headers);
  request_state_.transient_bytes += MappingBytes(mapping);
  Observe(Checkpoint::HeadersBuilt);

  const ::authengine::FilterRequest request =
      BuildAuthorizationRequest(headers, std::move(mapping));
  std::string payload;
  Status status = SerializeRequest(request, &payload);
  if (!status.ok()) {
    UIP_AUTHZ_LOG(warn, "Skipping authorization: {}", status.ToString());
    return PassThrough();
  }
  request_state_.transient_bytes += payload.size();
  Observe(Checkpoint::Serialized);

  state_ = State::AwaitingAuthorization;
  CallToken token = 0;
  initiating_call_ = true;
  status = grpc_call_->Dispatch(payload, &token);
  initiating_call_ = false;
  if (!status.ok() && state_ == State::AwaitingAuthorization) {
    UIP_AUTHZ_LOG(warn, "Skipping authorization: {}", status.ToString());
    return PassThrough();
  }
  if (!status.ok()) {
    UIP_AUTHZ_LOG(warn, "Dispatch failed after completion in state {}: {}",
                  StateName(state_), status.ToString());
  }

  // The host may have completed the call inline.
  if (state_ == State::Resumed) {
    return FilterHeadersStatus::Continue;
  }
  if (state_ == State::Rejected) {
    return FilterHeadersStatus::StopIteration;
  }
  UIP_AUTHZ_LOG(debug, "Called Authz Filter : Stop, token {}", token);
  return FilterHeadersStatus::StopIteration;
}

FilterHeadersStatus Filter::OnResponseHeaders() {
  UIP_AUTHZ_LOG(debug, "Called Authz Filter : {}", __func__);
  if (state_ != State::Resumed) {
    return FilterHeadersStatus::Continue;
  }

  for (const auto& header : config_->config().response_headers()) {
    host_.SetResponseHeader(header.first, header.second);
  }
  if (!request_state_.message.empty()) {
    host_.SetResponseHeader(config_->message_header(), request_state_.message);
    UIP_AUTHZ_LOG(trace, "Added authorization message to response headers: {}",
                  request_state_.message);
  }
  return FilterHeadersStatus::Continue;
}

void Filter::OnAuthorizationReply(CallToken token, GrpcStatus status,
                                  size_t body_size) {
  UIP_AUTHZ_LOG(debug, "Authorization reply: token {}, status {}, size {}",
                token, status, body_size);
  // This stream has been reset, abort the callback.
  if (destroyed_) {
    return;
  }
  if (state_ != State::AwaitingAuthorization) {
    UIP_AUTHZ_LOG(warn, "Ignoring authorization reply in state {}",
                  StateName(state_));
    return;
  }
  if (!grpc_call_->Complete(token)) {
    return;
  }

  std::string body;
  bool has_body = false;
  if (status == kGrpcStatusOk && body_size > 0) {
    has_body = host_.GetGrpcCallResponseBody(body_size, &body);
  }
  request_state_.transient_bytes += body.size();

  const Decision decision =
      DecisionEngine::Decide(status, has_body ? &body : nullptr);
  if (decision.action == Decision::Action::Allow) {
    Allow(decision);
  } else {
    Reject(decision);
  }
}

void Filter::OnDestroy() {
  UIP_AUTHZ_LOG(debug, "Called Authz Filter : {} state: {}", __func__,
                StateName(state_));
  destroyed_ = true;
  if (state_ == State::AwaitingAuthorization) {
    UIP_AUTHZ_LOG(debug, "Cancelling authorization call");
    grpc_call_->Cancel();
  }
  Finish();
}

Status Filter::SerializeRequest(const ::authengine::FilterRequest& request,
                                std::string* payload) {
  return SerializeAuthorizationRequest(request, payload);
}

FilterHeadersStatus Filter::PassThrough() {
  state_ = State::Resumed;
  Finish();
  return FilterHeadersStatus::Continue;
}

void Filter::Allow(const Decision& decision) {
  if (config_->config().forward_reply_headers()) {
    for (const auto& header : decision.request_headers) {
      if (!absl::EqualsIgnoreCase(header.first, HeaderNames::kUipUser)) {
        host_.SetRequestHeader(header.first, header.second);
      }
    }
  }
  host_.SetRequestHeader(HeaderNames::kUipUser, decision.user);
  request_state_.message = decision.message;

  state_ = State::Resumed;
  Finish();
  if (!initiating_call_) {
    host_.ResumeRequest();
  }
}

void Filter::Reject(const Decision& decision) {
  state_ = State::Rejected;
  Finish();
  host_.SendLocalReply(decision.http_code, decision.body,
                       decision.response_headers);
}

void Filter::Observe(Checkpoint checkpoint) {
  if (observer_) {
    observer_->OnCheckpoint(checkpoint, request_state_);
  }
}

void Filter::Finish() {
  if (started_ && !finished_) {
    finished_ = true;
    Observe(Checkpoint::RequestEnd);
  }
}

}  // namespace Authz
}  // namespace Http
}  // namespace UipAuthz
