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

#include "src/uip_authz/http/authz/decision.h"

#include "absl/strings/ascii.h"
#include "absl/strings/escaping.h"
#include "src/uip_authz/http/authz/authz.pb.h"
#include "src/uip_authz/http/authz/header_names.h"

namespace UipAuthz {
namespace Http {
namespace Authz {
namespace {

// Stands in for an empty user so the header is never present but empty.
const char kBlankUser[] = " ";

Decision Failed() {
  Decision decision;
  decision.action = Decision::Action::Fail;
  decision.http_code = DecisionEngine::kFailedCode;
  decision.body = DecisionEngine::kFailedBody;
  return decision;
}

}  // namespace

const int DecisionEngine::kDeniedCode = 401;
const int DecisionEngine::kFailedCode = 500;
const std::string DecisionEngine::kDeniedBody = "Unauthorized";
const std::string DecisionEngine::kFailedBody = "Internal Server Error";

Decision DecisionEngine::Decide(GrpcStatus status, const std::string* body) {
  if (status != kGrpcStatusOk) {
    UIP_AUTHZ_LOG(warn, "Authorization call failed with grpc status {}",
                  status);
    return Failed();
  }
  if (body == nullptr || body->empty()) {
    UIP_AUTHZ_LOG(warn, "No authorization response data received");
    return Failed();
  }

  ::authengine::FilterResponse reply;
  if (!reply.ParseFromString(*body)) {
    UIP_AUTHZ_LOG(error, "Failed to parse authorization response: \"{}\"",
                  absl::Utf8SafeCHexEscape(*body));
    return Failed();
  }

  Decision decision;
  if (!reply.allow()) {
    UIP_AUTHZ_LOG(debug, "Authorization denied: {}", reply.message());
    decision.action = Decision::Action::Deny;
    decision.http_code = kDeniedCode;
    decision.body = kDeniedBody;
    if (!reply.message().empty()) {
      decision.response_headers.emplace_back(HeaderNames::kWwwAuthenticate,
                                             reply.message());
    }
    return decision;
  }

  decision.action = Decision::Action::Allow;
  if (absl::StripAsciiWhitespace(reply.user()).empty()) {
    decision.user = kBlankUser;
  } else {
    decision.user = reply.user();
  }
  decision.message = reply.message();
  for (const auto& header : reply.headers()) {
    decision.request_headers[header.first] = header.second;
  }
  UIP_AUTHZ_LOG(debug, "Authorization allowed for user \"{}\"", decision.user);
  return decision;
}

}  // namespace Authz
}  // namespace Http
}  // namespace UipAuthz
