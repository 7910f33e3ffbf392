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

#include "src/uip_authz/common/logger.h"
#include "src/uip_authz/http/authz/header_transformer.h"
#include "src/uip_authz/http/authz/host.h"

namespace UipAuthz {
namespace Http {
namespace Authz {

// What the filter does with a request once its authorization call completed.
struct Decision {
  enum class Action {
    // Annotate and resume the request.
    Allow,
    // The policy service refused the request: 401.
    Deny,
    // No usable reply: 500.
    Fail,
  };
  Action action = Action::Fail;

  // Deny and Fail: the local reply.
  int http_code = 0;
  std::string body;
  HeaderPairs response_headers;

  // Allow: value of the x-uip-user request header, never empty.
  std::string user;
  // Allow: the policy message retained for the response.
  std::string message;
  // Allow: the "headers" map of the reply.
  HeaderMapping request_headers;
};

// Maps a completed authorization call to a Decision.
class DecisionEngine : public Logger::Loggable<Logger::Id::filter> {
 public:
  // `body` is the response body, or nullptr if none could be read.
  static Decision Decide(GrpcStatus status, const std::string* body);

  static const int kDeniedCode;
  static const int kFailedCode;
  static const std::string kDeniedBody;
  static const std::string kFailedBody;
};

}  // namespace Authz
}  // namespace Http
}  // namespace UipAuthz
