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

#include "src/uip_authz/http/authz/header_names.h"

namespace UipAuthz {
namespace Http {
namespace Authz {

const std::string HeaderNames::kMethod = ":method";
const std::string HeaderNames::kScheme = ":scheme";
const std::string HeaderNames::kAuthority = ":authority";
const std::string HeaderNames::kPath = ":path";

const std::string HeaderNames::kOriginalRequestPrefix = "x-original-req-";

const std::string HeaderNames::kForwardedClientCert = "x-forwarded-client-cert";
const std::string HeaderNames::kRequestId = "x-request-id";
const std::string HeaderNames::kCorrelationId = "x-correlation-id";
const std::string HeaderNames::kAuthorization = "authorization";
const std::string HeaderNames::kImpersonatedUser =
    "x-uip-wasm-impersonated-user";
const std::string HeaderNames::kEventServiceUser = "x-event-service-user";
const std::string HeaderNames::kTrinoUser = "x-trino-user";

const std::string HeaderNames::kUipUser = "x-uip-user";

const std::string HeaderNames::kWwwAuthenticate = "WWW-Authenticate";

const std::string HeaderNames::kDefaultMessageHeader = "grpc-message";

}  // namespace Authz
}  // namespace Http
}  // namespace UipAuthz
