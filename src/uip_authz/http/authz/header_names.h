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

namespace UipAuthz {
namespace Http {
namespace Authz {

// Define header names
struct HeaderNames {
  // Pseudo-headers as presented by the host.
  static const std::string kMethod;
  static const std::string kScheme;
  static const std::string kAuthority;
  static const std::string kPath;

  // Prefix of renamed pseudo-headers in the authorization request.
  static const std::string kOriginalRequestPrefix;

  // Request headers forwarded verbatim to the authorization service.
  static const std::string kForwardedClientCert;
  static const std::string kRequestId;
  static const std::string kCorrelationId;
  static const std::string kAuthorization;
  static const std::string kImpersonatedUser;
  static const std::string kEventServiceUser;
  static const std::string kTrinoUser;

  // Request header carrying the authorized user to the upstream.
  static const std::string kUipUser;

  // Response header of a denied request.
  static const std::string kWwwAuthenticate;

  // Default response header for the retained policy message.
  static const std::string kDefaultMessageHeader;
};

}  // namespace Authz
}  // namespace Http
}  // namespace UipAuthz
