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

#include <map>
#include <string>

#include "src/uip_authz/http/authz/host.h"

namespace UipAuthz {
namespace Http {
namespace Authz {

// Header name to value, as carried in the authorization request.
typedef std::map<std::string, std::string> HeaderMapping;

// Returns the authorization request key for a pseudo-header, given without
// its leading colon: "path" -> "x-original-req-path". Names outside the
// known four get the same prefix.
std::string RenamePseudoHeader(const std::string& name);

// Whether an ordinary (lower case) header is sent to the authorization
// service under its own name.
bool IsForwardedHeader(const std::string& name);

// Builds the header mapping of the authorization request from the inbound
// headers: pseudo-headers renamed by RenamePseudoHeader, forwarded headers
// copied verbatim, everything else dropped. Names are matched case
// insensitively and emitted in lower case; a repeated name keeps its last
// value.
HeaderMapping BuildHeaderMapping(const HeaderPairs& headers);

// Returns the value of the last header named `name` (lower case), or nullptr.
const std::string* FindHeader(const HeaderPairs& headers,
                              const std::string& name);

}  // namespace Authz
}  // namespace Http
}  // namespace UipAuthz
