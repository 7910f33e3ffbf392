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
#include "src/uip_authz/http/authz/authz.pb.h"
#include "src/uip_authz/http/authz/header_transformer.h"

namespace UipAuthz {
namespace Http {
namespace Authz {

// Builds the authorization request for the inbound headers. method, path and
// scheme come from the pseudo-headers and are empty when missing; the
// authority is only carried in the header mapping.
::authengine::FilterRequest BuildAuthorizationRequest(
    const HeaderPairs& headers, HeaderMapping mapping);

// Serializes the request to the protobuf wire format.
::google::protobuf::util::Status SerializeAuthorizationRequest(
    const ::authengine::FilterRequest& request, std::string* payload);

}  // namespace Authz
}  // namespace Http
}  // namespace UipAuthz
