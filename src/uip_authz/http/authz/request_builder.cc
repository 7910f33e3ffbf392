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

#include "src/uip_authz/http/authz/request_builder.h"

#include <utility>

#include "src/uip_authz/http/authz/header_names.h"

using ::google::protobuf::util::Status;

namespace UipAuthz {
namespace Http {
namespace Authz {
namespace {

std::string HeaderOrEmpty(const HeaderPairs& headers, const std::string& name) {
  const std::string* value = FindHeader(headers, name);
  return value ? *value : std::string();
}

}  // namespace

::authengine::FilterRequest BuildAuthorizationRequest(
    const HeaderPairs& headers, HeaderMapping mapping) {
  ::authengine::FilterRequest request;
  request.set_method(HeaderOrEmpty(headers, HeaderNames::kMethod));
  request.set_path(HeaderOrEmpty(headers, HeaderNames::kPath));
  request.set_scheme(HeaderOrEmpty(headers, HeaderNames::kScheme));

  auto* request_headers = request.mutable_headers();
  for (auto& it : mapping) {
    (*request_headers)[it.first] = std::move(it.second);
  }
  return request;
}

Status SerializeAuthorizationRequest(const ::authengine::FilterRequest& request,
                                     std::string* payload) {
  payload->clear();
  if (!request.SerializeToString(payload)) {
    return ::google::protobuf::util::InternalError(
        "Failed to serialize the authorization request");
  }
  return ::google::protobuf::util::OkStatus();
}

}  // namespace Authz
}  // namespace Http
}  // namespace UipAuthz
