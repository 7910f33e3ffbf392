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

#include "gmock/gmock.h"
#include "src/uip_authz/http/authz/host.h"
#include "src/uip_authz/http/authz/observer.h"

namespace UipAuthz {
namespace Http {
namespace Authz {

class MockHostCallbacks : public HostCallbacks {
 public:
  MOCK_METHOD(HeaderPairs, GetRequestHeaders, (), (const, override));
  MOCK_METHOD(void, SetRequestHeader,
              (const std::string& name, const std::string& value),
              (override));
  MOCK_METHOD(void, SetResponseHeader,
              (const std::string& name, const std::string& value),
              (override));
  MOCK_METHOD(void, ResumeRequest, (), (override));
  MOCK_METHOD(void, SendLocalReply,
              (int code, const std::string& body, const HeaderPairs& headers),
              (override));
  MOCK_METHOD(::google::protobuf::util::Status, DispatchGrpcCall,
              (const std::string& target, const std::string& service,
               const std::string& method, const std::string& payload,
               std::chrono::milliseconds timeout, CallToken* token),
              (override));
  MOCK_METHOD(bool, GetGrpcCallResponseBody, (size_t size, std::string* body),
              (override));
  MOCK_METHOD(void, CancelGrpcCall, (CallToken token), (override));
};

class MockRequestObserver : public RequestObserver {
 public:
  MOCK_METHOD(void, OnCheckpoint,
              (Checkpoint checkpoint, const RequestState& state), (override));
};

}  // namespace Authz
}  // namespace Http
}  // namespace UipAuthz
