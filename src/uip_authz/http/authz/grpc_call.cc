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

#include "src/uip_authz/http/authz/grpc_call.h"

#include "src/uip_authz/common/logger.h"

using ::google::protobuf::util::Status;

namespace UipAuthz {
namespace Http {
namespace Authz {
namespace {

class GrpcCallImpl : public GrpcCall,
                     public Logger::Loggable<Logger::Id::grpc> {
 public:
  GrpcCallImpl(HostCallbacks& host, const std::string& target)
      : host_(host), target_(target) {
    UIP_AUTHZ_LOG(trace, "{}", __func__);
  }

  ~GrpcCallImpl() { Cancel(); }

  Status Dispatch(const std::string& payload, CallToken* token) override {
    if (pending_) {
      return ::google::protobuf::util::FailedPreconditionError(
          "An authorization call is already pending");
    }

    UIP_AUTHZ_LOG(debug, "grpc call [target = {}]: start, {} bytes", target_,
                  payload.size());
    // Pending before the host returns: the completion may arrive inline.
    pending_ = true;
    dispatching_ = true;
    Status status = host_.DispatchGrpcCall(target_, kServiceName, kMethodName,
                                           payload, kTimeout, &token_);
    dispatching_ = false;
    if (!status.ok()) {
      pending_ = false;
      UIP_AUTHZ_LOG(warn, "grpc call [target = {}]: dispatch failed: {}",
                    target_, status.ToString());
      return status;
    }
    *token = token_;
    return status;
  }

  bool Complete(CallToken token) override {
    // An inline completion may precede the host writing the token.
    if (pending_ && dispatching_) {
      token_ = token;
    }
    if (!pending_ || token != token_) {
      UIP_AUTHZ_LOG(warn,
                    "grpc call [target = {}]: unexpected completion for "
                    "token {}",
                    target_, token);
      return false;
    }
    UIP_AUTHZ_LOG(debug, "grpc call [target = {}]: complete", target_);
    pending_ = false;
    return true;
  }

  void Cancel() override {
    if (pending_) {
      host_.CancelGrpcCall(token_);
      UIP_AUTHZ_LOG(debug, "grpc call [target = {}]: canceled", target_);
    }
    pending_ = false;
  }

  bool pending() const override { return pending_; }

 private:
  HostCallbacks& host_;
  const std::string target_;
  CallToken token_{};
  bool pending_{};
  bool dispatching_{};
};

}  // namespace

const std::string GrpcCall::kServiceName = "authengine.UIPBDIAuthZProcessor";
const std::string GrpcCall::kMethodName = "processReq";
const std::chrono::milliseconds GrpcCall::kTimeout(5000);

GrpcCallPtr GrpcCall::create(HostCallbacks& host, const std::string& target) {
  return GrpcCallPtr(new GrpcCallImpl(host, target));
}

}  // namespace Authz
}  // namespace Http
}  // namespace UipAuthz
