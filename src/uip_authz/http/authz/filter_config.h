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

#include <memory>
#include <string>

#include "google/protobuf/stubs/status.h"
#include "src/uip_authz/common/logger.h"
#include "src/uip_authz/http/authz/config.pb.h"

namespace UipAuthz {
namespace Http {
namespace Authz {

class FilterConfig;
typedef std::shared_ptr<const FilterConfig> FilterConfigSharedPtr;

// The filter config shared by every request of the process. Immutable after
// construction.
class FilterConfig : public Logger::Loggable<Logger::Id::config> {
 public:
  typedef ::uip_authz::config::filter::http::authz::FilterConfig ProtoConfig;

  // Resolves the instance id and the target endpoint from the proto config
  // and the environment.
  explicit FilterConfig(const ProtoConfig& proto_config);

  // Parses a JSON config. Returns INVALID_ARGUMENT for malformed JSON,
  // unknown fields or an unknown log level.
  static ::google::protobuf::util::Status Create(const std::string& json,
                                                 FilterConfigSharedPtr* config);

  // "outbound|50051||<instance_id>.localhost.for.grpc.call"
  static std::string TargetEndpoint(const std::string& instance_id);

  const ProtoConfig& config() const { return proto_config_; }

  const std::string& instance_id() const { return instance_id_; }
  const std::string& target() const { return target_; }
  const std::string& message_header() const { return message_header_; }
  uint32_t memory_stats_live_request_threshold() const;

  static const char kDefaultInstanceId[];
  static const char kDefaultInstanceIdEnv[];
  static const uint32_t kDefaultLiveRequestThreshold;

 private:
  // The proto config.
  const ProtoConfig proto_config_;
  std::string instance_id_;
  std::string target_;
  std::string message_header_;
};

}  // namespace Authz
}  // namespace Http
}  // namespace UipAuthz
