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

#include "src/uip_authz/http/authz/filter_config.h"

#include <cstdlib>

#include "fmt/format.h"
#include "google/protobuf/util/json_util.h"
#include "src/uip_authz/http/authz/header_names.h"

using ::google::protobuf::util::Status;

namespace UipAuthz {
namespace Http {
namespace Authz {
namespace {

constexpr char kTargetEndpointFormat[] =
    "outbound|50051||{}.localhost.for.grpc.call";

}  // namespace

const char FilterConfig::kDefaultInstanceId[] = "localhost";
const char FilterConfig::kDefaultInstanceIdEnv[] = "UIP_INSTANCE_ID";
const uint32_t FilterConfig::kDefaultLiveRequestThreshold = 1000;

FilterConfig::FilterConfig(const ProtoConfig& proto_config)
    : proto_config_(proto_config) {
  instance_id_ = proto_config_.instance_id();
  if (instance_id_.empty()) {
    const std::string env_name = proto_config_.instance_id_env().empty()
                                     ? kDefaultInstanceIdEnv
                                     : proto_config_.instance_id_env();
    const char* env_value = std::getenv(env_name.c_str());
    if (env_value != nullptr && *env_value != '\0') {
      instance_id_ = env_value;
    } else {
      instance_id_ = kDefaultInstanceId;
    }
  }
  target_ = TargetEndpoint(instance_id_);

  message_header_ = proto_config_.message_header().empty()
                        ? HeaderNames::kDefaultMessageHeader
                        : proto_config_.message_header();

  UIP_AUTHZ_LOG(info, "Authorization target endpoint: {}", target_);
}

Status FilterConfig::Create(const std::string& json,
                            FilterConfigSharedPtr* config) {
  ProtoConfig proto_config;
  Status status =
      ::google::protobuf::util::JsonStringToMessage(json, &proto_config);
  if (!status.ok()) {
    UIP_AUTHZ_LOG(error, "Invalid filter config: {}", status.ToString());
    return ::google::protobuf::util::InvalidArgumentError(
        "Invalid filter config: " + status.ToString());
  }

  if (!proto_config.log_level().empty()) {
    spdlog::level::level_enum level;
    if (!Logger::Registry::parseLogLevel(proto_config.log_level(), &level)) {
      UIP_AUTHZ_LOG(error, "Invalid log level: {}", proto_config.log_level());
      return ::google::protobuf::util::InvalidArgumentError(
          "Invalid log level: " + proto_config.log_level());
    }
  }

  *config = std::make_shared<const FilterConfig>(proto_config);
  return ::google::protobuf::util::OkStatus();
}

std::string FilterConfig::TargetEndpoint(const std::string& instance_id) {
  return fmt::format(kTargetEndpointFormat, instance_id);
}

uint32_t FilterConfig::memory_stats_live_request_threshold() const {
  const uint32_t threshold =
      proto_config_.memory_stats_live_request_threshold();
  return threshold > 0 ? threshold : kDefaultLiveRequestThreshold;
}

}  // namespace Authz
}  // namespace Http
}  // namespace UipAuthz
