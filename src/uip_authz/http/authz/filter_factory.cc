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

#include "src/uip_authz/http/authz/filter_factory.h"

#include <utility>

using ::google::protobuf::util::Status;

namespace UipAuthz {
namespace Http {
namespace Authz {

const std::string FilterName = "uip.filters.http.authz";

FilterFactory::FilterFactory(FilterConfigSharedPtr config)
    : config_(std::move(config)) {
  const auto& proto_config = config_->config();

  spdlog::level::level_enum level;
  if (!proto_config.log_level().empty() &&
      Logger::Registry::parseLogLevel(proto_config.log_level(), &level)) {
    Logger::Registry::setLogLevel(level);
  }

  if (proto_config.memory_stats()) {
    observer_ = std::make_shared<MemoryStatsObserver>(
        config_->memory_stats_live_request_threshold());
  }
  UIP_AUTHZ_LOG(debug, "{} created, memory stats {}", FilterName,
                observer_ ? "on" : "off");
}

Status FilterFactory::Create(const std::string& json,
                             FilterFactorySharedPtr* factory) {
  FilterConfigSharedPtr config;
  Status status = FilterConfig::Create(json, &config);
  if (!status.ok()) {
    return status;
  }
  *factory = std::make_shared<FilterFactory>(std::move(config));
  return status;
}

std::unique_ptr<Filter> FilterFactory::CreateFilter(HostCallbacks& host) const {
  return std::unique_ptr<Filter>(new Filter(config_, host, observer_));
}

}  // namespace Authz
}  // namespace Http
}  // namespace UipAuthz
