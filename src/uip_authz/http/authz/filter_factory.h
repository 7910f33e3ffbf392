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
#include <utility>

#include "google/protobuf/stubs/status.h"
#include "src/uip_authz/common/logger.h"
#include "src/uip_authz/http/authz/filter.h"
#include "src/uip_authz/http/authz/filter_config.h"
#include "src/uip_authz/http/authz/host.h"
#include "src/uip_authz/http/authz/observer.h"

namespace UipAuthz {
namespace Http {
namespace Authz {

class FilterFactory;
typedef std::shared_ptr<FilterFactory> FilterFactorySharedPtr;

// Creates the per-request filters of a configured process. Holds the shared
// config and the request observer.
class FilterFactory : public Logger::Loggable<Logger::Id::config> {
 public:
  explicit FilterFactory(FilterConfigSharedPtr config);

  // Loads the JSON config and builds the factory.
  static ::google::protobuf::util::Status Create(
      const std::string& json, FilterFactorySharedPtr* factory);

  // A new filter for one request. `host` must outlive the filter.
  std::unique_ptr<Filter> CreateFilter(HostCallbacks& host) const;

  const FilterConfigSharedPtr& config() const { return config_; }
  const RequestObserverSharedPtr& observer() const { return observer_; }

  // Replaces the observer given to filters created from now on.
  void set_observer(RequestObserverSharedPtr observer) {
    observer_ = std::move(observer);
  }

 private:
  FilterConfigSharedPtr config_;
  RequestObserverSharedPtr observer_;
};

}  // namespace Authz
}  // namespace Http
}  // namespace UipAuthz
