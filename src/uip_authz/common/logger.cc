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

#include "src/uip_authz/common/logger.h"

#include <array>
#include <memory>

#include "spdlog/sinks/stdout_color_sinks.h"

namespace UipAuthz {
namespace Logger {
namespace {

#define UIP_AUTHZ_GENERATE_NAME(X) #X,

const char* const kIdNames[] = {UIP_AUTHZ_ALL_LOGGER_IDS(UIP_AUTHZ_GENERATE_NAME)};

constexpr size_t kNumIds = sizeof(kIdNames) / sizeof(kIdNames[0]);

const char kLoggerPrefix[] = "uip_authz.";

const char kDefaultPattern[] = "[%Y-%m-%d %T.%e][%t][%l][%n] %v";

using LoggerArray = std::array<std::shared_ptr<spdlog::logger>, kNumIds>;

LoggerArray& loggers() {
  static LoggerArray* instance = [] {
    auto* array = new LoggerArray();
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    for (size_t i = 0; i < kNumIds; ++i) {
      (*array)[i] = std::make_shared<spdlog::logger>(
          std::string(kLoggerPrefix) + kIdNames[i], sink);
      (*array)[i]->set_pattern(kDefaultPattern);
      (*array)[i]->set_level(spdlog::level::info);
    }
    return array;
  }();
  return *instance;
}

}  // namespace

spdlog::logger& Registry::getLog(Id id) {
  return *loggers()[static_cast<size_t>(id)];
}

void Registry::setLogLevel(spdlog::level::level_enum level) {
  for (auto& logger : loggers()) {
    logger->set_level(level);
  }
}

bool Registry::parseLogLevel(const std::string& name,
                             spdlog::level::level_enum* level) {
  // spdlog maps unknown names to "off", so "off" has to be checked by name.
  const spdlog::level::level_enum parsed = spdlog::level::from_str(name);
  if (parsed == spdlog::level::off && name != "off") {
    return false;
  }
  *level = parsed;
  return true;
}

const char* Registry::idName(Id id) {
  return kIdNames[static_cast<size_t>(id)];
}

}  // namespace Logger
}  // namespace UipAuthz
