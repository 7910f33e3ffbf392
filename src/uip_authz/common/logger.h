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

#include "spdlog/spdlog.h"

namespace UipAuthz {
namespace Logger {

#define UIP_AUTHZ_ALL_LOGGER_IDS(FUNCTION) \
  FUNCTION(config)                         \
  FUNCTION(filter)                         \
  FUNCTION(grpc)                           \
  FUNCTION(memory)

#define UIP_AUTHZ_GENERATE_ENUM(X) X,

enum class Id { UIP_AUTHZ_ALL_LOGGER_IDS(UIP_AUTHZ_GENERATE_ENUM) };

// Owns one spdlog logger per Id. All loggers share a single stderr sink and
// are named "uip_authz.<id>".
class Registry {
 public:
  // Returns the logger for the given id, creating all loggers on first use.
  static spdlog::logger& getLog(Id id);

  // Sets the level of every logger.
  static void setLogLevel(spdlog::level::level_enum level);

  // Parses a spdlog level name ("trace", "debug", "info", "warning", ...).
  // Returns false and leaves *level untouched for an unknown name.
  static bool parseLogLevel(const std::string& name,
                            spdlog::level::level_enum* level);

  static const char* idName(Id id);
};

// Mixin giving a class a static logger for its component id. Use the
// UIP_AUTHZ_LOG macro rather than calling the accessor directly.
template <Id id>
class Loggable {
 protected:
  static spdlog::logger& __log_do_not_use_read_comment() {
    static spdlog::logger& instance = Registry::getLog(id);
    return instance;
  }
};

}  // namespace Logger
}  // namespace UipAuthz

#define UIP_AUTHZ_LOGGER() __log_do_not_use_read_comment()

// Logs through the class logger, e.g. UIP_AUTHZ_LOG(debug, "x = {}", x).
// LEVEL is one of trace, debug, info, warn, error, critical.
#define UIP_AUTHZ_LOG(LEVEL, ...)          \
  do {                                     \
    UIP_AUTHZ_LOGGER().LEVEL(__VA_ARGS__); \
  } while (0)

// Logs through an explicit logger outside a Loggable class.
#define UIP_AUTHZ_LOG_TO_LOGGER(LOGGER, LEVEL, ...) \
  do {                                              \
    (LOGGER).LEVEL(__VA_ARGS__);                    \
  } while (0)
