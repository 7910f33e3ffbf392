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

#include "gtest/gtest.h"

using ::google::protobuf::util::Status;

namespace UipAuthz {
namespace Http {
namespace Authz {
namespace {

class FilterConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    unsetenv(FilterConfig::kDefaultInstanceIdEnv);
    unsetenv("POD_ID");
  }
  void TearDown() override { SetUp(); }
};

TEST_F(FilterConfigTest, TargetEndpointFormat) {
  EXPECT_EQ(FilterConfig::TargetEndpoint("pod-7"),
            "outbound|50051||pod-7.localhost.for.grpc.call");
}

TEST_F(FilterConfigTest, EmptyConfigUsesDefaults) {
  FilterConfigSharedPtr config;
  Status status = FilterConfig::Create("{}", &config);
  ASSERT_TRUE(status.ok()) << status.ToString();

  EXPECT_EQ(config->instance_id(), "localhost");
  EXPECT_EQ(config->target(),
            "outbound|50051||localhost.localhost.for.grpc.call");
  EXPECT_EQ(config->message_header(), "grpc-message");
  EXPECT_FALSE(config->config().forward_reply_headers());
  EXPECT_FALSE(config->config().memory_stats());
  EXPECT_EQ(config->memory_stats_live_request_threshold(), 1000u);
}

TEST_F(FilterConfigTest, InstanceIdFromConfig) {
  setenv(FilterConfig::kDefaultInstanceIdEnv, "from-env", 1);

  FilterConfigSharedPtr config;
  ASSERT_TRUE(FilterConfig::Create(R"({"instance_id": "edge-1"})", &config)
                  .ok());
  EXPECT_EQ(config->target(), "outbound|50051||edge-1.localhost.for.grpc.call");
}

TEST_F(FilterConfigTest, InstanceIdFromDefaultEnv) {
  setenv(FilterConfig::kDefaultInstanceIdEnv, "from-env", 1);

  FilterConfigSharedPtr config;
  ASSERT_TRUE(FilterConfig::Create("{}", &config).ok());
  EXPECT_EQ(config->instance_id(), "from-env");
}

TEST_F(FilterConfigTest, InstanceIdFromNamedEnv) {
  setenv("POD_ID", "pod-3", 1);

  FilterConfigSharedPtr config;
  ASSERT_TRUE(
      FilterConfig::Create(R"({"instance_id_env": "POD_ID"})", &config).ok());
  EXPECT_EQ(config->instance_id(), "pod-3");
}

TEST_F(FilterConfigTest, EmptyEnvFallsBackToLocalhost) {
  setenv(FilterConfig::kDefaultInstanceIdEnv, "", 1);

  FilterConfigSharedPtr config;
  ASSERT_TRUE(FilterConfig::Create("{}", &config).ok());
  EXPECT_EQ(config->instance_id(), "localhost");
}

TEST_F(FilterConfigTest, AllFields) {
  const std::string json = R"({
    "instance_id": "edge-2",
    "message_header": "x-authz-message",
    "response_headers": {"powered-by": "uip-authz"},
    "forward_reply_headers": true,
    "memory_stats": true,
    "memory_stats_live_request_threshold": 50,
    "log_level": "debug"
  })";
  FilterConfigSharedPtr config;
  Status status = FilterConfig::Create(json, &config);
  ASSERT_TRUE(status.ok()) << status.ToString();

  EXPECT_EQ(config->message_header(), "x-authz-message");
  EXPECT_EQ(config->config().response_headers().at("powered-by"), "uip-authz");
  EXPECT_TRUE(config->config().forward_reply_headers());
  EXPECT_TRUE(config->config().memory_stats());
  EXPECT_EQ(config->memory_stats_live_request_threshold(), 50u);
}

TEST_F(FilterConfigTest, MalformedJson) {
  FilterConfigSharedPtr config;
  Status status = FilterConfig::Create("{\"instance_id\": ", &config);
  EXPECT_EQ(status.code(),
            ::google::protobuf::util::StatusCode::kInvalidArgument);
  EXPECT_EQ(config, nullptr);
}

TEST_F(FilterConfigTest, UnknownField) {
  FilterConfigSharedPtr config;
  Status status = FilterConfig::Create(R"({"cluster": "authz"})", &config);
  EXPECT_EQ(status.code(),
            ::google::protobuf::util::StatusCode::kInvalidArgument);
}

TEST_F(FilterConfigTest, UnknownLogLevel) {
  FilterConfigSharedPtr config;
  Status status = FilterConfig::Create(R"({"log_level": "loud"})", &config);
  EXPECT_EQ(status.code(),
            ::google::protobuf::util::StatusCode::kInvalidArgument);
  EXPECT_EQ(config, nullptr);
}

}  // namespace
}  // namespace Authz
}  // namespace Http
}  // namespace UipAuthz
