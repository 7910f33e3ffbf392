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

#include "src/uip_authz/http/authz/header_transformer.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Pair;

namespace UipAuthz {
namespace Http {
namespace Authz {
namespace {

TEST(HeaderTransformerTest, RenameKnownPseudoHeaders) {
  EXPECT_EQ(RenamePseudoHeader("method"), "x-original-req-method");
  EXPECT_EQ(RenamePseudoHeader("scheme"), "x-original-req-scheme");
  EXPECT_EQ(RenamePseudoHeader("authority"), "x-original-req-authority");
  EXPECT_EQ(RenamePseudoHeader("path"), "x-original-req-path");
}

TEST(HeaderTransformerTest, RenameUnknownPseudoHeader) {
  EXPECT_EQ(RenamePseudoHeader("foo"), "x-original-req-foo");
  EXPECT_EQ(RenamePseudoHeader("protocol"), "x-original-req-protocol");
}

TEST(HeaderTransformerTest, AllPseudoHeaders) {
  HeaderPairs headers = {{":method", "GET"},
                         {":scheme", "https"},
                         {":authority", "api.example.com"},
                         {":path", "/v1/items?limit=5"}};
  EXPECT_THAT(
      BuildHeaderMapping(headers),
      ElementsAre(Pair("x-original-req-authority", "api.example.com"),
                  Pair("x-original-req-method", "GET"),
                  Pair("x-original-req-path", "/v1/items?limit=5"),
                  Pair("x-original-req-scheme", "https")));
}

TEST(HeaderTransformerTest, AbsentPseudoHeadersAreOmitted) {
  HeaderPairs headers = {{":method", "POST"}, {":path", "/"}};
  EXPECT_THAT(BuildHeaderMapping(headers),
              ElementsAre(Pair("x-original-req-method", "POST"),
                          Pair("x-original-req-path", "/")));

  EXPECT_THAT(BuildHeaderMapping({}), IsEmpty());
}

TEST(HeaderTransformerTest, PseudoHeaderWithEmptyValueIsKept) {
  HeaderPairs headers = {{":authority", ""}};
  EXPECT_THAT(BuildHeaderMapping(headers),
              ElementsAre(Pair("x-original-req-authority", "")));
}

TEST(HeaderTransformerTest, UnknownPseudoHeaderIsRenamed) {
  HeaderPairs headers = {{":protocol", "websocket"}, {":", "nameless"}};
  EXPECT_THAT(BuildHeaderMapping(headers),
              ElementsAre(Pair("x-original-req-protocol", "websocket")));
}

TEST(HeaderTransformerTest, ForwardedHeadersAreCopied) {
  HeaderPairs headers = {
      {"x-forwarded-client-cert", "By=spiffe://cluster.local/ns/a"},
      {"x-request-id", "9f1c"},
      {"x-correlation-id", "c-42"},
      {"authorization", "Bearer abc.def.ghi"},
      {"x-uip-wasm-impersonated-user", "bob"},
      {"x-event-service-user", "events"},
      {"x-trino-user", "analyst"}};
  EXPECT_THAT(
      BuildHeaderMapping(headers),
      ElementsAre(Pair("authorization", "Bearer abc.def.ghi"),
                  Pair("x-correlation-id", "c-42"),
                  Pair("x-event-service-user", "events"),
                  Pair("x-forwarded-client-cert",
                       "By=spiffe://cluster.local/ns/a"),
                  Pair("x-request-id", "9f1c"), Pair("x-trino-user", "analyst"),
                  Pair("x-uip-wasm-impersonated-user", "bob")));
}

TEST(HeaderTransformerTest, OtherHeadersAreDropped) {
  HeaderPairs headers = {{":path", "/"},
                         {"cookie", "session=1"},
                         {"x-uip-user", "mallory"},
                         {"x-original-req-path", "/admin"},
                         {"user-agent", "curl/8.0"},
                         {"x-request-id", "r1"}};
  EXPECT_THAT(BuildHeaderMapping(headers),
              ElementsAre(Pair("x-original-req-path", "/"),
                          Pair("x-request-id", "r1")));
}

TEST(HeaderTransformerTest, NamesMatchCaseInsensitively) {
  HeaderPairs headers = {{"Authorization", "Basic Zm9v"}, {":PATH", "/a"}};
  EXPECT_THAT(BuildHeaderMapping(headers),
              ElementsAre(Pair("authorization", "Basic Zm9v"),
                          Pair("x-original-req-path", "/a")));
}

TEST(HeaderTransformerTest, RepeatedHeaderKeepsLastValue) {
  HeaderPairs headers = {{"x-request-id", "first"},
                         {"x-request-id", "second"}};
  EXPECT_THAT(BuildHeaderMapping(headers),
              ElementsAre(Pair("x-request-id", "second")));
}

TEST(HeaderTransformerTest, FindHeader) {
  HeaderPairs headers = {{":method", "GET"}, {"X-Request-Id", "r1"}};
  ASSERT_NE(FindHeader(headers, ":method"), nullptr);
  EXPECT_EQ(*FindHeader(headers, ":method"), "GET");
  ASSERT_NE(FindHeader(headers, "x-request-id"), nullptr);
  EXPECT_EQ(*FindHeader(headers, "x-request-id"), "r1");
  EXPECT_EQ(FindHeader(headers, ":path"), nullptr);
}

}  // namespace
}  // namespace Authz
}  // namespace Http
}  // namespace UipAuthz
