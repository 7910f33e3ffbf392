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

#include "src/uip_authz/http/authz/observer.h"

#include "gtest/gtest.h"

namespace UipAuthz {
namespace Http {
namespace Authz {
namespace {

TEST(MemoryStatsObserverTest, CountsLiveRequests) {
  MemoryStatsObserver observer(10);
  RequestState first;
  RequestState second;

  observer.OnCheckpoint(Checkpoint::RequestStart, first);
  observer.OnCheckpoint(Checkpoint::RequestStart, second);
  EXPECT_EQ(observer.live_requests(), 2u);
  EXPECT_EQ(observer.total_requests(), 2u);

  observer.OnCheckpoint(Checkpoint::RequestEnd, first);
  EXPECT_EQ(observer.live_requests(), 1u);
  EXPECT_EQ(observer.total_requests(), 2u);
}

TEST(MemoryStatsObserverTest, TracksPeakTransientBytes) {
  MemoryStatsObserver observer(10);
  RequestState state;

  observer.OnCheckpoint(Checkpoint::RequestStart, state);
  state.transient_bytes = 120;
  observer.OnCheckpoint(Checkpoint::HeadersBuilt, state);
  state.transient_bytes = 300;
  observer.OnCheckpoint(Checkpoint::Serialized, state);
  EXPECT_EQ(observer.peak_transient_bytes(), 300u);

  RequestState small;
  small.transient_bytes = 10;
  observer.OnCheckpoint(Checkpoint::HeadersBuilt, small);
  EXPECT_EQ(observer.peak_transient_bytes(), 300u);
}

TEST(MemoryStatsObserverTest, ThresholdCrossing) {
  MemoryStatsObserver observer(1);
  RequestState state;

  observer.OnCheckpoint(Checkpoint::RequestStart, state);
  observer.OnCheckpoint(Checkpoint::RequestStart, state);
  observer.OnCheckpoint(Checkpoint::RequestStart, state);
  EXPECT_EQ(observer.live_requests(), 3u);
}

TEST(CheckpointTest, Names) {
  EXPECT_STREQ(CheckpointName(Checkpoint::RequestStart), "request-start");
  EXPECT_STREQ(CheckpointName(Checkpoint::HeadersBuilt), "headers-built");
  EXPECT_STREQ(CheckpointName(Checkpoint::Serialized), "serialized");
  EXPECT_STREQ(CheckpointName(Checkpoint::RequestEnd), "request-end");
}

}  // namespace
}  // namespace Authz
}  // namespace Http
}  // namespace UipAuthz
