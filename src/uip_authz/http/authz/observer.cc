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

namespace UipAuthz {
namespace Http {
namespace Authz {

const char* CheckpointName(Checkpoint checkpoint) {
  switch (checkpoint) {
    case Checkpoint::RequestStart:
      return "request-start";
    case Checkpoint::HeadersBuilt:
      return "headers-built";
    case Checkpoint::Serialized:
      return "serialized";
    case Checkpoint::RequestEnd:
      return "request-end";
  }
  return "unknown";
}

void MemoryStatsObserver::OnCheckpoint(Checkpoint checkpoint,
                                       const RequestState& state) {
  switch (checkpoint) {
    case Checkpoint::RequestStart: {
      ++total_requests_;
      const uint64_t live = ++live_requests_;
      if (live == live_request_threshold_ + 1) {
        UIP_AUTHZ_LOG(warn,
                      "{} live requests exceed the threshold of {}, "
                      "requests may be leaking",
                      live, live_request_threshold_);
      }
      break;
    }
    case Checkpoint::RequestEnd:
      --live_requests_;
      break;
    default:
      break;
  }
  UpdatePeak(state.transient_bytes);
  UIP_AUTHZ_LOG(debug, "{}: {} transient bytes, {} live requests",
                CheckpointName(checkpoint), state.transient_bytes,
                live_requests_.load());
}

void MemoryStatsObserver::UpdatePeak(uint64_t bytes) {
  uint64_t peak = peak_transient_bytes_.load();
  while (bytes > peak &&
         !peak_transient_bytes_.compare_exchange_weak(peak, bytes)) {
  }
}

}  // namespace Authz
}  // namespace Http
}  // namespace UipAuthz
