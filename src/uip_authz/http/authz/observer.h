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

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "src/uip_authz/common/logger.h"

namespace UipAuthz {
namespace Http {
namespace Authz {

// Per-request bookkeeping of the filter.
struct RequestState {
  // Policy message of an allowed request, attached to its response.
  std::string message;
  // Running estimate of the bytes held by transient buffers.
  uint64_t transient_bytes = 0;
};

// Points in the request lifetime reported to a RequestObserver.
enum class Checkpoint {
  RequestStart,
  HeadersBuilt,
  Serialized,
  RequestEnd,
};

const char* CheckpointName(Checkpoint checkpoint);

// Optional hook called by the filter at each Checkpoint. RequestStart and
// RequestEnd are reported exactly once per observed request. Observers are
// shared by all requests and may be called from several threads.
class RequestObserver {
 public:
  virtual ~RequestObserver() {}

  virtual void OnCheckpoint(Checkpoint checkpoint,
                            const RequestState& state) = 0;
};

typedef std::shared_ptr<RequestObserver> RequestObserverSharedPtr;

// Counts live requests and transient bytes. Warns when the number of live
// requests crosses the threshold, which usually means requests are started
// but never finished.
class MemoryStatsObserver : public RequestObserver,
                            public Logger::Loggable<Logger::Id::memory> {
 public:
  explicit MemoryStatsObserver(uint64_t live_request_threshold)
      : live_request_threshold_(live_request_threshold) {}

  void OnCheckpoint(Checkpoint checkpoint, const RequestState& state) override;

  uint64_t live_requests() const { return live_requests_.load(); }
  uint64_t total_requests() const { return total_requests_.load(); }
  uint64_t peak_transient_bytes() const { return peak_transient_bytes_.load(); }

 private:
  void UpdatePeak(uint64_t bytes);

  const uint64_t live_request_threshold_;
  std::atomic<uint64_t> live_requests_{0};
  std::atomic<uint64_t> total_requests_{0};
  std::atomic<uint64_t> peak_transient_bytes_{0};
};

}  // namespace Authz
}  // namespace Http
}  // namespace UipAuthz
