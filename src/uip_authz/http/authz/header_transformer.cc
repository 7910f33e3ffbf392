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

#include <set>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "src/uip_authz/http/authz/header_names.h"

namespace UipAuthz {
namespace Http {
namespace Authz {
namespace {

const char kPseudoHeaderPrefix = ':';

// Pseudo-header name without colon -> authorization request key.
const std::map<std::string, std::string>& PseudoHeaderRenames() {
  static const auto* renames = new std::map<std::string, std::string>{
      {"method", HeaderNames::kOriginalRequestPrefix + "method"},
      {"scheme", HeaderNames::kOriginalRequestPrefix + "scheme"},
      {"authority", HeaderNames::kOriginalRequestPrefix + "authority"},
      {"path", HeaderNames::kOriginalRequestPrefix + "path"},
  };
  return *renames;
}

const std::set<std::string>& ForwardedHeaders() {
  static const auto* headers = new std::set<std::string>{
      HeaderNames::kForwardedClientCert, HeaderNames::kRequestId,
      HeaderNames::kCorrelationId,       HeaderNames::kAuthorization,
      HeaderNames::kImpersonatedUser,    HeaderNames::kEventServiceUser,
      HeaderNames::kTrinoUser,
  };
  return *headers;
}

}  // namespace

std::string RenamePseudoHeader(const std::string& name) {
  const auto& renames = PseudoHeaderRenames();
  auto it = renames.find(name);
  if (it != renames.end()) {
    return it->second;
  }
  return absl::StrCat(HeaderNames::kOriginalRequestPrefix, name);
}

bool IsForwardedHeader(const std::string& name) {
  return ForwardedHeaders().count(name) > 0;
}

HeaderMapping BuildHeaderMapping(const HeaderPairs& headers) {
  HeaderMapping mapping;
  for (const auto& header : headers) {
    const std::string name = absl::AsciiStrToLower(header.first);
    if (!name.empty() && name[0] == kPseudoHeaderPrefix) {
      // A bare ":" carries no name to rename.
      if (name.size() > 1) {
        mapping[RenamePseudoHeader(name.substr(1))] = header.second;
      }
      continue;
    }
    if (IsForwardedHeader(name)) {
      mapping[name] = header.second;
    }
  }
  return mapping;
}

const std::string* FindHeader(const HeaderPairs& headers,
                              const std::string& name) {
  const std::string* value = nullptr;
  for (const auto& header : headers) {
    if (absl::EqualsIgnoreCase(header.first, name)) {
      value = &header.second;
    }
  }
  return value;
}

}  // namespace Authz
}  // namespace Http
}  // namespace UipAuthz
