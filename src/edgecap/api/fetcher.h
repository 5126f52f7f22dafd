// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <edgecap/api/http.h>
#include <edgecap/io/host-object.h>

#include <kj/async.h>

namespace edgecap::api {

// The host shape behind every binding that can make outbound HTTP requests: plain service
// fetchers as well as mTLS certificate bindings. The host registers all of them under the type
// name "Fetcher"; whether a client certificate is presented is a property of how the host built
// the object, invisible through this interface.
//
// Both methods are const and so, by KJ convention, must be safe to call from any thread holding a
// reference. Failures are reported by throwing or by rejecting the returned promise; an HTTP
// error status is a successful response.
class HostFetcher: public HostObject {
 public:
  static constexpr kj::StringPtr TYPE_NAME = "Fetcher"_kj;

  kj::StringPtr getTypeName() const override {
    return TYPE_NAME;
  }

  // Fetches `url`. If `init` is given, its settings are merged into the request first. `url` and
  // `init` remain valid until the returned promise settles.
  virtual kj::Promise<kj::Own<HostResponse>> fetch(
      kj::StringPtr url, kj::Maybe<const RequestInit&> init) const = 0;

  // Issues a request that the caller already built.
  virtual kj::Promise<kj::Own<HostResponse>> fetch(Request request) const = 0;
};

}  // namespace edgecap::api
