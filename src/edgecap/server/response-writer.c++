// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "response-writer.h"

namespace edgecap::server {

kj::Promise<void> writeResponse(api::FetchResponse& response, kj::AsyncOutputStream& output) {
#if EDGECAP_HTTP_RESPONSE
  auto statusLine = kj::str(response.status, ' ', response.statusText, '\n');
  kj::AsyncInputStream& body = *response.body;
#else
  auto statusLine = kj::str(response.getStatus(), ' ', response.getStatusText(), '\n');
  kj::AsyncInputStream& body = response.getBody();
#endif

  co_await output.write(statusLine.asBytes());
  co_await body.pumpTo(output);
}

}  // namespace edgecap::server
