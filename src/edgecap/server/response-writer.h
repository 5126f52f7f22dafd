// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <edgecap/api/http.h>

#include <kj/async-io.h>

namespace edgecap::server {

// Writes "<status> <statusText>\n" followed by the body, the way `edgecap fetch` prints a
// response. Consumes the response body.
kj::Promise<void> writeResponse(api::FetchResponse& response, kj::AsyncOutputStream& output);

}  // namespace edgecap::server
