// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "response-writer.h"

#include <edgecap/util/stream-utils.h>

#include <kj/async.h>
#include <kj/debug.h>
#include <kj/test.h>

namespace edgecap::server {
namespace {

kj::String writeToString(uint status, kj::StringPtr statusText, kj::StringPtr body) {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);

  auto adapted = api::adaptResponse(kj::heap<api::HostResponse>(api::HostResponse{
    .status = status,
    .statusText = kj::str(statusText),
    .headers = kj::arr(api::Header{kj::str("Content-Type"), kj::str("text/plain")}),
    .body = util::newMemoryInputStream(kj::str(body)),
  }));
  auto& response = KJ_ASSERT_NONNULL(adapted.tryGet<api::FetchResponse>());

  kj::Vector<kj::byte> buffer;
  auto output = util::newMemoryOutputStream(buffer);
  writeResponse(response, *output).wait(waitScope);

  return kj::heapString(buffer.asPtr().asChars());
}

KJ_TEST("writeResponse prints the status line before the body") {
  KJ_EXPECT(writeToString(200, "OK", "hello world") == "200 OK\nhello world");
}

KJ_TEST("writeResponse prints error statuses the same way") {
  KJ_EXPECT(writeToString(404, "Not Found", "no such page") == "404 Not Found\nno such page");
}

KJ_TEST("writeResponse prints only the status line for an empty body") {
  KJ_EXPECT(writeToString(204, "No Content", "") == "204 No Content\n");
}

}  // namespace
}  // namespace edgecap::server
