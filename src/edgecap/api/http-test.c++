// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "http.h"

#include <edgecap/util/stream-utils.h>

#include <kj/async.h>
#include <kj/debug.h>
#include <kj/test.h>
#include <kj/vector.h>

namespace edgecap::api {
namespace {

kj::Own<HostResponse> makeHostResponse(
    uint status, kj::Array<Header> headers, kj::StringPtr body = "hello"_kj) {
  return kj::heap<HostResponse>(HostResponse{
    .status = status,
    .statusText = kj::str("OK"),
    .headers = kj::mv(headers),
    .body = util::newMemoryInputStream(kj::str(body)),
  });
}

kj::Array<Header> headers(std::initializer_list<std::pair<kj::StringPtr, kj::StringPtr>> list) {
  return KJ_MAP(entry, list) { return Header{kj::str(entry.first), kj::str(entry.second)}; };
}

kj::String dumpHeaders(const kj::HttpHeaders& headers) {
  kj::Vector<kj::String> parts;
  headers.forEach([&](kj::StringPtr name, kj::StringPtr value) {
    parts.add(kj::str(name, ": ", value));
  });
  return kj::strArray(parts, "\n");
}

HttpResponse expectHttpResponse(kj::OneOf<HttpResponse, AdaptError> result) {
  KJ_SWITCH_ONEOF(result) {
    KJ_CASE_ONEOF(response, HttpResponse) {
      return kj::mv(response);
    }
    KJ_CASE_ONEOF(error, AdaptError) {
      KJ_FAIL_ASSERT("adaptation failed", error.message);
    }
  }
  KJ_UNREACHABLE;
}

kj::String expectAdaptError(kj::OneOf<HttpResponse, AdaptError> result) {
  KJ_SWITCH_ONEOF(result) {
    KJ_CASE_ONEOF(response, HttpResponse) {
      KJ_FAIL_ASSERT("expected adaptation to fail", response.status);
    }
    KJ_CASE_ONEOF(error, AdaptError) {
      return kj::mv(error.message);
    }
  }
  KJ_UNREACHABLE;
}

Request expectRequest(kj::OneOf<Request, FetchError> result) {
  KJ_SWITCH_ONEOF(result) {
    KJ_CASE_ONEOF(request, Request) {
      return kj::mv(request);
    }
    KJ_CASE_ONEOF(error, FetchError) {
      KJ_FAIL_ASSERT("conversion failed", error);
    }
  }
  KJ_UNREACHABLE;
}

FetchError expectFetchError(kj::OneOf<Request, FetchError> result) {
  KJ_SWITCH_ONEOF(result) {
    KJ_CASE_ONEOF(request, Request) {
      KJ_FAIL_ASSERT("expected conversion to fail", request.url);
    }
    KJ_CASE_ONEOF(error, FetchError) {
      return kj::mv(error);
    }
  }
  KJ_UNREACHABLE;
}

KJ_TEST("Response exposes the host response as-is") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);

  Response response(makeHostResponse(
      404, headers({{"Content-Type", "text/plain"}, {"X-Trace", "a"}, {"x-trace", "b"}})));

  KJ_EXPECT(response.getStatus() == 404);
  KJ_EXPECT(response.getStatusText() == "OK");
  KJ_EXPECT(!response.isOk());

  auto list = response.getHeaders();
  KJ_ASSERT(list.size() == 3);
  KJ_EXPECT(list[0].name == "Content-Type");
  KJ_EXPECT(list[2].name == "x-trace");

  KJ_EXPECT(KJ_ASSERT_NONNULL(response.getHeader("content-type")) == "text/plain");
  KJ_EXPECT(KJ_ASSERT_NONNULL(response.getHeader("X-TRACE")) == "a");
  KJ_EXPECT(response.getHeader("Location") == kj::none);

  KJ_EXPECT(response.getBody().readAllText().wait(waitScope) == "hello");
}

KJ_TEST("toHttpResponse carries status, headers and body") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);

  auto response = expectHttpResponse(toHttpResponse(Response(
      makeHostResponse(200, headers({{"Content-Type", "application/json"}, {"X-Id", "7"}}),
          "{\"ok\":true}"))));

  KJ_EXPECT(response.status == 200);
  KJ_EXPECT(response.statusText == "OK");
  KJ_EXPECT(KJ_ASSERT_NONNULL(response.headers.get(kj::HttpHeaderId::CONTENT_TYPE)) ==
      "application/json");
  KJ_EXPECT(dumpHeaders(response.headers).contains("X-Id: 7"));
  KJ_EXPECT(response.body->readAllText().wait(waitScope) == "{\"ok\":true}");
}

KJ_TEST("toHttpResponse is deterministic") {
  auto makeOne = []() {
    return expectHttpResponse(toHttpResponse(
        Response(makeHostResponse(201, headers({{"B", "2"}, {"A", "1"}, {"B", "3"}})))));
  };

  auto first = makeOne();
  auto second = makeOne();
  KJ_EXPECT(first.status == second.status);
  KJ_EXPECT(first.statusText == second.statusText);
  KJ_EXPECT(dumpHeaders(first.headers) == dumpHeaders(second.headers));
}

KJ_TEST("toHttpResponse rejects what kj::HttpHeaders can't carry") {
  KJ_EXPECT(expectAdaptError(toHttpResponse(Response(makeHostResponse(42, nullptr))))
                .contains("status 42"));
  KJ_EXPECT(expectAdaptError(toHttpResponse(Response(makeHostResponse(1000, nullptr))))
                .contains("status 1000"));
  KJ_EXPECT(expectAdaptError(toHttpResponse(Response(
                                 makeHostResponse(200, headers({{"Bad Name", "x"}})))))
                .contains("Bad Name"));
  KJ_EXPECT(expectAdaptError(toHttpResponse(Response(
                                 makeHostResponse(200, headers({{"X-Split", "a\r\nb"}})))))
                .contains("X-Split"));
  KJ_EXPECT(expectAdaptError(toHttpResponse(Response(
                                 makeHostResponse(200, headers({{"", "x"}})))))
                .contains("not an HTTP token"));
}

KJ_TEST("Request::fromUrl applies init on top of the defaults") {
  auto plain = Request::fromUrl("https://example.com/");
  KJ_EXPECT(plain.method == kj::HttpMethod::GET);
  KJ_EXPECT(plain.url == "https://example.com/");
  KJ_EXPECT(plain.headers.size() == 0);
  KJ_EXPECT(plain.body == kj::none);
  KJ_EXPECT(plain.redirect == Redirect::FOLLOW);

  RequestInit init;
  init.method = kj::HttpMethod::POST;
  init.headers = headers({{"Content-Type", "text/plain"}});
  init.body = kj::heapArray("payload"_kj.asBytes());
  init.redirect = Redirect::MANUAL;

  auto request = Request::fromUrl("https://example.com/submit", init);
  KJ_EXPECT(request.method == kj::HttpMethod::POST);
  KJ_ASSERT(request.headers.size() == 1);
  KJ_EXPECT(request.headers[0].name == "Content-Type");
  KJ_EXPECT(kj::str(KJ_ASSERT_NONNULL(request.body).asChars()) == "payload");
  KJ_EXPECT(request.redirect == Redirect::MANUAL);

  // `init` is left untouched.
  KJ_EXPECT(KJ_ASSERT_NONNULL(init.headers).size() == 1);
  KJ_EXPECT(KJ_ASSERT_NONNULL(init.body).size() == 7);
}

KJ_TEST("toRequest accepts a well-formed request") {
  auto request = expectRequest(toRequest(Request::fromUrl("http://example.com/path?q=1")));
  KJ_EXPECT(request.url == "http://example.com/path?q=1");
}

KJ_TEST("toRequest rejects malformed requests") {
  {
    auto error = expectFetchError(toRequest(Request::fromUrl("not a url")));
    KJ_EXPECT(error.type == FetchError::Type::INVALID_REQUEST);
  }
  {
    auto error = expectFetchError(toRequest(Request::fromUrl("ftp://example.com/file")));
    KJ_EXPECT(error.type == FetchError::Type::INVALID_REQUEST);
    KJ_EXPECT(error.message.contains("unsupported scheme"));
  }
  {
    auto request = Request::fromUrl("https://example.com/");
    request.headers = headers({{"Bad:Name", "x"}});
    auto error = expectFetchError(toRequest(kj::mv(request)));
    KJ_EXPECT(error.message.contains("Bad:Name"));
  }
  {
    auto request = Request::fromUrl("https://example.com/");
    request.body = kj::heapArray("x"_kj.asBytes());
    auto error = expectFetchError(toRequest(kj::mv(request)));
    KJ_EXPECT(error.message.contains("cannot have a body"));
  }
}

KJ_TEST("toRequest converts a standard request") {
  HttpRequest http{
    .method = kj::str("PUT"),
    .url = kj::str("https://example.com/item/1"),
  };
  http.headers.set(kj::HttpHeaderId::CONTENT_TYPE, "text/plain");
  http.headers.addPtrPtr("X-Custom", "yes");
  http.body = kj::heapArray("data"_kj.asBytes());

  auto request = expectRequest(toRequest(kj::mv(http)));
  KJ_EXPECT(request.method == kj::HttpMethod::PUT);
  KJ_EXPECT(request.url == "https://example.com/item/1");
  KJ_EXPECT(request.headers.size() == 2);
  KJ_EXPECT(KJ_ASSERT_NONNULL(request.body).size() == 4);
  KJ_EXPECT(request.redirect == Redirect::FOLLOW);
}

KJ_TEST("toRequest rejects a standard request with an unknown method") {
  HttpRequest http{
    .method = kj::str("FROB"),
    .url = kj::str("https://example.com/"),
  };

  auto error = expectFetchError(toRequest(kj::mv(http)));
  KJ_EXPECT(error.type == FetchError::Type::INVALID_REQUEST);
  KJ_EXPECT(error.message.contains("FROB"));
}

KJ_TEST("FetchError stringifies with its kind") {
  auto error = FetchError::invalidRequest(kj::str("Invalid URL: x"));
  KJ_EXPECT(kj::str(error) == "invalid request: Invalid URL: x");

  auto exception = KJ_EXCEPTION(DISCONNECTED, "connection reset");
  auto transport = FetchError::transport(exception);
  KJ_EXPECT(transport.type == FetchError::Type::TRANSPORT);
  KJ_EXPECT(transport.message.contains("connection reset"));
}

}  // namespace
}  // namespace edgecap::api
