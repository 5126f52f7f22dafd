// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

// Built once for each response shape, see EDGECAP_HTTP_RESPONSE.

#include "mtls-certificate.h"

#include <edgecap/util/stream-utils.h>

#include <kj/async.h>
#include <kj/debug.h>
#include <kj/mutex.h>
#include <kj/test.h>
#include <kj/thread.h>

namespace edgecap::api {
namespace {

// Stands in for the host. Answers every request with a canned response, or fails the way it was
// told to, and remembers the requests it saw.
class FakeFetcher final: public HostFetcher {
 public:
  enum class Mode {
    RESPOND,
    THROW,
    REJECT,
    NULL_BODY,
    // Reads the URL and init only after yielding to the event loop.
    DEFER,
  };

  Mode mode = Mode::RESPOND;
  uint status = 200;
  kj::Vector<Header> responseHeaders;
  kj::String responseBody = kj::str("Success");

  mutable kj::Vector<Request> requests;

  kj::Promise<kj::Own<HostResponse>> fetch(
      kj::StringPtr url, kj::Maybe<const RequestInit&> init) const override {
    if (mode == Mode::DEFER) {
      return deferredFetch(url, init);
    }
    return fetch(Request::fromUrl(url, init));
  }

  kj::Promise<kj::Own<HostResponse>> fetch(Request request) const override {
    requests.add(kj::mv(request));

    switch (mode) {
      case Mode::RESPOND:
      case Mode::DEFER:
        return makeResponse(util::newMemoryInputStream(kj::str(responseBody)));
      case Mode::THROW:
        KJ_FAIL_REQUIRE("client certificate rejected by peer");
      case Mode::REJECT:
        return KJ_EXCEPTION(DISCONNECTED, "connection reset by peer");
      case Mode::NULL_BODY:
        return makeResponse(nullptr);
    }
    KJ_UNREACHABLE;
  }

 private:
  kj::Promise<kj::Own<HostResponse>> deferredFetch(
      kj::StringPtr url, kj::Maybe<const RequestInit&> init) const {
    co_await kj::yield();
    co_return co_await fetch(Request::fromUrl(url, init));
  }

  kj::Own<HostResponse> makeResponse(kj::Own<kj::AsyncInputStream> body) const {
    return kj::heap<HostResponse>(HostResponse{
      .status = status,
      .statusText = kj::str(status == 200 ? "OK" : "Bad Request"),
      .headers = KJ_MAP(header, responseHeaders) { return header.clone(); },
      .body = kj::mv(body),
    });
  }
};

// A host fetcher that is safe to share between threads. It always answers 200.
class SharedFetcher final: public HostFetcher {
 public:
  kj::MutexGuarded<kj::Vector<kj::String>> urls;

  kj::Promise<kj::Own<HostResponse>> fetch(
      kj::StringPtr url, kj::Maybe<const RequestInit&> init) const override {
    return fetch(Request::fromUrl(url, init));
  }

  kj::Promise<kj::Own<HostResponse>> fetch(Request request) const override {
    urls.lockExclusive()->add(kj::mv(request.url));
    return kj::heap<HostResponse>(HostResponse{
      .status = 200,
      .statusText = kj::str("OK"),
      .headers = nullptr,
      .body = util::newMemoryInputStream(kj::str("Success")),
    });
  }
};

struct TestFixture {
  kj::EventLoop loop;
  kj::WaitScope waitScope{loop};
  kj::Own<FakeFetcher> fetcher = kj::atomicRefcounted<FakeFetcher>();

  MtlsCertificate makeCert() {
    return MtlsCertificate(kj::atomicAddRef(*fetcher));
  }
};

FetchResponse expectResponse(MtlsCertificate::FetchResult result) {
  KJ_SWITCH_ONEOF(result) {
    KJ_CASE_ONEOF(response, FetchResponse) {
      return kj::mv(response);
    }
    KJ_CASE_ONEOF(error, FetchError) {
      KJ_FAIL_ASSERT("fetch failed", error);
    }
  }
  KJ_UNREACHABLE;
}

FetchError expectError(MtlsCertificate::FetchResult result) {
  KJ_SWITCH_ONEOF(result) {
    KJ_CASE_ONEOF(response, FetchResponse) {
      KJ_FAIL_ASSERT("expected fetch to fail");
    }
    KJ_CASE_ONEOF(error, FetchError) {
      return kj::mv(error);
    }
  }
  KJ_UNREACHABLE;
}

uint statusOf(FetchResponse& response) {
#if EDGECAP_HTTP_RESPONSE
  return response.status;
#else
  return response.getStatus();
#endif
}

kj::String bodyOf(FetchResponse& response, kj::WaitScope& waitScope) {
#if EDGECAP_HTTP_RESPONSE
  return response.body->readAllText().wait(waitScope);
#else
  return response.getBody().readAllText().wait(waitScope);
#endif
}

KJ_TEST("fetch returns the host's response") {
  TestFixture fixture;
  auto cert = fixture.makeCert();

  auto response = expectResponse(
      cert.fetch("https://api.example.com/endpoint").wait(fixture.waitScope));
  KJ_EXPECT(statusOf(response) == 200);
  KJ_EXPECT(bodyOf(response, fixture.waitScope) == "Success");

  KJ_ASSERT(fixture.fetcher->requests.size() == 1);
  auto& request = fixture.fetcher->requests[0];
  KJ_EXPECT(request.method == kj::HttpMethod::GET);
  KJ_EXPECT(request.url == "https://api.example.com/endpoint");
}

KJ_TEST("an HTTP error status is a successful fetch") {
  TestFixture fixture;
  fixture.fetcher->status = 400;
  auto cert = fixture.makeCert();

  auto response =
      expectResponse(cert.fetch("https://api.example.com/").wait(fixture.waitScope));
  KJ_EXPECT(statusOf(response) == 400);
}

KJ_TEST("fetch passes init through to the host") {
  TestFixture fixture;
  auto cert = fixture.makeCert();

  RequestInit init;
  init.method = kj::HttpMethod::POST;
  init.headers = kj::arr(Header{kj::str("Content-Type"), kj::str("application/json")});
  init.body = kj::heapArray("{}"_kj.asBytes());
  init.redirect = Redirect::ERROR;

  expectResponse(cert.fetch("https://api.example.com/submit", kj::mv(init))
                     .wait(fixture.waitScope));

  KJ_ASSERT(fixture.fetcher->requests.size() == 1);
  auto& request = fixture.fetcher->requests[0];
  KJ_EXPECT(request.method == kj::HttpMethod::POST);
  KJ_ASSERT(request.headers.size() == 1);
  KJ_EXPECT(request.headers[0].value == "application/json");
  KJ_EXPECT(KJ_ASSERT_NONNULL(request.body).size() == 2);
  KJ_EXPECT(request.redirect == Redirect::ERROR);
}

KJ_TEST("host failures are transport errors") {
  {
    TestFixture fixture;
    fixture.fetcher->mode = FakeFetcher::Mode::THROW;
    auto cert = fixture.makeCert();

    auto error = expectError(cert.fetch("https://api.example.com/").wait(fixture.waitScope));
    KJ_EXPECT(error.type == FetchError::Type::TRANSPORT);
    KJ_EXPECT(error.message.contains("client certificate rejected"));
  }
  {
    TestFixture fixture;
    fixture.fetcher->mode = FakeFetcher::Mode::REJECT;
    auto cert = fixture.makeCert();

    auto error = expectError(cert.fetch("https://api.example.com/").wait(fixture.waitScope));
    KJ_EXPECT(error.type == FetchError::Type::TRANSPORT);
    KJ_EXPECT(error.message.contains("connection reset"));
  }
}

KJ_TEST("a response without a body is malformed") {
  TestFixture fixture;
  fixture.fetcher->mode = FakeFetcher::Mode::NULL_BODY;
  auto cert = fixture.makeCert();

  auto error = expectError(cert.fetch("https://api.example.com/").wait(fixture.waitScope));
  KJ_EXPECT(error.type == FetchError::Type::TRANSPORT);
  KJ_EXPECT(error.message.contains("malformed"));
}

KJ_TEST("fetchRequest sends a native request") {
  TestFixture fixture;
  auto cert = fixture.makeCert();

  auto request = Request::fromUrl("https://api.example.com/item");
  request.method = kj::HttpMethod::DELETE;

  auto response = expectResponse(cert.fetchRequest(kj::mv(request)).wait(fixture.waitScope));
  KJ_EXPECT(statusOf(response) == 200);

  KJ_ASSERT(fixture.fetcher->requests.size() == 1);
  KJ_EXPECT(fixture.fetcher->requests[0].method == kj::HttpMethod::DELETE);
}

KJ_TEST("fetchRequest sends a standard request") {
  TestFixture fixture;
  auto cert = fixture.makeCert();

  HttpRequest request{
    .method = kj::str("PATCH"),
    .url = kj::str("https://api.example.com/item"),
  };
  request.headers.addPtrPtr("X-Request-Id", "abc");
  request.body = kj::heapArray("patch"_kj.asBytes());

  expectResponse(cert.fetchRequest(kj::mv(request)).wait(fixture.waitScope));

  KJ_ASSERT(fixture.fetcher->requests.size() == 1);
  auto& sent = fixture.fetcher->requests[0];
  KJ_EXPECT(sent.method == kj::HttpMethod::PATCH);
  KJ_ASSERT(sent.headers.size() == 1);
  KJ_EXPECT(sent.headers[0].name == "X-Request-Id");
}

KJ_TEST("fetchRequest rejects an invalid request without calling the host") {
  TestFixture fixture;
  auto cert = fixture.makeCert();

  {
    HttpRequest request{
      .method = kj::str("NOT A METHOD"),
      .url = kj::str("https://api.example.com/"),
    };
    auto error = expectError(cert.fetchRequest(kj::mv(request)).wait(fixture.waitScope));
    KJ_EXPECT(error.type == FetchError::Type::INVALID_REQUEST);
  }
  {
    auto error = expectError(
        cert.fetchRequest(Request::fromUrl("mailto:someone@example.com")).wait(fixture.waitScope));
    KJ_EXPECT(error.type == FetchError::Type::INVALID_REQUEST);
  }

  KJ_EXPECT(fixture.fetcher->requests.size() == 0);
}

KJ_TEST("clones are equal and fetch through the same host object") {
  TestFixture fixture;
  auto cert = fixture.makeCert();
  auto copy = cert.clone();
  KJ_EXPECT(copy == cert);

  auto first = expectResponse(cert.fetch("https://api.example.com/a").wait(fixture.waitScope));
  auto second = expectResponse(copy.fetch("https://api.example.com/a").wait(fixture.waitScope));
  KJ_EXPECT(statusOf(first) == statusOf(second));
  KJ_EXPECT(bodyOf(first, fixture.waitScope) == bodyOf(second, fixture.waitScope));

  KJ_EXPECT(fixture.fetcher->requests.size() == 2);
}

KJ_TEST("concurrent fetches through one binding are independent") {
  TestFixture fixture;
  auto cert = fixture.makeCert();

  auto a = cert.fetch("https://api.example.com/a");
  auto b = cert.fetch("https://api.example.com/b");

  auto responseB = expectResponse(b.wait(fixture.waitScope));
  auto responseA = expectResponse(a.wait(fixture.waitScope));
  KJ_EXPECT(statusOf(responseA) == 200);
  KJ_EXPECT(statusOf(responseB) == 200);
  KJ_EXPECT(fixture.fetcher->requests.size() == 2);
}

KJ_TEST("the host object outlives a dropped handle while a fetch is in flight") {
  TestFixture fixture;
  auto promise = fixture.makeCert().fetch("https://api.example.com/");

  // Only the fixture and the in-flight fetch hold the host object now.
  KJ_EXPECT(fixture.fetcher->isShared());

  auto response = expectResponse(promise.wait(fixture.waitScope));
  KJ_EXPECT(statusOf(response) == 200);
}

KJ_TEST("the host can read url and init after fetch returns") {
  TestFixture fixture;
  fixture.fetcher->mode = FakeFetcher::Mode::DEFER;
  auto cert = fixture.makeCert();

  auto promise = [&]() {
    auto url = kj::str("https://api.example.com/deferred");
    RequestInit init;
    init.method = kj::HttpMethod::PUT;
    init.headers = kj::arr(Header{kj::str("X-Trace"), kj::str("1234")});
    return cert.fetch(url, kj::mv(init));
  }();

  // The caller's url and init are gone, and the host hasn't looked at them yet.
  KJ_EXPECT(fixture.fetcher->requests.size() == 0);

  expectResponse(promise.wait(fixture.waitScope));
  KJ_ASSERT(fixture.fetcher->requests.size() == 1);
  auto& request = fixture.fetcher->requests[0];
  KJ_EXPECT(request.url == "https://api.example.com/deferred");
  KJ_EXPECT(request.method == kj::HttpMethod::PUT);
  KJ_ASSERT(request.headers.size() == 1);
  KJ_EXPECT(request.headers[0].value == "1234");
}

KJ_TEST("a clone made on another thread fetches on that thread's event loop") {
  auto fetcher = kj::atomicRefcounted<SharedFetcher>();

  {
    auto cert = MtlsCertificate(kj::atomicAddRef(*fetcher));

    bool cloneEqual = false;
    uint status = 0;
    kj::String body;
    {
      kj::Thread thread([&]() {
        kj::EventLoop loop;
        kj::WaitScope waitScope(loop);

        auto copy = cert.clone();
        cloneEqual = copy == cert;

        auto response = expectResponse(
            copy.fetch("https://api.example.com/from-thread").wait(waitScope));
        status = statusOf(response);
        body = bodyOf(response, waitScope);
      });

      // The original keeps working on this thread while the other one runs.
      kj::EventLoop loop;
      kj::WaitScope waitScope(loop);
      auto response =
          expectResponse(cert.fetch("https://api.example.com/from-main").wait(waitScope));
      KJ_EXPECT(statusOf(response) == 200);
    }

    KJ_EXPECT(cloneEqual);
    KJ_EXPECT(status == 200);
    KJ_EXPECT(body == "Success");
    KJ_EXPECT(fetcher->urls.lockShared()->size() == 2);

    // The clone is gone; only `fetcher` and `cert` remain.
    KJ_EXPECT(fetcher->isShared());
  }

  KJ_EXPECT(!fetcher->isShared());
}

#if EDGECAP_HTTP_RESPONSE

KJ_TEST("a response kj::HttpHeaders can't carry is incompatible") {
  TestFixture fixture;
  fixture.fetcher->responseHeaders.add(Header{kj::str("Bad Header"), kj::str("x")});
  auto cert = fixture.makeCert();

  auto error = expectError(cert.fetch("https://api.example.com/").wait(fixture.waitScope));
  KJ_EXPECT(error.type == FetchError::Type::INCOMPATIBLE_RESPONSE);
  KJ_EXPECT(error.message.contains("Bad Header"));
}

KJ_TEST("standard responses carry the host's headers") {
  TestFixture fixture;
  fixture.fetcher->responseHeaders.add(
      Header{kj::str("Content-Type"), kj::str("application/json")});
  auto cert = fixture.makeCert();

  auto response =
      expectResponse(cert.fetch("https://api.example.com/").wait(fixture.waitScope));
  KJ_EXPECT(KJ_ASSERT_NONNULL(response.headers.get(kj::HttpHeaderId::CONTENT_TYPE)) ==
      "application/json");
}

#else

KJ_TEST("native responses pass the host's headers through untouched") {
  TestFixture fixture;
  fixture.fetcher->responseHeaders.add(Header{kj::str("Bad Header"), kj::str("x")});
  auto cert = fixture.makeCert();

  auto response =
      expectResponse(cert.fetch("https://api.example.com/").wait(fixture.waitScope));
  KJ_EXPECT(KJ_ASSERT_NONNULL(response.getHeader("bad header")) == "x");
}

#endif

}  // namespace
}  // namespace edgecap::api
