// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "external-fetcher.h"

#include <edgecap/api/mtls-certificate.h>

#include <kj/async-io.h>
#include <kj/compat/http.h>
#include <kj/debug.h>
#include <kj/test.h>

namespace edgecap::server {
namespace {

// A small origin server for the fetcher to talk to.
//
//   /hello      200 "hello world"
//   /echo       200 "<method> <body>"
//   /found      302 -> /hello
//   /see-other  303 -> /echo
//   /loop       302 -> /loop
//   /dangling   302 without a Location
class OriginService final: public kj::HttpService {
 public:
  kj::Promise<void> request(kj::HttpMethod method,
      kj::StringPtr url,
      const kj::HttpHeaders& headers,
      kj::AsyncInputStream& requestBody,
      Response& response) override {
    auto requestText = co_await requestBody.readAllText();
    ++requestCount;

    kj::HttpHeaders responseHeaders(api::getHeaderTable());
    if (url == "/hello") {
      responseHeaders.set(kj::HttpHeaderId::CONTENT_TYPE, "text/plain");
      co_await sendBody(response, 200, "OK", responseHeaders, "hello world");
    } else if (url == "/echo") {
      KJ_IF_SOME(value, headers.get(kj::HttpHeaderId::CONTENT_TYPE)) {
        responseHeaders.set(kj::HttpHeaderId::CONTENT_TYPE, kj::str(value));
      }
      co_await sendBody(response, 200, "OK", responseHeaders, kj::str(method, " ", requestText));
    } else if (url == "/found") {
      responseHeaders.set(kj::HttpHeaderId::LOCATION, "/hello");
      response.send(302, "Found", responseHeaders, uint64_t(0));
    } else if (url == "/see-other") {
      responseHeaders.set(kj::HttpHeaderId::LOCATION, "/echo");
      response.send(303, "See Other", responseHeaders, uint64_t(0));
    } else if (url == "/loop") {
      responseHeaders.set(kj::HttpHeaderId::LOCATION, "/loop");
      response.send(302, "Found", responseHeaders, uint64_t(0));
    } else if (url == "/dangling") {
      response.send(302, "Found", responseHeaders, uint64_t(0));
    } else {
      co_await sendBody(response, 404, "Not Found", responseHeaders, "no such page");
    }
  }

  uint requestCount = 0;

 private:
  static kj::Promise<void> sendBody(Response& response,
      uint status,
      kj::StringPtr statusText,
      const kj::HttpHeaders& headers,
      kj::String body) {
    auto stream = response.send(status, statusText, headers, body.size());
    co_await stream->write(body.asBytes());
  }
};

struct TestFixture {
  kj::AsyncIoContext io = kj::setupAsyncIo();
  kj::Timer& timer = io.provider->getTimer();
  kj::Network& network = io.provider->getNetwork();

  OriginService service;
  kj::HttpServer httpServer{timer, api::getHeaderTable(), service};
  kj::Own<kj::ConnectionReceiver> listener =
      network.parseAddress("127.0.0.1", 0).wait(io.waitScope)->listen();
  kj::Promise<void> listenTask = httpServer.listenHttp(*listener).eagerlyEvaluate(nullptr);

  kj::Own<ExternalFetcher> fetcher =
      kj::atomicRefcounted<ExternalFetcher>(timer, network, kj::heap<kj::TlsContext>());

  kj::String url(kj::StringPtr path) {
    return kj::str("http://127.0.0.1:", listener->getPort(), path);
  }

  kj::Own<api::HostResponse> fetch(
      kj::StringPtr path, kj::Maybe<const api::RequestInit&> init = kj::none) {
    return fetcher->fetch(url(path), init).wait(io.waitScope);
  }

  kj::String readBody(api::HostResponse& response) {
    return response.body->readAllText().wait(io.waitScope);
  }
};

kj::Maybe<kj::StringPtr> findHeader(const api::HostResponse& response, kj::StringPtr name) {
  for (auto& header: response.headers) {
    if (header.name == name) return kj::StringPtr(header.value);
  }
  return kj::none;
}

KJ_TEST("ExternalFetcher fetches over HTTP") {
  TestFixture fixture;

  auto response = fixture.fetch("/hello");
  KJ_EXPECT(response->status == 200);
  KJ_EXPECT(response->statusText == "OK");
  KJ_EXPECT(KJ_ASSERT_NONNULL(findHeader(*response, "Content-Type")) == "text/plain");
  KJ_EXPECT(fixture.readBody(*response) == "hello world");
}

KJ_TEST("ExternalFetcher returns error statuses as responses") {
  TestFixture fixture;

  auto response = fixture.fetch("/missing");
  KJ_EXPECT(response->status == 404);
  KJ_EXPECT(fixture.readBody(*response) == "no such page");
}

KJ_TEST("ExternalFetcher sends method, headers and body") {
  TestFixture fixture;

  api::RequestInit init;
  init.method = kj::HttpMethod::POST;
  init.headers = kj::arr(api::Header{kj::str("Content-Type"), kj::str("application/json")});
  init.body = kj::heapArray("{\"id\":1}"_kj.asBytes());

  auto response = fixture.fetch("/echo", init);
  KJ_EXPECT(response->status == 200);
  KJ_EXPECT(KJ_ASSERT_NONNULL(findHeader(*response, "Content-Type")) == "application/json");
  KJ_EXPECT(fixture.readBody(*response) == "POST {\"id\":1}");
}

KJ_TEST("ExternalFetcher follows redirects") {
  TestFixture fixture;

  auto response = fixture.fetch("/found");
  KJ_EXPECT(response->status == 200);
  KJ_EXPECT(fixture.readBody(*response) == "hello world");
  KJ_EXPECT(fixture.service.requestCount == 2);
}

KJ_TEST("ExternalFetcher turns a POST into a GET on 303") {
  TestFixture fixture;

  api::RequestInit init;
  init.method = kj::HttpMethod::POST;
  init.body = kj::heapArray("form"_kj.asBytes());

  auto response = fixture.fetch("/see-other", init);
  KJ_EXPECT(response->status == 200);
  KJ_EXPECT(fixture.readBody(*response) == "GET ");
}

KJ_TEST("ExternalFetcher returns redirects as-is in manual mode") {
  TestFixture fixture;

  api::RequestInit init;
  init.redirect = api::Redirect::MANUAL;

  auto response = fixture.fetch("/found", init);
  KJ_EXPECT(response->status == 302);
  KJ_EXPECT(KJ_ASSERT_NONNULL(findHeader(*response, "Location")) == "/hello");
  KJ_EXPECT(fixture.service.requestCount == 1);

  auto dangling = fixture.fetch("/dangling");
  KJ_EXPECT(dangling->status == 302);
}

KJ_TEST("ExternalFetcher fails on redirects in error mode") {
  TestFixture fixture;

  api::RequestInit init;
  init.redirect = api::Redirect::ERROR;

  KJ_EXPECT_THROW_MESSAGE("redirect mode is \"error\"", fixture.fetch("/found", init));
}

KJ_TEST("ExternalFetcher gives up on redirect loops") {
  TestFixture fixture;

  KJ_EXPECT_THROW_MESSAGE("too many redirects", fixture.fetch("/loop"));
  KJ_EXPECT(fixture.service.requestCount == ExternalFetcher::MAX_REDIRECTS + 1);
}

KJ_TEST("MtlsCertificate reports ExternalFetcher failures as transport errors") {
  TestFixture fixture;
  api::MtlsCertificate cert(kj::atomicAddRef(*fixture.fetcher));

  {
    api::RequestInit init;
    init.redirect = api::Redirect::ERROR;
    auto result = cert.fetch(fixture.url("/found"), kj::mv(init)).wait(fixture.io.waitScope);
    auto& error = KJ_ASSERT_NONNULL(result.tryGet<api::FetchError>());
    KJ_EXPECT(error.type == api::FetchError::Type::TRANSPORT);
  }

  {
    // Grab a free port, then stop listening on it.
    auto closed = fixture.network.parseAddress("127.0.0.1", 0).wait(fixture.io.waitScope)->listen();
    auto port = closed->getPort();
    closed = nullptr;

    auto result = cert.fetch(kj::str("http://127.0.0.1:", port, "/")).wait(fixture.io.waitScope);
    auto& error = KJ_ASSERT_NONNULL(result.tryGet<api::FetchError>());
    KJ_EXPECT(error.type == api::FetchError::Type::TRANSPORT);
  }

  {
    auto result = cert.fetch(fixture.url("/hello")).wait(fixture.io.waitScope);
    KJ_EXPECT(result.is<api::FetchResponse>());
  }
}

}  // namespace
}  // namespace edgecap::server
