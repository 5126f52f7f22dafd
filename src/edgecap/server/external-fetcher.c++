// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "external-fetcher.h"

#include <kj/compat/http.h>
#include <kj/compat/url.h>
#include <kj/debug.h>
#include <kj/vector.h>

namespace edgecap::server {

namespace {

bool isRedirect(uint status) {
  return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

}  // namespace

ExternalFetcher::ExternalFetcher(
    kj::Timer& timer, kj::Network& network, kj::Own<kj::TlsContext> tlsParam)
    : timer(timer),
      network(network),
      tls(kj::mv(tlsParam)),
      ownTlsNetwork(tls->wrapNetwork(network)),
      tlsNetwork(*ownTlsNetwork) {}

kj::Promise<kj::Own<api::HostResponse>> ExternalFetcher::fetch(
    kj::StringPtr url, kj::Maybe<const api::RequestInit&> init) const {
  return fetch(api::Request::fromUrl(url, init));
}

kj::Promise<kj::Own<api::HostResponse>> ExternalFetcher::fetch(api::Request request) const {
  auto client = kj::newHttpClient(timer, api::getHeaderTable(), network, tlsNetwork);
  auto response = co_await send(*client, request);

  for (uint redirects = 0; isRedirect(response.statusCode); ++redirects) {
    if (request.redirect == api::Redirect::MANUAL) break;

    kj::StringPtr location;
    KJ_IF_SOME(l, response.headers->get(kj::HttpHeaderId::LOCATION)) {
      location = l;
    } else {
      // A redirect status without a target is just a response.
      break;
    }

    KJ_REQUIRE(request.redirect != api::Redirect::ERROR,
        "received a redirect while the redirect mode is \"error\"", request.url, location);
    KJ_REQUIRE(redirects < MAX_REDIRECTS, "too many redirects", request.url);

    auto base = kj::Url::parse(request.url, kj::Url::REMOTE_HREF);
    auto target = KJ_REQUIRE_NONNULL(
        base.tryParseRelative(location), "redirect has an invalid location", location);
    auto status = response.statusCode;

    // Same method rewriting as browsers do.
    if ((status == 303 && request.method != kj::HttpMethod::HEAD) ||
        ((status == 301 || status == 302) && request.method == kj::HttpMethod::POST)) {
      request.method = kj::HttpMethod::GET;
      request.body = kj::none;
    }
    request.url = target.toString();

    // Drop the previous body before sending again.
    response.body = nullptr;
    response = co_await send(*client, request);
  }

  kj::Vector<api::Header> headers;
  response.headers->forEach([&](kj::StringPtr name, kj::StringPtr value) {
    headers.add(api::Header{kj::str(name), kj::str(value)});
  });

  co_return kj::heap<api::HostResponse>(api::HostResponse{
    .status = response.statusCode,
    .statusText = kj::str(response.statusText),
    .headers = headers.releaseAsArray(),
    .body = response.body.attach(kj::mv(client)),
  });
}

kj::Promise<kj::HttpClient::Response> ExternalFetcher::send(
    kj::HttpClient& client, const api::Request& request) const {
  kj::HttpHeaders headers(api::getHeaderTable());
  for (auto& header: request.headers) {
    headers.add(header.name, header.value);
  }

  uint64_t bodySize = 0;
  KJ_IF_SOME(b, request.body) {
    bodySize = b.size();
  }

  auto outgoing = client.request(request.method, request.url, headers, bodySize);
  KJ_IF_SOME(b, request.body) {
    co_await outgoing.body->write(b);
  }
  outgoing.body = nullptr;

  co_return co_await outgoing.response;
}

}  // namespace edgecap::server
