// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <edgecap/api/fetcher.h>

#include <kj/async-io.h>
#include <kj/compat/tls.h>
#include <kj/timer.h>

namespace edgecap::server {

// The host's outbound fetcher: sends requests to the public network over `kj::HttpClient`.
//
// `https:` URLs go through `tls`. When `tls` was built with a default keypair, that keypair is
// presented as the client certificate whenever the server asks for one, which makes this the
// implementation behind `mtlsCertificate` bindings. Built without one, it backs plain `fetcher`
// bindings.
//
// A new client is created for each request, so concurrent requests don't share connection state.
// The timer and network are I/O objects of the thread that created this fetcher, so despite the
// const interface, this implementation must only be used from that thread.
class ExternalFetcher final: public api::HostFetcher {
 public:
  ExternalFetcher(kj::Timer& timer, kj::Network& network, kj::Own<kj::TlsContext> tls);

  kj::Promise<kj::Own<api::HostResponse>> fetch(
      kj::StringPtr url, kj::Maybe<const api::RequestInit&> init) const override;
  kj::Promise<kj::Own<api::HostResponse>> fetch(api::Request request) const override;

  // Redirects followed before giving up when the redirect mode is FOLLOW.
  static constexpr uint MAX_REDIRECTS = 20;

 private:
  kj::Timer& timer;
  kj::Network& network;
  kj::Own<kj::TlsContext> tls;
  kj::Own<kj::Network> ownTlsNetwork;
  kj::Network& tlsNetwork;

  kj::Promise<kj::HttpClient::Response> send(
      kj::HttpClient& client, const api::Request& request) const;
};

}  // namespace edgecap::server
