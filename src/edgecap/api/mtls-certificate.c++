// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "mtls-certificate.h"

#include <kj/debug.h>

namespace edgecap::api {

namespace {

using FetchResult = MtlsCertificate::FetchResult;

FetchResult adaptHostResponse(kj::Own<HostResponse> raw) {
  if (raw.get() == nullptr || raw->body.get() == nullptr) {
    return FetchError{FetchError::Type::TRANSPORT, kj::str("Host returned a malformed response.")};
  }

  auto adapted = adaptResponse(kj::mv(raw));
  KJ_SWITCH_ONEOF(adapted) {
    KJ_CASE_ONEOF(response, FetchResponse) {
      return kj::mv(response);
    }
    KJ_CASE_ONEOF(error, AdaptError) {
      return FetchError{FetchError::Type::INCOMPATIBLE_RESPONSE, kj::mv(error.message)};
    }
  }
  KJ_UNREACHABLE;
}

// `issue` calls into the host. Whether the host throws synchronously or rejects the promise later,
// the failure comes back as TRANSPORT. The host object is kept alive until the exchange is over
// even if the handle is dropped in the meantime.
template <typename Func>
kj::Promise<FetchResult> issue(const HostFetcher& fetcher, Func&& func) {
  return kj::evalNow(kj::fwd<Func>(func))
      .then([](kj::Own<HostResponse> raw) { return adaptHostResponse(kj::mv(raw)); },
          [](kj::Exception&& exception) -> FetchResult {
    return FetchError::transport(exception);
  }).attach(kj::atomicAddRef(fetcher));
}

}  // namespace

kj::Maybe<MtlsCertificate> MtlsCertificate::tryFromHostObject(kj::Own<const HostObject> object) {
  if (object.get() == nullptr || !isInstance(*object, TYPE_NAME)) {
    return kj::none;
  }
  if (dynamic_cast<const HostFetcher*>(object.get()) == nullptr) {
    // Registered under the right name but doesn't implement the interface. Can only happen with a
    // misbehaving host; treat it as unverified.
    return kj::none;
  }
  return MtlsCertificate(object.downcast<const HostFetcher>());
}

kj::Promise<MtlsCertificate::FetchResult> MtlsCertificate::fetch(
    kj::StringPtr url, kj::Maybe<RequestInit> init) const {
  // The host may read `url` and `init` at any point until its promise settles, so both must
  // outlive this call.
  auto ownUrl = kj::str(url);
  auto ownInit = kj::heap<kj::Maybe<RequestInit>>(kj::mv(init));
  auto& fetcher = *inner;
  return issue(fetcher, [&]() {
    KJ_IF_SOME(i, *ownInit) {
      return fetcher.fetch(ownUrl, i);
    }
    return fetcher.fetch(ownUrl, kj::none);
  }).attach(kj::mv(ownUrl), kj::mv(ownInit));
}

kj::Promise<MtlsCertificate::FetchResult> MtlsCertificate::fetchRequestImpl(
    Request request) const {
  auto& fetcher = *inner;
  return issue(fetcher, [&]() { return fetcher.fetch(kj::mv(request)); });
}

}  // namespace edgecap::api
