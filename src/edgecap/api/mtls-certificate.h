// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <edgecap/api/binding.h>
#include <edgecap/api/fetcher.h>
#include <edgecap/api/http.h>

#include <kj/async.h>
#include <kj/one-of.h>

namespace edgecap::api {

// A binding for mTLS (mutual TLS) certificate authentication.
//
// The operator provisions a client certificate and private key with the host and binds it to a
// name. Requests made through the binding present that certificate during the TLS handshake. The
// certificate is never named or selected by the caller; the binding *is* the credential.
//
//   KJ_SWITCH_ONEOF(getBinding<MtlsCertificate>(env, "MY_CERT")) {
//     KJ_CASE_ONEOF(cert, MtlsCertificate) {
//       auto result = co_await cert.fetch("https://api.example.com/endpoint");
//       ...
//     }
//     KJ_CASE_ONEOF(error, BindingError) { ... }
//   }
//
// Requests to destinations that terminate TLS inside the same edge network as the caller can't
// use the certificate. The host rejects those, and the rejection comes back as an ordinary
// FetchError::Type::TRANSPORT carrying the host's diagnostic.
//
// An MtlsCertificate is just a reference to the host's fetcher. clone() shares the same host
// object, two handles are equal iff they refer to the same host object, and a handle may be used
// from several tasks or threads at once (see HostFetcher for the thread-safety contract).
class MtlsCertificate {
 public:
  // The host represents certificate bindings exactly like plain service fetchers, so both are
  // verified against the same type name. Resolving a plain fetcher as an MtlsCertificate
  // therefore succeeds; it just won't present a client certificate.
  static constexpr kj::StringPtr TYPE_NAME = HostFetcher::TYPE_NAME;

  using FetchResult = kj::OneOf<FetchResponse, FetchError>;

  explicit MtlsCertificate(kj::Own<const HostFetcher> inner): inner(kj::mv(inner)) {}
  MtlsCertificate(MtlsCertificate&&) = default;
  MtlsCertificate& operator=(MtlsCertificate&&) = default;
  KJ_DISALLOW_COPY(MtlsCertificate);

  MtlsCertificate clone() const {
    return MtlsCertificate(kj::atomicAddRef(*inner));
  }

  bool operator==(const MtlsCertificate& other) const {
    return inner.get() == other.inner.get();
  }

  // Conversion from the generic host object representation. Returns none unless the object is a
  // "Fetcher" and implements HostFetcher.
  static kj::Maybe<MtlsCertificate> tryFromHostObject(kj::Own<const HostObject> object);

  kj::Own<const HostObject> toHostObject() const {
    return kj::atomicAddRef(*inner);
  }

  // Makes an authenticated request for `url`, applying `init` if given.
  //
  // The returned promise does not reject on failure; failures are returned as FetchError. It does
  // not time out either: drop the promise to abandon the request.
  kj::Promise<FetchResult> fetch(kj::StringPtr url, kj::Maybe<RequestInit> init = kj::none) const;

  // Makes an authenticated request from an already-built request. `request` may be any type for
  // which `toRequest()` is overloaded, currently `Request` and `HttpRequest`; if the conversion
  // fails, the result is FetchError::Type::INVALID_REQUEST and nothing is sent.
  template <typename T>
  kj::Promise<FetchResult> fetchRequest(T request) const {
    auto converted = toRequest(kj::mv(request));
    KJ_SWITCH_ONEOF(converted) {
      KJ_CASE_ONEOF(r, Request) {
        return fetchRequestImpl(kj::mv(r));
      }
      KJ_CASE_ONEOF(error, FetchError) {
        return FetchResult(kj::mv(error));
      }
    }
    KJ_UNREACHABLE;
  }

 private:
  kj::Own<const HostFetcher> inner;

  kj::Promise<FetchResult> fetchRequestImpl(Request request) const;
};

static_assert(EnvBinding<MtlsCertificate>);

}  // namespace edgecap::api
