// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <kj/async-io.h>
#include <kj/compat/http.h>
#include <kj/one-of.h>
#include <kj/string.h>

// Selects which response shape the fetch operations produce. Code built on top of edgecap is
// written against exactly one of the two, so this is a build setting rather than a per-call
// choice. 0 (the default) produces `api::Response`; 1 produces `api::HttpResponse`.
#ifndef EDGECAP_HTTP_RESPONSE
#define EDGECAP_HTTP_RESPONSE 0
#endif

namespace edgecap::api {

struct Header {
  kj::String name;
  kj::String value;

  Header clone() const {
    return {kj::str(name), kj::str(value)};
  }
};

// What to do when the response is a redirect. Interpreting this is the host's business.
enum class Redirect {
  FOLLOW,
  MANUAL,
  ERROR,
};

kj::StringPtr KJ_STRINGIFY(Redirect redirect);

// Optional settings merged into a request that was specified by URL.
struct RequestInit {
  kj::Maybe<kj::HttpMethod> method;
  kj::Maybe<kj::Array<Header>> headers;
  kj::Maybe<kj::Array<kj::byte>> body;
  kj::Maybe<Redirect> redirect;

  RequestInit clone() const;
};

// The canonical request representation handed to the host.
struct Request {
  kj::HttpMethod method = kj::HttpMethod::GET;
  kj::String url;
  kj::Array<Header> headers;
  kj::Maybe<kj::Array<kj::byte>> body;
  Redirect redirect = Redirect::FOLLOW;

  // Builds a request for `url`, applying whatever `init` specifies on top of the defaults.
  static Request fromUrl(kj::StringPtr url, kj::Maybe<const RequestInit&> init = kj::none);

  Request clone() const;
};

// The header table used by `HttpRequest` and `HttpResponse`. It only knows the headers KJ
// indexes by default; everything else is stored unindexed.
const kj::HttpHeaderTable& getHeaderTable();

// A request in the standard KJ HTTP shape. Unlike `Request`, nothing about it has been validated
// yet, so converting it may fail.
struct HttpRequest {
  kj::String method;
  kj::String url;
  kj::HttpHeaders headers = kj::HttpHeaders(getHeaderTable());
  kj::Maybe<kj::Array<kj::byte>> body;
};

// ---------------------------------------------------------------------------------------
// Errors

struct FetchError {
  enum class Type {
    // A caller-supplied request could not be converted into a `Request`.
    INVALID_REQUEST,
    // The host failed to complete the exchange: network error, TLS handshake or client
    // certificate rejection, malformed response. An HTTP error status is not a transport failure.
    TRANSPORT,
    // The host's response can't be represented in the response shape this build produces.
    INCOMPATIBLE_RESPONSE,
  };

  Type type;
  kj::String message;

  static FetchError invalidRequest(kj::String message) {
    return {Type::INVALID_REQUEST, kj::mv(message)};
  }
  static FetchError transport(const kj::Exception& exception) {
    return {Type::TRANSPORT, kj::str(exception.getDescription())};
  }
};

kj::StringPtr KJ_STRINGIFY(FetchError::Type type);
kj::String KJ_STRINGIFY(const FetchError& error);

struct AdaptError {
  kj::String message;
};

// ---------------------------------------------------------------------------------------
// Responses

// The response object as the host produced it.
struct HostResponse {
  uint status;
  kj::String statusText;
  kj::Array<Header> headers;
  kj::Own<kj::AsyncInputStream> body;
};

struct HttpResponse;

// The native response shape: a thin wrapper around the host's response. Nothing is copied,
// reordered, or buffered.
class Response {
 public:
  explicit Response(kj::Own<HostResponse> inner): inner(kj::mv(inner)) {}

  uint getStatus() const {
    return inner->status;
  }
  kj::StringPtr getStatusText() const {
    return inner->statusText;
  }
  bool isOk() const {
    return inner->status >= 200 && inner->status < 300;
  }
  kj::ArrayPtr<const Header> getHeaders() const {
    return inner->headers;
  }

  // Returns the first header with the given name, compared case-insensitively.
  kj::Maybe<kj::StringPtr> getHeader(kj::StringPtr name) const;

  kj::AsyncInputStream& getBody() {
    return *inner->body;
  }

 private:
  kj::Own<HostResponse> inner;

  friend kj::OneOf<HttpResponse, AdaptError> toHttpResponse(Response&& response);
};

// The standard response shape.
struct HttpResponse {
  uint status;
  kj::String statusText;
  kj::HttpHeaders headers;
  kj::Own<kj::AsyncInputStream> body;
};

// Converts a native response into the standard shape. Fails if the status is not three digits or
// a header can't be carried by `kj::HttpHeaders`.
kj::OneOf<HttpResponse, AdaptError> toHttpResponse(Response&& response);

#if EDGECAP_HTTP_RESPONSE
using FetchResponse = HttpResponse;
#else
using FetchResponse = Response;
#endif

// Converts the host's response into `FetchResponse`. Exactly one conversion is compiled in,
// chosen by EDGECAP_HTTP_RESPONSE.
kj::OneOf<FetchResponse, AdaptError> adaptResponse(kj::Own<HostResponse> raw);

// ---------------------------------------------------------------------------------------
// Request conversion
//
// `MtlsCertificate::fetchRequest()` accepts any type for which an overload of `toRequest()`
// exists.

kj::OneOf<Request, FetchError> toRequest(Request&& request);
kj::OneOf<Request, FetchError> toRequest(HttpRequest&& request);

}  // namespace edgecap::api
