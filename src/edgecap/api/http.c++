// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "http.h"

#include <edgecap/util/header-validation.h>

#include <kj/compat/url.h>
#include <kj/debug.h>

#include <strings.h>

namespace edgecap::api {

namespace {

kj::Array<Header> cloneHeaders(kj::ArrayPtr<const Header> headers) {
  return KJ_MAP(header, headers) { return header.clone(); };
}

kj::Maybe<kj::Array<kj::byte>> cloneBody(const kj::Maybe<kj::Array<kj::byte>>& body) {
  KJ_IF_SOME(b, body) {
    return kj::heapArray<kj::byte>(b);
  }
  return kj::none;
}

// Checks the parts of a request that every host would otherwise reject on its own, so that the
// caller gets INVALID_REQUEST instead of a transport failure.
kj::Maybe<FetchError> validateRequest(const Request& request) {
  KJ_IF_SOME(url, kj::Url::tryParse(request.url, kj::Url::REMOTE_HREF)) {
    if (url.scheme != "http" && url.scheme != "https") {
      return FetchError::invalidRequest(
          kj::str("Fetch API cannot load \"", request.url, "\": unsupported scheme"));
    }
  } else {
    return FetchError::invalidRequest(kj::str("Invalid URL: ", request.url));
  }

  for (auto& header: request.headers) {
    if (!util::isValidHeaderName(header.name)) {
      return FetchError::invalidRequest(kj::str("Invalid header name: ", header.name));
    }
    if (!util::isValidHeaderValue(header.value)) {
      return FetchError::invalidRequest(kj::str("Invalid value for header: ", header.name));
    }
  }

  if (request.body != kj::none &&
      (request.method == kj::HttpMethod::GET || request.method == kj::HttpMethod::HEAD)) {
    return FetchError::invalidRequest(
        kj::str("Request with a ", request.method, " method cannot have a body."));
  }

  return kj::none;
}

}  // namespace

kj::StringPtr KJ_STRINGIFY(Redirect redirect) {
  switch (redirect) {
    case Redirect::FOLLOW:
      return "follow"_kj;
    case Redirect::MANUAL:
      return "manual"_kj;
    case Redirect::ERROR:
      return "error"_kj;
  }
  KJ_UNREACHABLE;
}

RequestInit RequestInit::clone() const {
  RequestInit result;
  result.method = method;
  KJ_IF_SOME(h, headers) {
    result.headers = cloneHeaders(h);
  }
  result.body = cloneBody(body);
  result.redirect = redirect;
  return result;
}

Request Request::fromUrl(kj::StringPtr url, kj::Maybe<const RequestInit&> init) {
  Request request;
  request.url = kj::str(url);
  KJ_IF_SOME(i, init) {
    KJ_IF_SOME(m, i.method) {
      request.method = m;
    }
    KJ_IF_SOME(h, i.headers) {
      request.headers = cloneHeaders(h);
    }
    request.body = cloneBody(i.body);
    KJ_IF_SOME(r, i.redirect) {
      request.redirect = r;
    }
  }
  return request;
}

Request Request::clone() const {
  return {
    .method = method,
    .url = kj::str(url),
    .headers = cloneHeaders(headers),
    .body = cloneBody(body),
    .redirect = redirect,
  };
}

const kj::HttpHeaderTable& getHeaderTable() {
  static const kj::HttpHeaderTable table;
  return table;
}

kj::StringPtr KJ_STRINGIFY(FetchError::Type type) {
  switch (type) {
    case FetchError::Type::INVALID_REQUEST:
      return "invalid request"_kj;
    case FetchError::Type::TRANSPORT:
      return "transport failure"_kj;
    case FetchError::Type::INCOMPATIBLE_RESPONSE:
      return "incompatible response"_kj;
  }
  KJ_UNREACHABLE;
}

kj::String KJ_STRINGIFY(const FetchError& error) {
  return kj::str(error.type, ": ", error.message);
}

kj::Maybe<kj::StringPtr> Response::getHeader(kj::StringPtr name) const {
  for (auto& header: inner->headers) {
    if (strcasecmp(header.name.cStr(), name.cStr()) == 0) {
      return kj::StringPtr(header.value);
    }
  }
  return kj::none;
}

kj::OneOf<HttpResponse, AdaptError> toHttpResponse(Response&& response) {
  auto& raw = *response.inner;

  if (!util::isValidStatusCode(raw.status)) {
    return AdaptError{kj::str("Response status ", raw.status, " is not a valid HTTP status.")};
  }

  // Validate everything before moving anything out, so a failed conversion leaves the response
  // intact.
  for (auto& header: raw.headers) {
    if (!util::isValidHeaderName(header.name)) {
      return AdaptError{kj::str("Response header name is not an HTTP token: ", header.name)};
    }
    if (!util::isValidHeaderValue(header.value)) {
      return AdaptError{kj::str("Response header has an invalid value: ", header.name)};
    }
  }

  kj::HttpHeaders headers(getHeaderTable());
  for (auto& header: raw.headers) {
    headers.add(kj::mv(header.name), kj::mv(header.value));
  }

  return HttpResponse{
    .status = raw.status,
    .statusText = kj::mv(raw.statusText),
    .headers = kj::mv(headers),
    .body = kj::mv(raw.body),
  };
}

#if EDGECAP_HTTP_RESPONSE
kj::OneOf<FetchResponse, AdaptError> adaptResponse(kj::Own<HostResponse> raw) {
  return toHttpResponse(Response(kj::mv(raw)));
}
#else
kj::OneOf<FetchResponse, AdaptError> adaptResponse(kj::Own<HostResponse> raw) {
  return Response(kj::mv(raw));
}
#endif

kj::OneOf<Request, FetchError> toRequest(Request&& request) {
  KJ_IF_SOME(error, validateRequest(request)) {
    return kj::mv(error);
  }
  return kj::mv(request);
}

kj::OneOf<Request, FetchError> toRequest(HttpRequest&& request) {
  auto method = KJ_UNWRAP_OR(kj::tryParseHttpMethod(request.method),
      return FetchError::invalidRequest(kj::str("Invalid HTTP method: ", request.method)));

  kj::Vector<Header> headers;
  request.headers.forEach([&](kj::StringPtr name, kj::StringPtr value) {
    headers.add(Header{kj::str(name), kj::str(value)});
  });

  Request result{
    .method = method,
    .url = kj::mv(request.url),
    .headers = headers.releaseAsArray(),
    .body = kj::mv(request.body),
  };
  return toRequest(kj::mv(result));
}

}  // namespace edgecap::api
