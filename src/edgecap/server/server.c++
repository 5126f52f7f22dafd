// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "server.h"

#include <edgecap/server/external-fetcher.h>
#include <edgecap/server/text-binding.h>

#include <capnp/compat/json.h>
#include <kj/compat/tls.h>
#include <kj/debug.h>

namespace edgecap::server {

config::Config::Reader decodeConfig(kj::StringPtr json, capnp::MallocMessageBuilder& message) {
  capnp::JsonCodec codec;
  auto root = message.initRoot<config::Config>();
  codec.decode(json, root);
  return root.asReader();
}

Server::Server(
    kj::Timer& timer, kj::Network& network, kj::Function<void(kj::String)> reportConfigError)
    : timer(timer),
      network(network),
      reportConfigError(kj::mv(reportConfigError)) {}

Environment Server::makeEnvironment(config::Config::Reader config) {
  Environment::Builder builder;

  for (auto binding: config.getBindings()) {
    kj::StringPtr name = binding.getName();
    if (name.size() == 0) {
      reportConfigError(kj::str("Config contains a binding with no name."));
      continue;
    }
    if (builder.has(name)) {
      reportConfigError(kj::str("Config defines multiple bindings named \"", name, "\"."));
      continue;
    }

    KJ_IF_SOME(object, makeBinding(name, binding)) {
      builder.add(kj::str(name), kj::mv(object));
    }
  }

  return builder.build();
}

kj::Maybe<kj::Own<const HostObject>> Server::makeBinding(
    kj::StringPtr name, config::Binding::Reader conf) {
  switch (conf.which()) {
    case config::Binding::UNSPECIFIED:
      reportConfigError(kj::str("Binding \"", name, "\" does not specify what it binds."));
      return kj::none;
    case config::Binding::MTLS_CERTIFICATE:
      return makeFetcher(name, conf.getMtlsCertificate(), true);
    case config::Binding::FETCHER:
      return makeFetcher(name, conf.getFetcher(), false);
    case config::Binding::TEXT:
      return kj::Own<const HostObject>(kj::atomicRefcounted<TextBinding>(kj::str(conf.getText())));
  }
  reportConfigError(kj::str("Binding \"", name, "\" has an unrecognized type. Was the config "
                            "written for a newer version of edgecap?"));
  return kj::none;
}

kj::Maybe<kj::Own<const HostObject>> Server::makeFetcher(
    kj::StringPtr name, config::TlsOptions::Reader conf, bool requireKeypair) {
  if (requireKeypair && !conf.hasKeypair()) {
    reportConfigError(kj::str("mTLS certificate binding \"", name, "\" has no keypair."));
    return kj::none;
  }
  if (!requireKeypair && conf.hasKeypair()) {
    reportConfigError(kj::str("Fetcher binding \"", name, "\" specifies a keypair. Use an "
                              "mtlsCertificate binding to present a client certificate."));
    return kj::none;
  }

  KJ_IF_SOME(tls, makeTlsContext(name, conf)) {
    return kj::Own<const HostObject>(
        kj::atomicRefcounted<ExternalFetcher>(timer, network, kj::mv(tls)));
  }
  return kj::none;
}

kj::Maybe<kj::Own<kj::TlsContext>> Server::makeTlsContext(
    kj::StringPtr name, config::TlsOptions::Reader conf) {
  kj::Maybe<kj::Own<kj::TlsContext>> result;

  auto maybeException = kj::runCatchingExceptions([&]() {
    kj::TlsContext::Options options;

    struct Attachments {
      kj::Maybe<kj::TlsKeypair> keypair;
      kj::Array<kj::TlsCertificate> trustedCerts;
    };
    auto attachments = kj::heap<Attachments>();

    if (conf.hasKeypair()) {
      auto pairConf = conf.getKeypair();
      options.defaultKeypair = attachments->keypair.emplace(kj::TlsKeypair{
        .privateKey = kj::TlsPrivateKey(pairConf.getPrivateKey()),
        .certificate = kj::TlsCertificate(pairConf.getCertificateChain()),
      });
    }

    options.useSystemTrustStore = conf.getTrustBrowserCas();

    auto trustList = conf.getTrustedCertificates();
    if (trustList.size() > 0) {
      attachments->trustedCerts = KJ_MAP(cert, trustList) { return kj::TlsCertificate(cert); };
      options.trustedCertificates = attachments->trustedCerts;
    }

    switch (conf.getMinVersion()) {
      case config::TlsOptions::Version::GOOD_DEFAULT:
        break;
      case config::TlsOptions::Version::TLS1_DOT2:
        options.minVersion = kj::TlsVersion::TLS_1_2;
        break;
      case config::TlsOptions::Version::TLS1_DOT3:
        options.minVersion = kj::TlsVersion::TLS_1_3;
        break;
    }

    if (conf.hasCipherList()) {
      options.cipherList = conf.getCipherList();
    }

    result = kj::heap<kj::TlsContext>(kj::mv(options)).attach(kj::mv(attachments));
  });

  KJ_IF_SOME(exception, maybeException) {
    reportConfigError(kj::str(
        "Binding \"", name, "\" has invalid TLS settings: ", exception.getDescription()));
    return kj::none;
  }
  return kj::mv(result);
}

}  // namespace edgecap::server
