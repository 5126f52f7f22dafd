// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <edgecap/io/environment.h>
#include <edgecap/server/config.capnp.h>

#include <capnp/message.h>
#include <kj/async-io.h>
#include <kj/function.h>
#include <kj/timer.h>

namespace kj {
class TlsContext;
}

namespace edgecap::server {

// Decodes a JSON config into `message` and returns its root. Throws if `json` is not a valid
// encoding of config::Config.
config::Config::Reader decodeConfig(kj::StringPtr json, capnp::MallocMessageBuilder& message);

// The reference host: turns a config into the Environment an invocation runs with.
//
// Problems with individual bindings are reported through `reportConfigError` and the binding is
// left out of the environment, so one bad entry doesn't prevent the rest from loading.
class Server {
 public:
  Server(kj::Timer& timer, kj::Network& network, kj::Function<void(kj::String)> reportConfigError);
  KJ_DISALLOW_COPY_AND_MOVE(Server);

  Environment makeEnvironment(config::Config::Reader config);

 private:
  kj::Timer& timer;
  kj::Network& network;
  kj::Function<void(kj::String)> reportConfigError;

  kj::Maybe<kj::Own<const HostObject>> makeBinding(
      kj::StringPtr name, config::Binding::Reader conf);
  kj::Maybe<kj::Own<const HostObject>> makeFetcher(
      kj::StringPtr name, config::TlsOptions::Reader conf, bool requireKeypair);
  kj::Maybe<kj::Own<kj::TlsContext>> makeTlsContext(
      kj::StringPtr name, config::TlsOptions::Reader conf);
};

}  // namespace edgecap::server
