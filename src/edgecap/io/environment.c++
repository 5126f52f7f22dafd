// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "environment.h"

#include <kj/debug.h>

namespace edgecap {

kj::Maybe<const HostObject&> Environment::find(kj::StringPtr name) const {
  KJ_IF_SOME(object, bindings.find(name)) {
    return *object;
  }
  return kj::none;
}

kj::Array<kj::StringPtr> Environment::getNames() const {
  return KJ_MAP(entry, bindings) -> kj::StringPtr { return entry.key; };
}

Environment::Builder& Environment::Builder::add(
    kj::String name, kj::Own<const HostObject> object) {
  KJ_REQUIRE(name.size() > 0, "binding name must not be empty");
  KJ_REQUIRE(!has(name), "duplicate binding name", name);
  env.bindings.insert(kj::mv(name), kj::mv(object));
  return *this;
}

}  // namespace edgecap
