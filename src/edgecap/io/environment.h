// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <edgecap/io/host-object.h>

#include <kj/map.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace edgecap {

// The set of bindings made available to one invocation: a read-only map from binding name to the
// host object the operator configured under that name.
//
// An Environment is built once by the host, before the invocation starts, and is never modified
// afterwards. Since all access is const, any number of concurrent resolutions may share one.
class Environment {
 public:
  class Builder;

  Environment() = default;
  Environment(Environment&&) = default;
  Environment& operator=(Environment&&) = default;
  KJ_DISALLOW_COPY(Environment);

  // Exact, case-sensitive lookup.
  kj::Maybe<const HostObject&> find(kj::StringPtr name) const;

  size_t size() const {
    return bindings.size();
  }

  // Names of all bindings, in the order they were added.
  kj::Array<kj::StringPtr> getNames() const;

 private:
  kj::HashMap<kj::String, kj::Own<const HostObject>> bindings;
};

class Environment::Builder {
 public:
  Builder() = default;
  KJ_DISALLOW_COPY_AND_MOVE(Builder);

  // Adds a binding. The name must be non-empty and not already present; violating this is a bug
  // in the host, not a configuration error.
  Builder& add(kj::String name, kj::Own<const HostObject> object);

  bool has(kj::StringPtr name) const {
    return env.bindings.find(name) != kj::none;
  }

  Environment build() {
    return kj::mv(env);
  }

 private:
  Environment env;
};

}  // namespace edgecap
