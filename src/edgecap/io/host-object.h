// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <kj/refcount.h>
#include <kj/string.h>

namespace edgecap {

// An object provided by the host environment and exposed to sandboxed code as a binding.
//
// Every host object carries an intrinsic type identity, its host type name (e.g. "Fetcher",
// "KVNamespace"). Code receiving a HostObject out of an `Environment` cannot know statically what
// it is, so it must check the identity with `isInstance()` before downcasting.
//
// Host objects are shared by atomic refcount and only ever handed out as `kj::Own<const T>`. Per
// KJ convention, const methods are thread-safe: anything a host exposes on a const HostObject
// must tolerate being called concurrently from multiple threads. This is an assumption the host
// makes when it implements the interface; nothing here can verify it.
class HostObject: public kj::AtomicRefcounted {
 public:
  // The type name under which the host registered this object. Several capability types may
  // share one name when the host represents them identically; the name describes the host-side
  // shape, not what the sandboxed code means to do with it.
  virtual kj::StringPtr getTypeName() const = 0;

  // Host-side instance check. The default compares `getTypeName()`. Hosts whose objects answer to
  // more than one name (e.g. a subtype relationship) override this.
  virtual bool isInstanceOf(kj::StringPtr typeName) const {
    return getTypeName() == typeName;
  }

  kj::Own<const HostObject> addRef() const {
    return kj::atomicAddRef(*this);
  }
};

// Returns true if `object` is an instance of the host type named `typeName`.
//
// Never throws. If the host's introspection throws, the object is treated as unverified and this
// returns false.
bool isInstance(const HostObject& object, kj::StringPtr typeName);

}  // namespace edgecap
