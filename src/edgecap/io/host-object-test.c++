// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "host-object.h"

#include <kj/debug.h>
#include <kj/test.h>

namespace edgecap {
namespace {

class NamedObject final: public HostObject {
 public:
  explicit NamedObject(kj::StringPtr name): name(name) {}

  kj::StringPtr getTypeName() const override {
    return name;
  }

 private:
  kj::StringPtr name;
};

// Introspection always fails, like a host whose object was torn down underneath us.
class BrokenObject final: public HostObject {
 public:
  kj::StringPtr getTypeName() const override {
    return "Fetcher"_kj;
  }
  bool isInstanceOf(kj::StringPtr typeName) const override {
    KJ_FAIL_REQUIRE("host object is gone");
  }
};

// Answers to its own name and to a parent name.
class DerivedObject final: public HostObject {
 public:
  kj::StringPtr getTypeName() const override {
    return "Derived"_kj;
  }
  bool isInstanceOf(kj::StringPtr typeName) const override {
    return typeName == "Derived" || typeName == "Base";
  }
};

KJ_TEST("isInstance compares the host type name") {
  auto object = kj::atomicRefcounted<NamedObject>("Fetcher"_kj);

  KJ_EXPECT(isInstance(*object, "Fetcher"));
  KJ_EXPECT(!isInstance(*object, "KVNamespace"));
  KJ_EXPECT(!isInstance(*object, "fetcher"));
  KJ_EXPECT(!isInstance(*object, ""));
}

KJ_TEST("isInstance honors host-defined instance checks") {
  auto object = kj::atomicRefcounted<DerivedObject>();

  KJ_EXPECT(isInstance(*object, "Derived"));
  KJ_EXPECT(isInstance(*object, "Base"));
  KJ_EXPECT(!isInstance(*object, "Other"));
}

KJ_TEST("isInstance returns false when introspection throws") {
  auto object = kj::atomicRefcounted<BrokenObject>();

  KJ_EXPECT(!isInstance(*object, "Fetcher"));
}

KJ_TEST("addRef shares the object") {
  auto object = kj::atomicRefcounted<NamedObject>("String"_kj);
  auto ref = object->addRef();

  KJ_EXPECT(ref.get() == object.get());
  KJ_EXPECT(object->isShared());

  ref = nullptr;
  KJ_EXPECT(!object->isShared());
}

}  // namespace
}  // namespace edgecap
