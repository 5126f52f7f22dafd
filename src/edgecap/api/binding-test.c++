// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "binding.h"

#include <edgecap/api/mtls-certificate.h>

#include <kj/debug.h>
#include <kj/test.h>

namespace edgecap::api {
namespace {

class StubFetcher final: public HostFetcher {
 public:
  kj::Promise<kj::Own<HostResponse>> fetch(
      kj::StringPtr url, kj::Maybe<const RequestInit&> init) const override {
    KJ_UNIMPLEMENTED("not needed by binding tests");
  }
  kj::Promise<kj::Own<HostResponse>> fetch(Request request) const override {
    KJ_UNIMPLEMENTED("not needed by binding tests");
  }
};

class NamedObject final: public HostObject {
 public:
  explicit NamedObject(kj::StringPtr name): name(name) {}

  kj::StringPtr getTypeName() const override {
    return name;
  }

 private:
  kj::StringPtr name;
};

class BrokenObject final: public HostObject {
 public:
  kj::StringPtr getTypeName() const override {
    return "Fetcher"_kj;
  }
  bool isInstanceOf(kj::StringPtr typeName) const override {
    KJ_FAIL_REQUIRE("host object is gone");
  }
};

BindingError expectError(kj::OneOf<MtlsCertificate, BindingError> result) {
  KJ_SWITCH_ONEOF(result) {
    KJ_CASE_ONEOF(cert, MtlsCertificate) {
      KJ_FAIL_ASSERT("expected resolution to fail");
    }
    KJ_CASE_ONEOF(error, BindingError) {
      return kj::mv(error);
    }
  }
  KJ_UNREACHABLE;
}

MtlsCertificate expectCert(kj::OneOf<MtlsCertificate, BindingError> result) {
  KJ_SWITCH_ONEOF(result) {
    KJ_CASE_ONEOF(cert, MtlsCertificate) {
      return kj::mv(cert);
    }
    KJ_CASE_ONEOF(error, BindingError) {
      KJ_FAIL_ASSERT("expected resolution to succeed", error);
    }
  }
  KJ_UNREACHABLE;
}

KJ_TEST("getBinding resolves a fetcher as an mTLS certificate") {
  auto fetcher = kj::atomicRefcounted<StubFetcher>();
  const HostObject* expected = fetcher.get();

  Environment::Builder builder;
  builder.add(kj::str("CERT"), kj::mv(fetcher));
  auto env = builder.build();

  auto cert = expectCert(getBinding<MtlsCertificate>(env, "CERT"));
  KJ_EXPECT(cert.toHostObject().get() == expected);
}

KJ_TEST("getBinding reports a missing binding") {
  Environment env;

  auto error = expectError(getBinding<MtlsCertificate>(env, "CERT"));
  KJ_EXPECT(error.type == BindingError::Type::MISSING);
  KJ_EXPECT(error.name == "CERT");
  KJ_EXPECT(kj::str(error) == "Binding \"CERT\" is not defined in the environment.");
}

KJ_TEST("getBinding reports a binding of the wrong type") {
  Environment::Builder builder;
  builder.add(kj::str("CERT"), kj::atomicRefcounted<NamedObject>("KVNamespace"_kj));
  auto env = builder.build();

  auto error = expectError(getBinding<MtlsCertificate>(env, "CERT"));
  KJ_EXPECT(error.type == BindingError::Type::TYPE_MISMATCH);
  KJ_EXPECT(error.name == "CERT");
  KJ_EXPECT(error.expectedType == "Fetcher");
  KJ_EXPECT(kj::str(error) == "Binding \"CERT\" is not of type \"Fetcher\".");
}

KJ_TEST("getBinding treats an empty name as missing") {
  Environment::Builder builder;
  builder.add(kj::str("CERT"), kj::atomicRefcounted<StubFetcher>());
  auto env = builder.build();

  auto error = expectError(getBinding<MtlsCertificate>(env, ""));
  KJ_EXPECT(error.type == BindingError::Type::MISSING);
  KJ_EXPECT(error.name == "");
}

KJ_TEST("getBinding is case-sensitive") {
  Environment::Builder builder;
  builder.add(kj::str("CERT"), kj::atomicRefcounted<StubFetcher>());
  auto env = builder.build();

  auto error = expectError(getBinding<MtlsCertificate>(env, "cert"));
  KJ_EXPECT(error.type == BindingError::Type::MISSING);
}

KJ_TEST("getBinding rejects an object that claims the type but lacks the interface") {
  Environment::Builder builder;
  builder.add(kj::str("CERT"), kj::atomicRefcounted<NamedObject>("Fetcher"_kj));
  auto env = builder.build();

  auto error = expectError(getBinding<MtlsCertificate>(env, "CERT"));
  KJ_EXPECT(error.type == BindingError::Type::TYPE_MISMATCH);
}

KJ_TEST("getBinding treats failed introspection as a type mismatch") {
  Environment::Builder builder;
  builder.add(kj::str("CERT"), kj::atomicRefcounted<BrokenObject>());
  auto env = builder.build();

  auto error = expectError(getBinding<MtlsCertificate>(env, "CERT"));
  KJ_EXPECT(error.type == BindingError::Type::TYPE_MISMATCH);
}

KJ_TEST("resolve returns the same host object every time") {
  auto fetcher = kj::atomicRefcounted<StubFetcher>();
  const HostObject* expected = fetcher.get();

  Environment::Builder builder;
  builder.add(kj::str("CERT"), kj::mv(fetcher));
  auto env = builder.build();

  for (auto i KJ_UNUSED: kj::zeroTo(3)) {
    auto resolved = resolve(env, "CERT", "Fetcher");
    KJ_SWITCH_ONEOF(resolved) {
      KJ_CASE_ONEOF(object, kj::Own<const HostObject>) {
        KJ_EXPECT(object.get() == expected);
      }
      KJ_CASE_ONEOF(error, BindingError) {
        KJ_FAIL_EXPECT("resolution failed", error);
      }
    }
  }

  KJ_EXPECT(env.size() == 1);
}

KJ_TEST("MtlsCertificate round-trips through the host object representation") {
  auto fetcher = kj::atomicRefcounted<StubFetcher>();
  const HostObject* expected = fetcher.get();

  auto maybeCert = MtlsCertificate::tryFromHostObject(kj::mv(fetcher));
  auto& cert = KJ_ASSERT_NONNULL(maybeCert);
  auto object = cert.toHostObject();
  KJ_EXPECT(object.get() == expected);
  KJ_EXPECT(isInstance(*object, MtlsCertificate::TYPE_NAME));
  KJ_EXPECT(isInstance(*cert.toHostObject(), MtlsCertificate::TYPE_NAME));

  auto maybeAgain = MtlsCertificate::tryFromHostObject(kj::mv(object));
  KJ_EXPECT(KJ_ASSERT_NONNULL(maybeAgain) == cert);

  KJ_EXPECT(MtlsCertificate::tryFromHostObject(
                kj::atomicRefcounted<NamedObject>("KVNamespace"_kj)) == kj::none);
}

KJ_TEST("MtlsCertificate clones refer to the same host object") {
  auto cert = MtlsCertificate(kj::atomicRefcounted<StubFetcher>());
  auto copy = cert.clone();
  KJ_EXPECT(copy == cert);

  auto other = MtlsCertificate(kj::atomicRefcounted<StubFetcher>());
  KJ_EXPECT(!(other == cert));
}

}  // namespace
}  // namespace edgecap::api
