// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "environment.h"

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

Environment makeEnv() {
  Environment::Builder builder;
  builder.add(kj::str("CERT"), kj::atomicRefcounted<NamedObject>("Fetcher"_kj))
      .add(kj::str("KV"), kj::atomicRefcounted<NamedObject>("KVNamespace"_kj));
  return builder.build();
}

KJ_TEST("Environment lookup is exact") {
  auto env = makeEnv();

  KJ_EXPECT(env.size() == 2);
  KJ_EXPECT(KJ_ASSERT_NONNULL(env.find("CERT")).getTypeName() == "Fetcher");
  KJ_EXPECT(KJ_ASSERT_NONNULL(env.find("KV")).getTypeName() == "KVNamespace");
  KJ_EXPECT(env.find("cert") == kj::none);
  KJ_EXPECT(env.find("CERT ") == kj::none);
  KJ_EXPECT(env.find("") == kj::none);
}

KJ_TEST("Environment lists names in insertion order") {
  auto env = makeEnv();
  auto names = env.getNames();

  KJ_ASSERT(names.size() == 2);
  KJ_EXPECT(names[0] == "CERT");
  KJ_EXPECT(names[1] == "KV");
}

KJ_TEST("empty Environment") {
  Environment env;

  KJ_EXPECT(env.size() == 0);
  KJ_EXPECT(env.getNames().size() == 0);
  KJ_EXPECT(env.find("CERT") == kj::none);
}

KJ_TEST("Environment::Builder rejects empty and duplicate names") {
  Environment::Builder builder;
  builder.add(kj::str("CERT"), kj::atomicRefcounted<NamedObject>("Fetcher"_kj));

  KJ_EXPECT(builder.has("CERT"));
  KJ_EXPECT(!builder.has("KV"));

  KJ_EXPECT_THROW_MESSAGE("duplicate binding name",
      builder.add(kj::str("CERT"), kj::atomicRefcounted<NamedObject>("Fetcher"_kj)));
  KJ_EXPECT_THROW_MESSAGE("binding name must not be empty",
      builder.add(kj::str(""), kj::atomicRefcounted<NamedObject>("Fetcher"_kj)));

  auto env = builder.build();
  KJ_EXPECT(env.size() == 1);
}

}  // namespace
}  // namespace edgecap
