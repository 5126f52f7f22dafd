// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "host-object.h"

#include <kj/debug.h>

namespace edgecap {

bool isInstance(const HostObject& object, kj::StringPtr typeName) {
  bool result = false;
  auto maybeException =
      kj::runCatchingExceptions([&]() { result = object.isInstanceOf(typeName); });
  if (maybeException != kj::none) {
    // A host that can't answer the question hasn't proven anything.
    return false;
  }
  return result;
}

}  // namespace edgecap
