// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "binding.h"

#include <kj/debug.h>

namespace edgecap::api {

kj::String KJ_STRINGIFY(const BindingError& error) {
  switch (error.type) {
    case BindingError::Type::MISSING:
      return kj::str("Binding \"", error.name, "\" is not defined in the environment.");
    case BindingError::Type::TYPE_MISMATCH:
      return kj::str("Binding \"", error.name, "\" is not of type \"", error.expectedType, "\".");
  }
  KJ_UNREACHABLE;
}

kj::OneOf<kj::Own<const HostObject>, BindingError> resolve(
    const Environment& env, kj::StringPtr name, kj::StringPtr typeName) {
  if (name.size() == 0) {
    return BindingError::missing(name);
  }

  KJ_IF_SOME(object, env.find(name)) {
    if (!isInstance(object, typeName)) {
      return BindingError::typeMismatch(name, typeName);
    }
    return object.addRef();
  }

  return BindingError::missing(name);
}

}  // namespace edgecap::api
