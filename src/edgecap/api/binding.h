// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <edgecap/io/environment.h>

#include <kj/one-of.h>
#include <kj/string.h>

#include <concepts>

namespace edgecap::api {

struct BindingError {
  enum class Type {
    // No binding with the requested name exists.
    MISSING,
    // The binding exists but is not an instance of the requested type.
    TYPE_MISMATCH,
  };

  Type type;
  kj::String name;

  // The host type name that was requested. Empty for MISSING.
  kj::String expectedType;

  static BindingError missing(kj::StringPtr name) {
    return {Type::MISSING, kj::str(name), nullptr};
  }
  static BindingError typeMismatch(kj::StringPtr name, kj::StringPtr expectedType) {
    return {Type::TYPE_MISMATCH, kj::str(name), kj::str(expectedType)};
  }
};

kj::String KJ_STRINGIFY(const BindingError& error);

// A type that can be resolved out of an Environment.
//
// TYPE_NAME is the host type name the binding must be an instance of. tryFromHostObject() wraps an
// object that has already passed `isInstance()`; it returns none if the object does not actually
// expose the interface the binding type needs, which the resolver reports as a type mismatch.
template <typename T>
concept EnvBinding = requires(kj::Own<const HostObject> object) {
  { T::TYPE_NAME } -> std::convertible_to<kj::StringPtr>;
  { T::tryFromHostObject(kj::mv(object)) } -> std::same_as<kj::Maybe<T>>;
};

// Looks up `name` in `env` and verifies that the object is an instance of `typeName`. On success
// returns a new reference to the object.
//
// Has no side effects; resolving the same name twice returns references to the same object.
kj::OneOf<kj::Own<const HostObject>, BindingError> resolve(
    const Environment& env, kj::StringPtr name, kj::StringPtr typeName);

// Looks up `name` in `env` and returns it as a `T`.
template <EnvBinding T>
kj::OneOf<T, BindingError> getBinding(const Environment& env, kj::StringPtr name) {
  auto resolved = resolve(env, name, T::TYPE_NAME);
  KJ_SWITCH_ONEOF(resolved) {
    KJ_CASE_ONEOF(object, kj::Own<const HostObject>) {
      KJ_IF_SOME(binding, T::tryFromHostObject(kj::mv(object))) {
        return kj::mv(binding);
      }
      return BindingError::typeMismatch(name, T::TYPE_NAME);
    }
    KJ_CASE_ONEOF(error, BindingError) {
      return kj::mv(error);
    }
  }
  KJ_UNREACHABLE;
}

}  // namespace edgecap::api
