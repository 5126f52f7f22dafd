// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <edgecap/io/host-object.h>

#include <kj/string.h>

namespace edgecap::server {

// A binding whose value is just a string.
class TextBinding final: public HostObject {
 public:
  static constexpr kj::StringPtr TYPE_NAME = "String"_kj;

  explicit TextBinding(kj::String value): value(kj::mv(value)) {}

  kj::StringPtr getTypeName() const override {
    return TYPE_NAME;
  }

  kj::StringPtr getValue() const {
    return value;
  }

 private:
  kj::String value;
};

}  // namespace edgecap::server
