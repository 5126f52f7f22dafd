// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <kj/async-io.h>
#include <kj/vector.h>

namespace edgecap::util {

// An input stream that yields `text` and then EOF. The stream owns the text.
kj::Own<kj::AsyncInputStream> newMemoryInputStream(kj::String text);

// An output stream that appends everything written to it to `buffer`, which must outlive the
// stream.
kj::Own<kj::AsyncOutputStream> newMemoryOutputStream(kj::Vector<kj::byte>& buffer);

}  // namespace edgecap::util
