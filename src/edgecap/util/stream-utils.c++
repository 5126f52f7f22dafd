// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "stream-utils.h"

#include <string.h>

namespace edgecap::util {

namespace {

class MemoryInputStream final: public kj::AsyncInputStream {
 public:
  explicit MemoryInputStream(kj::String text): text(kj::mv(text)), remaining(this->text.asBytes()) {}

  kj::Promise<size_t> tryRead(void* buffer, size_t minBytes, size_t maxBytes) override {
    size_t toRead = kj::min(remaining.size(), maxBytes);
    memcpy(buffer, remaining.begin(), toRead);
    remaining = remaining.slice(toRead, remaining.size());
    return toRead;
  }

  kj::Maybe<uint64_t> tryGetLength() override {
    return remaining.size();
  }

 private:
  kj::String text;
  kj::ArrayPtr<const kj::byte> remaining;
};

class MemoryOutputStream final: public kj::AsyncOutputStream {
 public:
  explicit MemoryOutputStream(kj::Vector<kj::byte>& buffer): buffer(buffer) {}

  kj::Promise<void> write(kj::ArrayPtr<const kj::byte> data) override {
    buffer.addAll(data);
    return kj::READY_NOW;
  }

  kj::Promise<void> write(kj::ArrayPtr<const kj::ArrayPtr<const kj::byte>> pieces) override {
    for (auto piece: pieces) {
      buffer.addAll(piece);
    }
    return kj::READY_NOW;
  }

  kj::Promise<void> whenWriteDisconnected() override {
    return kj::NEVER_DONE;
  }

 private:
  kj::Vector<kj::byte>& buffer;
};

}  // namespace

kj::Own<kj::AsyncInputStream> newMemoryInputStream(kj::String text) {
  return kj::heap<MemoryInputStream>(kj::mv(text));
}

kj::Own<kj::AsyncOutputStream> newMemoryOutputStream(kj::Vector<kj::byte>& buffer) {
  return kj::heap<MemoryOutputStream>(buffer);
}

}  // namespace edgecap::util
