// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "json-logger.h"

#include <edgecap/server/log-schema.capnp.h>

#include <capnp/compat/json.h>
#include <capnp/message.h>
#include <kj/debug.h>
#include <kj/test.h>

#if __linux__
#include <fcntl.h>
#include <unistd.h>

#include <cstdio>
#endif  // __linux__

namespace edgecap::server {
namespace {

struct DecodedEntry {
  capnp::MallocMessageBuilder message;
  log_schema::LogEntry::Reader entry;
};

kj::Own<DecodedEntry> decodeEntry(kj::StringPtr json) {
  capnp::JsonCodec codec;
  codec.handleByAnnotation<log_schema::LogEntry>();

  auto result = kj::heap<DecodedEntry>();
  auto builder = result->message.initRoot<log_schema::LogEntry>();
  codec.decode(json, builder);
  result->entry = builder.asReader();
  return result;
}

KJ_TEST("parseLogText splits the description from its parameters") {
  auto text = parseLogText("fetch failed; binding = MY_CERT; status = 502\n");
  KJ_EXPECT(text.message == "fetch failed");
  KJ_ASSERT(text.fields.size() == 2);
  KJ_EXPECT(text.fields[0].name == "binding");
  KJ_EXPECT(text.fields[0].value == "MY_CERT");
  KJ_EXPECT(text.fields[1].name == "status");
  KJ_EXPECT(text.fields[1].value == "502");
}

KJ_TEST("parseLogText keeps separators that belong to a value or the message") {
  {
    auto text =
        parseLogText("request failed; error = transport: reset; retrying; url = https://a/");
    KJ_EXPECT(text.message == "request failed");
    KJ_ASSERT(text.fields.size() == 2);
    KJ_EXPECT(text.fields[0].name == "error");
    KJ_EXPECT(text.fields[0].value == "transport: reset; retrying");
    KJ_EXPECT(text.fields[1].value == "https://a/");
  }
  {
    auto text = parseLogText("first; second");
    KJ_EXPECT(text.message == "first; second");
    KJ_EXPECT(text.fields.size() == 0);
  }
}

KJ_TEST("encodeLogEntry produces one LogEntry per line") {
  auto json = encodeLogEntry(kj::LogSeverity::WARNING, "src/edgecap/server/edgecap.c++:42",
      parseLogText("authenticated request failed; bindingName = MY_CERT; error.type = transport"));

  KJ_EXPECT(!json.contains("\n"));

  auto decoded = decodeEntry(json);
  auto entry = decoded->entry;
  KJ_EXPECT(entry.getLevel() == log_schema::LogEntry::LogLevel::WARNING);
  KJ_EXPECT(entry.getMessage() == "authenticated request failed");
  KJ_EXPECT(entry.getSource() == "src/edgecap/server/edgecap.c++:42");
  KJ_EXPECT(entry.getTimestamp() > 0);

  auto fields = entry.getFields();
  KJ_ASSERT(fields.size() == 2);
  KJ_EXPECT(fields[0].getName() == "bindingName");
  KJ_EXPECT(fields[0].getValue() == "MY_CERT");
  KJ_EXPECT(fields[1].getName() == "error.type");
  KJ_EXPECT(fields[1].getValue() == "transport");
}

KJ_TEST("encodeLogEntry leaves out empty fields and spells the debug level out") {
  auto json = encodeLogEntry(kj::LogSeverity::DBG, "file.c++:1", parseLogText("details"));

  KJ_EXPECT(json.contains("\"debug\""), json);
  KJ_EXPECT(!json.contains("fields"), json);
  KJ_EXPECT(!decodeEntry(json)->entry.hasFields());
}

KJ_TEST("encodeLogEntry escapes the message") {
  auto json = encodeLogEntry(kj::LogSeverity::ERROR, "file.c++:1",
      LogText{.message = kj::str("line one\nline \"two\"")});

  KJ_EXPECT(!json.contains("\n"));
  KJ_EXPECT(decodeEntry(json)->entry.getMessage() == "line one\nline \"two\"");
}

#if __linux__
// Captures what the process writes to one of its standard streams.
class OutputCapture {
 public:
  explicit OutputCapture(int fd): targetFd(fd), originalFd(dup(fd)) {
    int pipeFds[2];
    KJ_SYSCALL(pipe2(pipeFds, O_CLOEXEC));
    readFd = kj::AutoCloseFd(pipeFds[0]);
    kj::AutoCloseFd writeFd(pipeFds[1]);
    KJ_SYSCALL(dup2(writeFd.get(), targetFd));
  }

  ~OutputCapture() noexcept(false) {
    KJ_SYSCALL(dup2(originalFd, targetFd));
    close(originalFd);
  }

  kj::String read() {
    fflush(targetFd == STDOUT_FILENO ? stdout : stderr);

    char buffer[4096];
    ssize_t n;
    KJ_SYSCALL(n = ::read(readFd.get(), buffer, sizeof(buffer)));
    return kj::heapString(buffer, n);
  }

 private:
  int targetFd;
  int originalFd;
  kj::AutoCloseFd readFd;
};

kj::String findLine(kj::StringPtr output, kj::StringPtr text) {
  while (output.size() > 0) {
    auto line = kj::str(output);
    KJ_IF_SOME(pos, output.findFirst('\n')) {
      line = kj::str(output.slice(0, pos));
      output = output.slice(pos + 1);
    } else {
      output = ""_kj;
    }
    if (line.contains(text)) {
      return kj::mv(line);
    }
  }
  KJ_FAIL_ASSERT("no output line contains", text);
}

KJ_TEST("JsonLogger writes KJ_LOG output to stderr as JSON") {
  JsonLogger logger;
  OutputCapture capture(STDERR_FILENO);

  kj::StringPtr bindingName = "MY_CERT"_kj;
  uint status = 495;
  KJ_LOG(ERROR, "upstream rejected the client certificate", bindingName, status);

  auto line = findLine(capture.read(), "upstream rejected the client certificate");
  auto decoded = decodeEntry(line);
  auto entry = decoded->entry;
  KJ_EXPECT(entry.getLevel() == log_schema::LogEntry::LogLevel::ERROR);
  KJ_EXPECT(entry.getSource().contains("json-logger-test.c++"));
  KJ_EXPECT(entry.getMessage() == "upstream rejected the client certificate");

  auto fields = entry.getFields();
  KJ_ASSERT(fields.size() == 2);
  KJ_EXPECT(fields[0].getName() == "bindingName");
  KJ_EXPECT(fields[0].getValue() == "MY_CERT");
  KJ_EXPECT(fields[1].getName() == "status");
  KJ_EXPECT(fields[1].getValue() == "495");
}

KJ_TEST("StructuredLoggingProcessContext is plain text until enabled") {
  StructuredLoggingProcessContext context("edgecap");
  KJ_EXPECT(context.getProgramName() == "edgecap");

  {
    OutputCapture capture(STDERR_FILENO);
    context.warning("config has no bindings");
    auto output = capture.read();
    KJ_EXPECT(output.contains("config has no bindings"));
    KJ_EXPECT(!output.contains("{"));
  }

  context.enableStructuredLogging();
  context.enableStructuredLogging();

  {
    OutputCapture capture(STDERR_FILENO);
    context.error("config has no bindings");
    auto line = findLine(capture.read(), "config has no bindings");
    auto decoded = decodeEntry(line);
    KJ_EXPECT(decoded->entry.getLevel() == log_schema::LogEntry::LogLevel::ERROR);
    KJ_EXPECT(decoded->entry.getMessage() == "config has no bindings");
  }
}
#endif  // __linux__

}  // namespace
}  // namespace edgecap::server
