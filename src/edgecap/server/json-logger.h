// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <kj/exception.h>
#include <kj/main.h>
#include <kj/miniposix.h>
#include <kj/string.h>

namespace edgecap::server {

// A KJ log message split back into its description and parameters.
//
// KJ_LOG(INFO, "fetch failed", binding, error) renders as
// "fetch failed; binding = MY_CERT; error = transport failure: ...". That is the form
// ExceptionCallback::logMessage() receives, and parseLogText() undoes it so the binding name and
// the error become separate fields of the log entry.
struct LogText {
  struct Field {
    kj::String name;
    kj::String value;
  };

  kj::String message;
  kj::Array<Field> fields;
};

LogText parseLogText(kj::StringPtr text);

// Encodes one log entry as single-line JSON (see log-schema.capnp).
kj::String encodeLogEntry(
    kj::LogSeverity severity, kj::StringPtr source, const LogText& text);

// While an instance is alive on a thread, KJ_LOG output on that thread is written to `fd` as
// JSON, one entry per line, instead of plain text. The edgecap CLI writes response bodies to
// stdout, so logs go to stderr by default.
class JsonLogger final: public kj::ExceptionCallback {
 public:
  explicit JsonLogger(int fd = STDERR_FILENO): fd(fd) {}

  void logMessage(kj::LogSeverity severity,
      const char* file,
      int line,
      int contextDepth,
      kj::String&& text) override;

 private:
  int fd;
  bool loggingInProgress = false;
};

// The edgecap CLI's ProcessContext. Behaves like kj::TopLevelProcessContext until
// enableStructuredLogging() is called. After that, KJ_LOG output and the CLI's own warnings and
// errors are all emitted as JSON log entries on stderr.
class StructuredLoggingProcessContext final: public kj::ProcessContext {
 public:
  explicit StructuredLoggingProcessContext(kj::StringPtr programName);

  // Irreversible; calling it again has no effect.
  void enableStructuredLogging();

  kj::StringPtr getProgramName() override;
  KJ_NORETURN(void exit() override);
  void warning(kj::StringPtr message) const override;
  void error(kj::StringPtr message) const override;
  KJ_NORETURN(void exitError(kj::StringPtr message) override);
  KJ_NORETURN(void exitInfo(kj::StringPtr message) override);
  void increaseLoggingVerbosity() override;

 private:
  kj::TopLevelProcessContext topLevelContext;
  kj::Maybe<JsonLogger> jsonLogger;

  kj::String format(kj::LogSeverity severity, kj::StringPtr message) const;
};

}  // namespace edgecap::server
