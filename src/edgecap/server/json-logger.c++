// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "json-logger.h"

#include <edgecap/server/log-schema.capnp.h>

#include <capnp/compat/json.h>
#include <capnp/message.h>
#include <kj/debug.h>
#include <kj/io.h>
#include <kj/time.h>
#include <kj/vector.h>

namespace edgecap::server {

namespace {

using LogLevel = log_schema::LogEntry::LogLevel;

LogLevel toLogLevel(kj::LogSeverity severity) {
  switch (severity) {
    case kj::LogSeverity::INFO:
      return LogLevel::INFO;
    case kj::LogSeverity::WARNING:
      return LogLevel::WARNING;
    case kj::LogSeverity::ERROR:
      return LogLevel::ERROR;
    case kj::LogSeverity::FATAL:
      return LogLevel::FATAL;
    case kj::LogSeverity::DBG:
      return LogLevel::DBG;
  }
  KJ_UNREACHABLE;
}

kj::Maybe<size_t> find(kj::StringPtr text, kj::StringPtr needle) {
  if (text.size() < needle.size()) return kj::none;
  for (size_t i = 0; i + needle.size() <= text.size(); i++) {
    if (text.slice(i).startsWith(needle)) return i;
  }
  return kj::none;
}

}  // namespace

LogText parseLogText(kj::StringPtr text) {
  static constexpr kj::StringPtr SEPARATOR = "; "_kj;
  static constexpr kj::StringPtr ASSIGN = " = "_kj;

  // KJ ends every log message with a newline.
  auto trimmed = text.endsWith("\n") ? kj::str(text.slice(0, text.size() - 1)) : kj::str(text);
  text = trimmed;

  kj::Vector<kj::String> parts;
  for (;;) {
    KJ_IF_SOME(pos, find(text, SEPARATOR)) {
      parts.add(kj::str(text.slice(0, pos)));
      text = text.slice(pos + SEPARATOR.size());
    } else {
      parts.add(kj::str(text));
      break;
    }
  }

  // A part without " = " was a "; " inside a value or the message itself; glue it back on.
  kj::String message = kj::mv(parts[0]);
  kj::Vector<LogText::Field> fields;
  for (kj::StringPtr part: parts.asPtr().slice(1, parts.size())) {
    KJ_IF_SOME(pos, find(part, ASSIGN)) {
      fields.add(LogText::Field{
        .name = kj::str(part.slice(0, pos)),
        .value = kj::str(part.slice(pos + ASSIGN.size())),
      });
    } else if (fields.size() > 0) {
      auto& last = fields.back();
      last.value = kj::str(last.value, SEPARATOR, part);
    } else {
      message = kj::str(message, SEPARATOR, part);
    }
  }

  return {.message = kj::mv(message), .fields = fields.releaseAsArray()};
}

kj::String encodeLogEntry(kj::LogSeverity severity, kj::StringPtr source, const LogText& text) {
  capnp::MallocMessageBuilder message;
  auto entry = message.initRoot<log_schema::LogEntry>();

  entry.setTimestamp((kj::systemPreciseCalendarClock().now() - kj::UNIX_EPOCH) / kj::MILLISECONDS);
  entry.setLevel(toLogLevel(severity));
  entry.setSource(source);
  entry.setMessage(text.message);
  if (text.fields.size() > 0) {
    auto list = entry.initFields(text.fields.size());
    for (auto i: kj::indices(text.fields)) {
      list[i].setName(text.fields[i].name);
      list[i].setValue(text.fields[i].value);
    }
  }

  capnp::JsonCodec codec;
  codec.handleByAnnotation<log_schema::LogEntry>();
  codec.setPrettyPrint(false);
  return codec.encode(entry);
}

void JsonLogger::logMessage(
    kj::LogSeverity severity, const char* file, int line, int contextDepth, kj::String&& text) {
  // Encoding the entry could itself log.
  if (loggingInProgress) {
    return;
  }
  loggingInProgress = true;
  KJ_DEFER(loggingInProgress = false);

  auto json = encodeLogEntry(severity, kj::str(file, ":", line), parseLogText(text));
  kj::FdOutputStream(fd).write({json.asBytes(), "\n"_kj.asBytes()});
}

// =======================================================================================
// StructuredLoggingProcessContext

StructuredLoggingProcessContext::StructuredLoggingProcessContext(kj::StringPtr programName)
    : topLevelContext(programName) {}

void StructuredLoggingProcessContext::enableStructuredLogging() {
  if (jsonLogger == kj::none) {
    jsonLogger.emplace();
  }
}

// CLI diagnostics have no source location; they are attributed to the program.
kj::String StructuredLoggingProcessContext::format(
    kj::LogSeverity severity, kj::StringPtr message) const {
  if (jsonLogger == kj::none) {
    return kj::str(message);
  }
  return encodeLogEntry(severity, "edgecap"_kj, LogText{.message = kj::str(message)});
}

kj::StringPtr StructuredLoggingProcessContext::getProgramName() {
  return topLevelContext.getProgramName();
}

void StructuredLoggingProcessContext::exit() {
  topLevelContext.exit();
}

void StructuredLoggingProcessContext::warning(kj::StringPtr message) const {
  topLevelContext.warning(format(kj::LogSeverity::WARNING, message));
}

void StructuredLoggingProcessContext::error(kj::StringPtr message) const {
  topLevelContext.error(format(kj::LogSeverity::ERROR, message));
}

void StructuredLoggingProcessContext::exitError(kj::StringPtr message) {
  topLevelContext.exitError(format(kj::LogSeverity::ERROR, message));
}

void StructuredLoggingProcessContext::exitInfo(kj::StringPtr message) {
  topLevelContext.exitInfo(format(kj::LogSeverity::INFO, message));
}

void StructuredLoggingProcessContext::increaseLoggingVerbosity() {
  topLevelContext.increaseLoggingVerbosity();
}

}  // namespace edgecap::server
