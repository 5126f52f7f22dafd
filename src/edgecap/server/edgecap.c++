// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include <edgecap/api/mtls-certificate.h>
#include <edgecap/server/json-logger.h>
#include <edgecap/server/response-writer.h>
#include <edgecap/server/server.h>

#include <capnp/message.h>
#include <kj/async-io.h>
#include <kj/debug.h>
#include <kj/filesystem.h>
#include <kj/io.h>
#include <kj/main.h>
#include <kj/miniposix.h>
#include <kj/vector.h>

namespace edgecap::server {

static kj::StringPtr getVersionString() {
  return "edgecap 0.1"_kj;
}

// =======================================================================================
// Some generic CLI helpers so that we can throw exceptions rather than return
// kj::MainBuilder::Validity.

class CliError {
 public:
  CliError(kj::String description): description(kj::mv(description)) {}
  kj::String description;
};

template <typename Func>
auto cliMethod(Func&& func) {
  return [func = kj::fwd<Func>(func)](auto&&... params) mutable -> kj::MainBuilder::Validity {
    try {
      func(kj::fwd<decltype(params)>(params)...);
      return true;
    } catch (CliError& e) {
      return kj::mv(e.description);
    }
  };
}

// Pass to MainBuilder when a function returning kj::MainBuilder::Validity is needed, implemented
// by a method of this class.
#define CLI_METHOD(name) cliMethod(KJ_BIND_METHOD(*this, name))

// Throws an exception that is caught and reported as a usage error.
#define CLI_ERROR(...) throw CliError(kj::str(__VA_ARGS__))

// =======================================================================================

class CliMain final {
 public:
  explicit CliMain(StructuredLoggingProcessContext& context)
      : context(context),
        fs(kj::newDiskFilesystem()),
        io(kj::setupAsyncIo()) {}

  kj::MainFunc getMain() {
    return kj::MainBuilder(context, getVersionString(),
        "Makes authenticated requests through edgecap bindings.")
        .addOption({"json-logs"}, [this]() {
      context.enableStructuredLogging();
      return true;
    }, "Write log messages as structured JSON, one entry per line, on stderr.")
        .addSubCommand("fetch", KJ_BIND_METHOD(*this, getFetch),
            "fetch a URL through an mTLS certificate binding")
        .addSubCommand("bindings", KJ_BIND_METHOD(*this, getBindings),
            "list the bindings a config defines")
        .build();
  }

  kj::MainFunc getFetch() {
    auto builder = kj::MainBuilder(context, getVersionString(),
        "Fetches <url> through an mTLS certificate binding.",
        "Loads the bindings defined in <config-file>, resolves <binding> as an mTLS certificate "
        "binding and fetches <url> with it, presenting the binding's client certificate during "
        "the TLS handshake. The response status line and body are written to stdout.");
    return builder
        .addOptionWithArg({'X', "method"}, CLI_METHOD(setMethod), "<method>",
            "Use HTTP method <method>. The default is GET.")
        .addOptionWithArg({'H', "header"}, CLI_METHOD(addHeader), "<name>:<value>",
            "Add a request header. May be given more than once.")
        .addOptionWithArg({'d', "data"}, CLI_METHOD(setBody), "<body>",
            "Send <body> as the request body.")
        .addOptionWithArg({"redirect"}, CLI_METHOD(setRedirect), "<mode>",
            "What to do with redirects: follow (default), manual, or error.")
        .expectArg("<config-file>", CLI_METHOD(loadConfig))
        .expectArg("<binding>", CLI_METHOD(setBindingName))
        .expectArg("<url>", CLI_METHOD(setUrl))
        .callAfterParsing(CLI_METHOD(fetch))
        .build();
  }

  kj::MainFunc getBindings() {
    auto builder = kj::MainBuilder(context, getVersionString(),
        "Lists the bindings defined in <config-file>.",
        "Prints each binding's name and host type name, one per line. Bindings with "
        "configuration errors are reported and left out.");
    return builder.expectArg("<config-file>", CLI_METHOD(loadConfig))
        .callAfterParsing(CLI_METHOD(listBindings))
        .build();
  }

  void loadConfig(kj::StringPtr pathStr) {
    auto path = fs->getCurrentPath().evalNative(pathStr);
    auto file = KJ_UNWRAP_OR(fs->getRoot().tryOpenFile(path), CLI_ERROR("No such file."));
    auto text = file->readAllText();
    KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
      config = decodeConfig(text, configMessage);
    })) {
      CLI_ERROR("Couldn't parse config: ", exception.getDescription());
    }
    configPath = kj::str(pathStr);
  }

  void setBindingName(kj::StringPtr name) {
    bindingName = kj::str(name);
  }

  void setUrl(kj::StringPtr str) {
    url = kj::str(str);
  }

  void setMethod(kj::StringPtr str) {
    init.method = KJ_UNWRAP_OR(kj::tryParseHttpMethod(str), CLI_ERROR("Unknown HTTP method."));
  }

  void addHeader(kj::StringPtr str) {
    auto colonPos = KJ_UNWRAP_OR(str.findFirst(':'), CLI_ERROR("Expected <name>:<value>"));
    auto value = str.slice(colonPos + 1);
    while (value.startsWith(" ")) value = value.slice(1);
    headers.add(api::Header{kj::str(str.slice(0, colonPos)), kj::str(value)});
  }

  void setBody(kj::StringPtr str) {
    init.body = kj::heapArray(str.asBytes());
  }

  void setRedirect(kj::StringPtr mode) {
    if (mode == "follow") {
      init.redirect = api::Redirect::FOLLOW;
    } else if (mode == "manual") {
      init.redirect = api::Redirect::MANUAL;
    } else if (mode == "error") {
      init.redirect = api::Redirect::ERROR;
    } else {
      CLI_ERROR("Redirect mode must be one of: follow, manual, error");
    }
  }

  void fetch() {
    auto env = makeEnvironment();

    auto resolved = api::getBinding<api::MtlsCertificate>(env, bindingName);
    KJ_SWITCH_ONEOF(resolved) {
      KJ_CASE_ONEOF(error, api::BindingError) {
        context.exitError(kj::str("Failed to get mTLS certificate binding: ", error,
            " Make sure \"", bindingName, "\" is configured in ", configPath, "."));
      }
      KJ_CASE_ONEOF(cert, api::MtlsCertificate) {
        if (headers.size() > 0) {
          init.headers = headers.releaseAsArray();
        }

        KJ_LOG(INFO, "making authenticated request", bindingName, url);
        auto result = cert.fetch(url, kj::mv(init)).wait(io.waitScope);

        KJ_SWITCH_ONEOF(result) {
          KJ_CASE_ONEOF(response, api::FetchResponse) {
            printResponse(response);
          }
          KJ_CASE_ONEOF(error, api::FetchError) {
            KJ_LOG(WARNING, "authenticated request failed", bindingName, url, error.type);
            context.exitError(kj::str("502 Bad Gateway: request failed: ", error));
          }
        }
      }
    }
  }

  void listBindings() {
    auto env = makeEnvironment();

    kj::Vector<kj::String> lines;
    for (auto name: env.getNames()) {
      auto& object = KJ_ASSERT_NONNULL(env.find(name));
      lines.add(kj::str(name, '\t', object.getTypeName(), '\n'));
    }
    kj::FdOutputStream(STDOUT_FILENO).write(kj::strArray(lines, "").asBytes());
  }

 private:
  StructuredLoggingProcessContext& context;
  kj::Own<kj::Filesystem> fs;
  kj::AsyncIoContext io;

  capnp::MallocMessageBuilder configMessage;
  kj::Maybe<config::Config::Reader> config;
  kj::String configPath;

  kj::String bindingName;
  kj::String url;
  api::RequestInit init;
  kj::Vector<api::Header> headers;

  Environment makeEnvironment() {
    Server server(io.provider->getTimer(), io.provider->getNetwork(),
        [this](kj::String error) { context.error(error); });
    return server.makeEnvironment(KJ_ASSERT_NONNULL(config));
  }

  void printResponse(api::FetchResponse& response) {
#if EDGECAP_HTTP_RESPONSE
    uint status = response.status;
#else
    uint status = response.getStatus();
#endif
    KJ_LOG(INFO, "received response", bindingName, status);

    auto output = io.lowLevelProvider->wrapOutputFd(STDOUT_FILENO);
    writeResponse(response, *output).wait(io.waitScope);
  }
};

}  // namespace edgecap::server

int main(int argc, char* argv[]) {
  edgecap::server::StructuredLoggingProcessContext context(argv[0]);
  edgecap::server::CliMain mainObject(context);
  return ::kj::runMainAndExit(context, mainObject.getMain(), argc, argv);
}
