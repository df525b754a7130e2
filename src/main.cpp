#include <sleek/core/config.h>
#include <sleek/core/diagnostics.h>
#include <sleek/net/http_client.h>
#include <sleek/proxy/envelope.h>
#include <sleek/proxy/proxy_handler.h>
#include <sleek/server/http_server.h>
#include <sleek/server/router.h>

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr const char kProgramName[] = "sleekproxy";

std::atomic<bool> g_stop_requested{false};

void handle_stop_signal(int) {
  g_stop_requested.store(true);
}

void print_usage(std::ostream& stream) {
  stream << "usage: " << kProgramName << " [options]\n"
         << "  --host=ADDR          listen address (default "
         << sleek::core::config::kDefaultListenHost << ")\n"
         << "  --port=N             listen port (default " << sleek::core::config::kDefaultPort
         << ")\n"
         << "  --mount=PATH         proxy entry point (default "
         << sleek::core::config::kDefaultMountPath << ")\n"
         << "  --allow=HOST[,HOST]  only proxy these hosts (repeatable)\n"
         << "  --no-private-check   do not block private network addresses\n"
         << "  --timeout-ms=N       upstream deadline in milliseconds\n"
         << "  --public=DIR         static files directory\n"
         << "  --workers=N          worker threads\n"
         << "  --insecure           skip TLS certificate verification\n"
         << "  --quiet              log warnings and errors only\n"
         << "  --fetch=URL          fetch once and print the function envelope as JSON\n"
         << "  -h, --help           show this help\n"
         << "  -V, --version        show version\n";
}

bool is_help_flag(std::string_view text) {
  return text == "-h" || text == "--help";
}

bool is_version_flag(std::string_view text) {
  return text == "-V" || text == "--version";
}

int fetch_once(const sleek::core::ProxyConfig& config,
               std::shared_ptr<const sleek::proxy::ProxyHandler> handler) {
  sleek::core::DiagnosticEmitter diag;
  diag.set_min_severity(config.log_level);
  diag.add_observer(sleek::core::stderr_observer());

  sleek::proxy::ProxyRequest request;
  request.target = *config.fetch_once;

  sleek::proxy::ProxyResponse response = handler->handle(request, diag);
  sleek::proxy::FunctionEnvelope envelope =
      sleek::proxy::to_envelope(std::move(response), diag, config.max_document_bytes);
  std::cout << envelope.to_json() << "\n";
  return envelope.status_code < 500 ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc == 2 && is_help_flag(argv[1])) {
    print_usage(std::cout);
    return 0;
  }
  if (argc == 2 && is_version_flag(argv[1])) {
    std::cout << sleek::core::config::kVersionString << "\n";
    return 0;
  }

  sleek::core::ProxyConfig config;
  sleek::core::ConfigResult result =
      sleek::core::apply_environment(config, sleek::core::process_environment());
  if (result.ok) {
    std::vector<std::string> args(argv + 1, argv + argc);
    result = sleek::core::apply_command_line(config, args);
  }
  if (!result.ok) {
    std::cerr << result.message << "\n";
    print_usage(std::cerr);
    return 1;
  }

  // Writes to a vanished peer must fail with EPIPE, not kill the process
  std::signal(SIGPIPE, SIG_IGN);

  auto client = std::make_shared<sleek::net::HttpClient>();
  client->set_timeout(config.upstream_timeout);
  client->set_verify_tls(config.verify_tls);
  auto handler = std::make_shared<const sleek::proxy::ProxyHandler>(config, client);

  if (config.fetch_once) {
    return fetch_once(config, handler);
  }

  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);

  auto router = std::make_shared<sleek::server::Router>(config, handler);
  sleek::server::HttpServer server(config, router, sleek::core::stderr_observer());

  std::string error;
  if (!server.listen(error)) {
    std::cerr << error << "\n";
    return 1;
  }

  sleek::core::DiagnosticEmitter diag;
  diag.set_min_severity(config.log_level);
  diag.add_observer(sleek::core::stderr_observer());
  diag.info("server", "listening",
            "SleekProxy on http://" + config.listen_host + ":" +
                std::to_string(server.bound_port()) + " (proxy at " + config.mount_path + ")");
  if (!config.block_private_addresses) {
    diag.warning("server", "listening", "private address blocking is disabled");
  }
  if (!config.verify_tls) {
    diag.warning("server", "listening", "TLS certificate verification is disabled");
  }

  server.serve([]() { return g_stop_requested.load(); });
  diag.info("server", "stopped", "shut down cleanly");
  return 0;
}
