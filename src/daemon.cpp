// -----------------------------------------------------------------------------
// daemon.cpp - command line, config layering and the broker lifecycle
//
// Sequence tests with a scripted provider: tests/test_daemon.cpp
// -----------------------------------------------------------------------------
#include "wlanpipe/daemon.hpp"

#include <cerrno>
#include <cstring>          // strerror
#include <vector>

#include "CLI/CLI.hpp"

#include "datagram_io.hpp"
#include "wlanpipe/broker.hpp"
#include "wlanpipe/session.hpp"

namespace wlanpipe {

// Single-dash long flags ("-local", "-udp") are rewritten to the double-dash
// form CLI11 expects. Everything else passes through untouched.
static std::string normalize_flag(const std::string& arg) {
  if (arg == "-local") return "--local";
  if (arg == "-udp")   return "--udp";
  return arg;
}

bool parse_command_line(int argc, const char* const* argv, CommandLine& cl,
                        int& exit_code, std::ostream& out, std::ostream& err) {
  std::vector<std::string> args;
  for (int i = argc - 1; i >= 1; --i) args.push_back(normalize_flag(argv[i]));

  const BrokerConfig defaults;

  CLI::App app{"wlanpipe - local Wi-Fi command broker"};
  app.name("wlanpipe");
  auto* o_local = app.add_flag("-l,--local", cl.local, "Listen on the local datagram socket");
  auto* o_udp   = app.add_flag("-u,--udp",   cl.udp,   "Listen on UDP (all interfaces)");
  o_local->excludes(o_udp);
  app.add_option("interface", cl.interface, "Wireless interface (default: first one wpa_supplicant manages)");
  auto* o_config = app.add_option("--config", cl.config_path,
                                  "JSON config file (default " + default_config_path() + ")");
  auto* o_socket = app.add_option("--socket", cl.socket_path,
                                  "Local socket path (default " + defaults.local_path + ")");
  auto* o_port   = app.add_option("--port", cl.port, "UDP port (default 51000)")
                      ->check(CLI::Range(1, 65535));
  auto* o_prefix = app.add_option("--prefix", cl.prefix, "SSID prefix SYNC scans for (default WiiU)");
  auto* o_recv   = app.add_option("--recv-timeout", cl.recv_timeout_ms, "Receive timeout in ms (default 1000)")
                      ->check(CLI::PositiveNumber);

  try {
    app.parse(args);
  } catch (const CLI::CallForHelp& e) {
    exit_code = app.exit(e, out, err);      // usage on out, exit 0
    return false;
  } catch (const CLI::ParseError& e) {
    err << "wlanpipe: status=error reason=bad_arguments detail=" << e.what() << "\n";
    err << app.help();
    exit_code = 1;
    return false;
  }

  if (cl.local == cl.udp) {                 // neither; both is excluded above
    err << "wlanpipe: status=error reason=need_exactly_one_transport\n";
    err << app.help();
    exit_code = 1;
    return false;
  }

  cl.has_config       = o_config->count() > 0;
  cl.has_socket       = o_socket->count() > 0;
  cl.has_port         = o_port->count() > 0;
  cl.has_prefix       = o_prefix->count() > 0;
  cl.has_recv_timeout = o_recv->count() > 0;
  exit_code = 0;
  return true;
}

bool build_config(const CommandLine& cl, BrokerConfig& cfg, std::string& err) {
  const std::string path = cl.has_config ? cl.config_path : default_config_path();
  if (!load_config_file(path, cfg, cl.has_config, err)) return false;

  cfg.transport = cl.local ? TransportMode::Local : TransportMode::Udp;
  if (!cl.interface.empty())  cfg.interface = cl.interface;
  if (cl.has_socket)          cfg.local_path = cl.socket_path;
  if (cl.has_port)            cfg.udp_port = static_cast<uint16_t>(cl.port);
  if (cl.has_prefix)          cfg.target_prefix = cl.prefix;
  if (cl.has_recv_timeout)    cfg.recv_timeout_ms = cl.recv_timeout_ms;

  return validate_config(cfg, err);
}

// run_daemon()
// Startup order: provider init -> bind -> READY -> loop -> cleanup.
// Any failure before READY exits 1 after releasing what was acquired.
int run_daemon(const BrokerConfig& cfg, wifi::IWifiProvider& provider,
               const std::atomic<bool>& stop, std::ostream& log) {
  if (!provider.init(cfg.interface.empty() ? nullptr : cfg.interface.c_str())) {
    log << "wlanpipe: status=error reason=wifi_init_failed\n";
    return 1;
  }

  int fd = -1;
  std::string unlink_path;
  if (cfg.transport == TransportMode::Local) {
    fd = open_local_endpoint(cfg.local_path);
    unlink_path = cfg.local_path;
  } else {
    fd = open_udp_endpoint(cfg.udp_port);
  }
  if (fd < 0) {
    log << "wlanpipe: status=error reason=bind_failed transport=" << transport_name(cfg.transport)
        << " err=" << std::strerror(errno) << "\n";
    provider.cleanup();
    return 1;
  }

  log << "wlanpipe: event=listening transport=" << transport_name(cfg.transport);
  if (cfg.transport == TransportMode::Local) log << " path=" << cfg.local_path;
  else                                       log << " port=" << cfg.udp_port;
  log << " iface=" << provider.interface_name() << "\n";

  log << "READY" << std::endl;

  Session session(provider);
  Broker broker(session, cfg, log);
  broker.run(fd, stop);

  close_endpoint(fd, unlink_path);
  provider.cleanup();
  log << "wlanpipe: event=exit status=ok\n";
  return 0;
}

} // namespace wlanpipe
