// -----------------------------------------------------------------------------
// main.cpp - wlanpipe broker daemon
//
//   wlanpipe <-local | -udp> [wireless-interface]
//
// Parsing, config layering and the init/bind/run/cleanup sequence live in
// src/daemon.cpp. This file owns the process-wide pieces: signals, the root
// check and the concrete provider.
// -----------------------------------------------------------------------------
#include <atomic>
#include <csignal>
#include <cstring>          // memset
#include <iostream>
#include <string>
#include <unistd.h>         // geteuid

#include "wlanpipe/config.hpp"
#include "wlanpipe/daemon.hpp"
#include "wlanpipe/wifi/wifi_wpa_supplicant.hpp"

static std::atomic<bool> g_stop{false};

static void on_signal(int) {
  g_stop.store(true);
}

// No SA_RESTART: poll() must return EINTR so the loop sees g_stop promptly.
static void install_signals() {
  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = on_signal;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT,  &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
  signal(SIGPIPE, SIG_IGN);
}

int main(int argc, char** argv) {
  wlanpipe::CommandLine cl;
  int exit_code = 0;
  if (!wlanpipe::parse_command_line(argc, argv, cl, exit_code, std::cout, std::cerr)) {
    return exit_code;
  }

  wlanpipe::BrokerConfig cfg;
  std::string err;
  if (!wlanpipe::build_config(cl, cfg, err)) {
    std::cerr << "wlanpipe: status=error reason=" << err << "\n";
    return 1;
  }

  if (::geteuid() != 0) {
    std::cerr << "wlanpipe: warning=not_root detail=wpa_supplicant may refuse control commands\n";
  }

  install_signals();

  wlanpipe::wifi::WpaSupplicantProvider::Options wopts;
  wopts.ctrl_dir       = cfg.wpa_ctrl_dir;
  wopts.request_ms     = cfg.wpa_request_ms;
  wopts.scan_settle_ms = cfg.scan_settle_ms;
  wlanpipe::wifi::WpaSupplicantProvider provider(wopts, std::cerr);

  return wlanpipe::run_daemon(cfg, provider, g_stop, std::cerr);
}
