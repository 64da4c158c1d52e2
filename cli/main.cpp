/**
 * @file main.cpp
 * @brief wlanpipe-ctl - one-shot frontend that sends a single command to a running broker.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11) into exactly one command frame.
 *  - Open a client socket on the chosen transport (local or UDP).
 *  - Send the frame, then print every reply until a STATUS arrives or the
 *    timeout expires.
 *  - Render replies as pretty text, JSON (nlohmann/json) or a raw hex dump.
 *
 * Exit codes:
 *   0  at least one reply printed (or QUIT sent; QUIT has no reply)
 *   1  socket / send failure
 *   2  bad usage
 *   3  no reply before timeout
 *
 * Notes:
 *  - "-local" and "-udp" are accepted as well as "--local" / "--udp", the same
 *    spelling the broker takes.
 *  - A local client binds its own socket path so the broker can address the
 *    reply; the path is removed on exit.
 */

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h> // isatty, getpid

#include "CLI/CLI.hpp"
#include "nlohmann/json.hpp"

#include "datagram_io.hpp"
#include "wlanpipe/config.hpp"
#include "wlanpipe/frame.hpp"

using json = nlohmann::json;
using namespace wlanpipe;

// ---------- small utilities ----------

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold (const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim  (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red  (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
  std::string green(const std::string& s) const { return enabled ? "\033[32m"+s+"\033[0m" : s; }
};

static std::string normalize_flag(const std::string& arg) {
  if (arg == "-local") return "--local";
  if (arg == "-udp")   return "--udp";
  return arg;
}

static int hex_nibble(char c) {
  if (c>='0' && c<='9') return c-'0';
  if (c>='a' && c<='f') return c-'a'+10;
  if (c>='A' && c<='F') return c-'A'+10;
  return -1;
}

// "aa:bb:cc:dd:ee:ff" -> 6 bytes. Separators are required.
static bool parse_bssid(const std::string& s, wifi::Bssid& out) {
  if (s.size() != 17) return false;
  for (size_t i = 0; i < 6; ++i) {
    const size_t p = i * 3;
    if (i > 0 && s[p-1] != ':') return false;
    int hi = hex_nibble(s[p]), lo = hex_nibble(s[p+1]);
    if (hi < 0 || lo < 0) return false;
    out[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return true;
}

// 64 hex digits -> 32-byte raw PSK.
static bool parse_psk_hex(const std::string& s, wifi::SecretBytes& out) {
  if (s.size() != 64) return false;
  out.clear();
  for (size_t i = 0; i < s.size(); i += 2) {
    int hi = hex_nibble(s[i]), lo = hex_nibble(s[i+1]);
    if (hi < 0 || lo < 0) return false;
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return true;
}

static std::string hex_dump(const std::vector<uint8_t>& b) {
  std::ostringstream os;
  os << std::hex << std::setfill('0');
  for (size_t i = 0; i < b.size(); ++i) {
    if (i) os << ' ';
    os << std::setw(2) << int(b[i]);
  }
  return os.str();
}

static json frame_json(const Frame& f) {
  json j;
  j["code"] = control_name(f.control_code);
  if (f.control_code == STATUS) {
    j["status"] = status_name(f.status_value());
    j["status_value"] = f.status_value();
  }
  return j;
}

static void print_reply(const Frame& f, const std::vector<uint8_t>& raw,
                        const std::string& format, const Ansi& ansi) {
  if (format == "json") {
    std::cout << frame_json(f).dump() << "\n";
  } else if (format == "raw") {
    std::cout << hex_dump(raw) << "\n";
  } else {
    std::string line = describe(f);
    if (f.control_code == STATUS) {
      line = (f.status_value() == 0) ? ansi.green(line) : ansi.red(line);
    } else {
      line = ansi.bold(line);
    }
    std::cout << line << "\n";
  }
}

// ---------- main ----------

int main(int argc, char** argv) {
  std::vector<std::string> args;
  for (int i = argc - 1; i >= 1; --i) args.push_back(normalize_flag(argv[i]));

  // transport
  bool opt_local = false, opt_udp = false;
  std::string opt_socket = BrokerConfig{}.local_path;
  std::string opt_client_socket;
  std::string opt_host = "127.0.0.1";
  int opt_port = kDefaultPort;

  // commands
  bool opt_sync = false, opt_unbind = false, opt_quit = false;
  int opt_pair_code = 0;
  std::string opt_connect, opt_bssid, opt_psk, opt_passphrase;

  // output
  int opt_timeout_ms = 3000;
  int opt_connect_timeout_ms = 30000;
  std::string opt_format = "pretty";
  bool opt_no_color = false;

  CLI::App app{"wlanpipe-ctl - send one command to a wlanpipe broker"};
  app.name("wlanpipe-ctl");

  auto* o_local = app.add_flag("-l,--local", opt_local, "Use the local datagram socket");
  auto* o_udp   = app.add_flag("-u,--udp", opt_udp, "Use UDP");
  o_local->excludes(o_udp);
  app.add_option("--socket", opt_socket, "Broker socket path")->capture_default_str();
  app.add_option("--client-socket", opt_client_socket, "Own socket path (default /tmp/wlanpipe-ctl-<pid>.sock)");
  app.add_option("--host", opt_host, "Broker host for UDP")->capture_default_str();
  app.add_option("--port", opt_port, "Broker UDP port")->capture_default_str()->check(CLI::Range(1, 65535));

  app.add_flag("--sync", opt_sync, "Scan for a target network");
  app.add_option("--pair-code", opt_pair_code, "Pairing code carried by --sync")->check(CLI::Range(0, 65535));
  app.add_option("--connect", opt_connect, "Associate with SSID");
  app.add_option("--bssid", opt_bssid, "With --connect: BSSID aa:bb:cc:dd:ee:ff");
  auto* o_psk  = app.add_option("--psk", opt_psk, "With --connect: 64 hex digit raw PSK");
  auto* o_pass = app.add_option("--passphrase", opt_passphrase, "With --connect: WPA passphrase (8..63 chars)");
  o_psk->excludes(o_pass);
  app.add_flag("--unbind", opt_unbind, "Disassociate");
  app.add_flag("--quit", opt_quit, "Stop the broker");

  app.add_option("--timeout", opt_timeout_ms, "Reply timeout in ms")->capture_default_str()->check(CLI::PositiveNumber);
  app.add_option("--connect-timeout", opt_connect_timeout_ms, "Wait for the final STATUS after BIND_ACK, ms")
     ->capture_default_str()->check(CLI::PositiveNumber);
  app.add_option("--format", opt_format, "Output format: pretty|json|raw")->check(CLI::IsMember({"pretty","json","raw"}));
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");

  try {
    app.parse(args);
  } catch (const CLI::ParseError &e) {
    const int rc = app.exit(e);
    return rc == 0 ? 0 : 2;
  }

  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stdout() && (opt_format=="pretty");

  if (opt_local == opt_udp) {
    std::cerr << "status=error reason=need_exactly_one_transport\n";
    return 2;
  }

  int cmds = 0;
  cmds += opt_sync ? 1 : 0;
  cmds += (!opt_connect.empty()) ? 1 : 0;
  cmds += opt_unbind ? 1 : 0;
  cmds += opt_quit ? 1 : 0;
  if (cmds != 1) {
    std::cerr << "status=error reason=need_exactly_one_command\n";
    return 2;
  }

  // -------- build request --------
  Frame req;
  if (opt_sync) {
    req = make_sync(static_cast<uint16_t>(opt_pair_code));
  } else if (!opt_connect.empty()) {
    wifi::TargetNetwork t;
    if (opt_connect.size() > wifi::kSsidMax) {
      std::cerr << "status=error reason=ssid_too_long\n";
      return 2;
    }
    t.ssid.assign(opt_connect.c_str(), opt_connect.size());
    if (!opt_bssid.empty()) {
      if (!parse_bssid(opt_bssid, t.bssid)) {
        std::cerr << "status=error reason=bad_bssid\n";
        return 2;
      }
      t.has_bssid = true;
    }
    if (!opt_psk.empty() && !parse_psk_hex(opt_psk, t.secret)) {
      std::cerr << "status=error reason=bad_psk need=64_hex_digits\n";
      return 2;
    }
    if (!opt_passphrase.empty()) {
      if (opt_passphrase.size() < 8 || opt_passphrase.size() > 63) {
        std::cerr << "status=error reason=bad_passphrase need=8..63_chars\n";
        return 2;
      }
      t.secret.assign(opt_passphrase.begin(), opt_passphrase.end());
    }
    req = make_connect(t);
  } else if (opt_unbind) {
    req = make_unbind();
  } else {
    req = make_quit();
  }

  // -------- open socket --------
  PeerAddress broker;
  int fd = -1;
  std::string own_path;
  if (opt_local) {
    own_path = opt_client_socket.empty()
             ? "/tmp/wlanpipe-ctl-" + std::to_string(::getpid()) + ".sock"
             : opt_client_socket;
    fd = open_local_client(own_path, opt_socket, broker);
  } else {
    fd = open_udp_client(opt_host, static_cast<uint16_t>(opt_port), broker);
  }
  if (fd < 0) {
    std::cerr << "status=error reason=open_failed err=" << std::strerror(errno) << "\n";
    return 1;
  }

  if (!send_datagram(fd, encode(req), broker)) {
    std::cerr << "status=error reason=send_failed to=" << broker.to_string()
              << " err=" << std::strerror(errno) << "\n";
    close_endpoint(fd, own_path);
    return 1;
  }

  if (req.control_code == QUIT) {
    if (opt_format == "json") std::cout << json{{"sent", "QUIT"}}.dump() << "\n";
    else                      std::cout << "status=sent code=QUIT\n";
    close_endpoint(fd, own_path);
    return 0;
  }

  // -------- collect replies --------
  // STATUS ends the exchange. BIND_ACK only extends the wait to --connect-timeout.
  int replies = 0;
  int wait_ms = opt_timeout_ms;
  while (true) {
    std::vector<uint8_t> in;
    PeerAddress from;
    RecvStatus st = recv_datagram(fd, in, from, wait_ms);
    if (st == RecvStatus::Timeout) break;
    if (st == RecvStatus::Error) {
      std::cerr << "status=error reason=recv_failed err=" << std::strerror(errno) << "\n";
      close_endpoint(fd, own_path);
      return 1;
    }

    Frame f;
    if (decode(in.data(), in.size(), f) != DecodeStatus::Ok) {
      std::cerr << ansi.dim("ignored datagram len=" + std::to_string(in.size())) << "\n";
      continue;
    }
    ++replies;
    print_reply(f, in, opt_format, ansi);
    if (f.control_code == STATUS) break;
    if (f.control_code == BIND_ACK) wait_ms = opt_connect_timeout_ms;
  }

  close_endpoint(fd, own_path);
  if (replies == 0) {
    std::cerr << "status=error reason=timeout\n";
    return 3;
  }
  return 0;
}
