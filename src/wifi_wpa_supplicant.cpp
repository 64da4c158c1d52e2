// -----------------------------------------------------------------------------
// wifi_wpa_supplicant.cpp - IWifiProvider over the wpa_supplicant control socket
//
// Command table and secret rules: see include/wlanpipe/wifi/wifi_wpa_supplicant.hpp
// Contract tests against a fake control socket: see tests/test_wpa.cpp
// -----------------------------------------------------------------------------
#include "wlanpipe/wifi/wifi_wpa_supplicant.hpp"

#include <unistd.h>       // getpid
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdlib>        // strtol
#include <cstring>        // strerror
#include <filesystem>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace wlanpipe::wifi {

// ============================================================================
// wpa:: free helpers
// ============================================================================
namespace wpa {

static int hex_val(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string hex_encode(const uint8_t* p, std::size_t n) {
  static const char* H = "0123456789abcdef";
  std::string s;
  s.reserve(n * 2);
  for (std::size_t i = 0; i < n; ++i) {
    s.push_back(H[p[i] >> 4]);
    s.push_back(H[p[i] & 0x0F]);
  }
  return s;
}

std::string unescape_ssid(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] != '\\' || i + 1 >= s.size()) { out.push_back(s[i]); continue; }
    const char e = s[++i];
    switch (e) {
      case '\\': out.push_back('\\'); break;
      case '"':  out.push_back('"');  break;
      case 'n':  out.push_back('\n'); break;
      case 'r':  out.push_back('\r'); break;
      case 't':  out.push_back('\t'); break;
      case 'e':  out.push_back('\033'); break;
      case 'x': {
        const int hi = (i + 1 < s.size()) ? hex_val(s[i + 1]) : -1;
        const int lo = (i + 2 < s.size()) ? hex_val(s[i + 2]) : -1;
        if (hi < 0 || lo < 0) { out.push_back('\\'); out.push_back('x'); break; }
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        break;
      }
      default:
        out.push_back('\\');
        out.push_back(e);
        break;
    }
  }
  return out;
}

// parse_scan_results()
// Format (after one header line):
//   bssid \t frequency \t signal level \t flags \t ssid
// A hidden network has an empty ssid column; it is kept with ssid "".
std::vector<ScanEntry> parse_scan_results(const std::string& raw) {
  std::vector<ScanEntry> rows;
  std::istringstream in(raw);
  std::string line;
  bool header = true;
  while (std::getline(in, line)) {
    if (header) { header = false; continue; }
    if (line.empty()) continue;

    std::vector<std::string> cols;
    std::size_t start = 0;
    for (int k = 0; k < 4; ++k) {
      std::size_t tab = line.find('\t', start);
      if (tab == std::string::npos) break;
      cols.push_back(line.substr(start, tab - start));
      start = tab + 1;
    }
    if (cols.size() < 4) continue;
    cols.push_back(line.substr(start));   // SSID may itself contain escaped tabs only

    ScanEntry e;
    e.bssid  = cols[0];
    e.freq   = static_cast<int>(std::strtol(cols[1].c_str(), nullptr, 10));
    e.signal = static_cast<int>(std::strtol(cols[2].c_str(), nullptr, 10));
    e.flags  = cols[3];
    e.ssid   = unescape_ssid(cols[4]);
    rows.push_back(e);
  }
  return rows;
}

std::map<std::string, std::string> parse_status(const std::string& raw) {
  std::map<std::string, std::string> kv;
  std::istringstream in(raw);
  std::string line;
  while (std::getline(in, line)) {
    std::size_t eq = line.find('=');
    if (eq == std::string::npos || eq == 0) continue;
    kv[line.substr(0, eq)] = line.substr(eq + 1);
  }
  return kv;
}

// encode_secret()
// POLICY: length decides first. 32 bytes is always a raw PSK, even if every
//         byte happens to be printable.
SecretKind encode_secret(const SecretBytes& secret, std::string& value) {
  if (secret.empty()) {
    value.clear();
    return SecretKind::Open;
  }
  if (secret.size() == 32) {
    value = hex_encode(secret.data(), secret.size());
    return SecretKind::RawPsk;
  }
  if (secret.size() < 8 || secret.size() > 63) return SecretKind::Invalid;
  for (uint8_t b : secret) {
    if (b < 0x20 || b > 0x7E) return SecretKind::Invalid;
  }
  value = "\"";
  value.append(reinterpret_cast<const char*>(secret.data()), secret.size());
  value.push_back('"');
  return SecretKind::Passphrase;
}

bool is_interface_socket(const std::string& name) {
  if (name.empty() || name[0] == '.') return false;
  return name.find("p2p") == std::string::npos;
}

} // namespace wpa

// ============================================================================
// WpaSupplicantProvider
// ============================================================================

static std::string bssid_text(const Bssid& b) {
  std::string s;
  const std::string hex = wpa::hex_encode(b.data(), b.size());
  for (std::size_t i = 0; i < b.size(); ++i) {
    if (i) s.push_back(':');
    s.append(hex, i * 2, 2);
  }
  return s;
}

static std::string trim_reply(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
  return s;
}

// ---------- reply shapes ----------

static bool is_fail(const std::string& r) { return r.rfind("FAIL", 0) == 0; }

static bool fits_pong(const std::string& reply) {
  return trim_reply(reply) == "PONG";
}

static bool fits_ok(const std::string& reply) {
  const std::string r = trim_reply(reply);
  return r == "OK" || is_fail(r);
}

static bool fits_net_id(const std::string& reply) {
  const std::string r = trim_reply(reply);
  if (is_fail(r)) return true;
  if (r.empty()) return false;
  return std::all_of(r.begin(), r.end(), [](char c) { return c >= '0' && c <= '9'; });
}

static bool fits_scan_results(const std::string& reply) {
  return reply.rfind("bssid", 0) == 0 || is_fail(reply);
}

// STATUS always carries wpa_state, whatever the link is doing.
static bool fits_status(const std::string& reply) {
  return reply.rfind("wpa_state=", 0) == 0 || reply.find("\nwpa_state=") != std::string::npos;
}

WpaSupplicantProvider::WpaSupplicantProvider(const Options& opts, std::ostream& diag)
: opts_(opts), diag_(diag) {
}

WpaSupplicantProvider::~WpaSupplicantProvider() {
  cleanup();
}

// pick_interface()
// First interface socket in ctrl_dir, by name, so the choice is stable across runs.
bool WpaSupplicantProvider::pick_interface(std::string& out) {
  std::error_code ec;
  std::vector<std::string> names;
  fs::directory_iterator it(opts_.ctrl_dir, ec);
  for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
    std::error_code ent_ec;
    if (!it->is_socket(ent_ec)) continue;
    const std::string n = it->path().filename().string();
    if (wpa::is_interface_socket(n)) names.push_back(n);
  }
  if (ec || names.empty()) return false;
  std::sort(names.begin(), names.end());
  out = names.front();
  return true;
}

// init()
// PRE:  not initialized (a second call re-initializes after cleanup()).
// OUT:  fd_ bound to a private path under client_dir and addressed at
//       ctrl_dir/iface; the daemon answered PING with PONG.
bool WpaSupplicantProvider::init(const char* iface) {
  cleanup();

  if (iface && *iface) {
    iface_ = iface;
  } else if (!pick_interface(iface_)) {
    diag_ << "wlanpipe: event=wifi_init status=error reason=no_interface ctrl_dir="
          << opts_.ctrl_dir << "\n";
    return false;
  }

  static std::atomic<unsigned> counter{0};
  own_path_ = opts_.client_dir + "/wlanpipe-wpa-" + std::to_string(::getpid()) +
              "-" + std::to_string(counter++);
  const std::string ctrl_path = opts_.ctrl_dir + "/" + iface_;

  fd_ = open_local_client(own_path_, ctrl_path, peer_);
  if (fd_ < 0) {
    diag_ << "wlanpipe: event=wifi_init status=error reason=socket_failed err="
          << std::strerror(errno) << "\n";
    own_path_.clear();
    return false;
  }

  std::string reply;
  if (!request("PING", reply, fits_pong)) {
    diag_ << "wlanpipe: event=wifi_init status=error reason=no_pong ctrl=" << ctrl_path << "\n";
    cleanup();
    return false;
  }

  diag_ << "wlanpipe: event=wifi_init status=ok provider=" << name()
        << " iface=" << iface_ << "\n";
  return true;
}

// drain_stale()
// Replies that arrived after their request gave up are still queued on fd_.
// They are read off before the next command goes out.
void WpaSupplicantProvider::drain_stale() {
  std::vector<uint8_t> in;
  PeerAddress from;
  while (recv_datagram(fd_, in, from, 0, 4096) == RecvStatus::Ok) {
    if (!in.empty() && in[0] == '<') continue;
    diag_ << "wlanpipe: event=wifi_stale_reply len=" << in.size() << "\n";
  }
}

// request()
// One command out, one reply back. Unsolicited event messages ("<N>...")
// arrive only on attached sockets, but are skipped anyway in case the daemon
// has been told to send them. A reply that does not fit @p fit is a late
// answer to an earlier command still in flight when it timed out; it is
// dropped and the wait continues until the deadline.
bool WpaSupplicantProvider::request(const std::string& cmd, std::string& reply, ReplyFit fit) {
  if (fd_ < 0) return false;
  drain_stale();
  std::vector<uint8_t> out(cmd.begin(), cmd.end());
  if (!send_datagram(fd_, out, peer_)) return false;

  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + std::chrono::milliseconds(opts_.request_ms);
  std::vector<uint8_t> in;
  PeerAddress from;
  while (true) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - clock::now()).count();
    if (left <= 0) return false;
    RecvStatus st = recv_datagram(fd_, in, from, static_cast<int>(left), 4096);
    if (st == RecvStatus::Timeout) continue;
    if (st == RecvStatus::Error) return false;
    if (!in.empty() && in[0] == '<') continue;
    std::string got(in.begin(), in.end());
    if (fit && !fit(got)) {
      diag_ << "wlanpipe: event=wifi_stale_reply cmd=" << cmd.substr(0, cmd.find(' '))
            << " len=" << got.size() << "\n";
      continue;
    }
    reply.swap(got);
    return true;
  }
}

bool WpaSupplicantProvider::request_ok(const std::string& cmd) {
  std::string reply;
  if (!request(cmd, reply, fits_ok)) return false;
  return trim_reply(reply) == "OK";
}

bool WpaSupplicantProvider::query_status(std::map<std::string, std::string>& out) {
  std::string reply;
  if (!request("STATUS", reply, fits_status)) return false;
  out = wpa::parse_status(reply);
  return true;
}

// scan_for_target()
// POLICY: FAIL-BUSY means a scan is already running; its results are as good
//         as ours. Among matches, the strongest signal wins.
WifiResult WpaSupplicantProvider::scan_for_target(const SsidMatch& match, SsidStr& found) {
  if (fd_ < 0) return WifiResult::Error;

  std::string reply;
  if (!request("SCAN", reply, fits_ok)) return WifiResult::Error;
  const std::string r = trim_reply(reply);
  if (r != "OK" && r != "FAIL-BUSY") {
    diag_ << "wlanpipe: event=wifi_scan status=error reply=" << r << "\n";
    return WifiResult::Error;
  }

  if (opts_.scan_settle_ms > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(opts_.scan_settle_ms));
  }

  if (!request("SCAN_RESULTS", reply, fits_scan_results)) return WifiResult::Error;
  if (is_fail(reply)) return WifiResult::Error;

  const auto rows = wpa::parse_scan_results(reply);
  const wpa::ScanEntry* best = nullptr;
  for (const auto& e : rows) {
    if (e.ssid.empty() || e.ssid.size() > kSsidMax) continue;
    if (!match.matches(e.ssid.data(), e.ssid.size())) continue;
    if (!best || e.signal > best->signal) best = &e;
  }

  diag_ << "wlanpipe: event=wifi_scan networks=" << rows.size()
        << " pattern=" << match.pattern.c_str()
        << " match=" << (best ? best->ssid : std::string("none")) << "\n";
  if (!best) return WifiResult::NotFound;

  found.assign(best->ssid.data(), best->ssid.size());
  return WifiResult::Ok;
}

// associate()
// PRE:    init() succeeded.
// POLICY: any previous network this provider added is removed first, so there
//         is at most one wlanpipe network in wpa_supplicant at a time.
// OUT:    Ok once SELECT_NETWORK is accepted. Link-up is checked separately
//         through is_connected().
WifiResult WpaSupplicantProvider::associate(const TargetNetwork& target) {
  if (fd_ < 0) return WifiResult::Error;
  if (target.ssid.empty()) return WifiResult::Error;

  std::string secret_value;
  const wpa::SecretKind kind = wpa::encode_secret(target.secret, secret_value);
  if (kind == wpa::SecretKind::Invalid) {
    diag_ << "wlanpipe: event=wifi_associate status=error reason=bad_secret len="
          << target.secret.size() << "\n";
    return WifiResult::Error;
  }

  remove_added_network();

  std::string reply;
  if (!request("ADD_NETWORK", reply, fits_net_id)) return WifiResult::Error;
  const std::string id_text = trim_reply(reply);
  char* end = nullptr;
  const long id = std::strtol(id_text.c_str(), &end, 10);
  if (id_text.empty() || *end != '\0' || id < 0) {
    diag_ << "wlanpipe: event=wifi_associate status=error reason=add_network reply="
          << id_text << "\n";
    return WifiResult::Error;
  }
  net_id_ = static_cast<int>(id);
  const std::string pfx = "SET_NETWORK " + id_text + " ";

  bool ok = request_ok(pfx + "ssid " +
      wpa::hex_encode(reinterpret_cast<const uint8_t*>(target.ssid.data()), target.ssid.size()));
  if (ok && target.has_bssid) ok = request_ok(pfx + "bssid " + bssid_text(target.bssid));
  if (ok) {
    if (kind == wpa::SecretKind::Open) ok = request_ok(pfx + "key_mgmt NONE");
    else                               ok = request_ok(pfx + "psk " + secret_value);
  }
  if (ok) ok = request_ok("SELECT_NETWORK " + id_text);

  if (!ok) {
    diag_ << "wlanpipe: event=wifi_associate status=error reason=configure_failed ssid="
          << target.ssid.c_str() << "\n";
    remove_added_network();
    return WifiResult::Error;
  }

  diag_ << "wlanpipe: event=wifi_associate status=ok ssid=" << target.ssid.c_str()
        << " net_id=" << net_id_ << "\n";
  return WifiResult::Ok;
}

void WpaSupplicantProvider::remove_added_network() {
  if (net_id_ < 0) return;
  if (!request_ok("REMOVE_NETWORK " + std::to_string(net_id_))) {
    diag_ << "wlanpipe: event=wifi_remove_network status=error net_id=" << net_id_ << "\n";
  }
  net_id_ = -1;
}

// disassociate()
// Idempotent. DISCONNECT succeeds whether or not a link exists.
WifiResult WpaSupplicantProvider::disassociate() {
  if (fd_ < 0) return WifiResult::Error;
  const bool ok = request_ok("DISCONNECT");
  remove_added_network();
  diag_ << "wlanpipe: event=wifi_disassociate status=" << (ok ? "ok" : "error") << "\n";
  return ok ? WifiResult::Ok : WifiResult::Error;
}

bool WpaSupplicantProvider::is_connected() {
  std::map<std::string, std::string> kv;
  if (!query_status(kv)) return false;
  auto it = kv.find("wpa_state");
  return it != kv.end() && it->second == "COMPLETED";
}

WifiResult WpaSupplicantProvider::get_ip_address(IpStr& out) {
  std::map<std::string, std::string> kv;
  if (!query_status(kv)) return WifiResult::Error;
  auto it = kv.find("ip_address");
  if (it == kv.end() || it->second.empty()) return WifiResult::NotFound;
  if (it->second.size() > out.max_size()) return WifiResult::Error;
  out.assign(it->second.c_str(), it->second.size());
  return WifiResult::Ok;
}

void WpaSupplicantProvider::cleanup() {
  if (fd_ >= 0) remove_added_network();
  close_endpoint(fd_, own_path_);
  fd_ = -1;
  own_path_.clear();
  peer_ = PeerAddress{};
}

} // namespace wlanpipe::wifi
