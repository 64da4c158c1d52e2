// -----------------------------------------------------------------------------
// config.cpp - JSON overlay and path resolution for BrokerConfig
// -----------------------------------------------------------------------------
#include "wlanpipe/config.hpp"

#include <cstdint>
#include <cstdlib>        // getenv
#include <filesystem>
#include <limits>
#include <fstream>
#include <type_traits>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace wlanpipe {

// ---------- helpers ----------

// Copy j[key] into out if present. A present key of the wrong type is an
// error; the JSON type check happens before any assignment.
template <typename T>
static bool take(const json& j, const char* key, T& out, std::string& err) {
  auto it = j.find(key);
  if (it == j.end()) return true;

  bool ok = false;
  if constexpr (std::is_same<T, std::string>::value) {
    ok = it->is_string();
  } else {
    ok = it->is_number_integer();
  }
  if (!ok) {
    err = std::string("config_type_error key=") + key;
    return false;
  }
  if constexpr (std::is_same<T, std::string>::value) {
    out = it->template get<std::string>();
  } else {
    // Unsigned values above INT64_MAX read back negative and fail the min check.
    const int64_t v = it->template get<int64_t>();
    if (v < std::numeric_limits<T>::min() || v > std::numeric_limits<T>::max()) {
      err = std::string("config_range_error key=") + key;
      return false;
    }
    out = static_cast<T>(v);
  }
  return true;
}

// ---------- public ----------

std::string default_config_path() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  const char* home = std::getenv("HOME");
  fs::path base = (xdg && *xdg) ? fs::path(xdg)
                                : fs::path(home ? home : "/") / ".config";
  return (base / "wlanpipe" / "config.json").string();
}

bool load_config_file(const std::string& path, BrokerConfig& cfg,
                      bool must_exist, std::string& err) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    if (!must_exist) return true;
    err = "config_not_found path=" + path;
    return false;
  }

  std::ifstream in(path);
  if (!in) {
    err = "config_open_failed path=" + path;
    return false;
  }

  json j;
  try {
    in >> j;
  } catch (const json::parse_error& e) {
    err = std::string("config_parse_error byte=") + std::to_string(e.byte);
    return false;
  }
  if (!j.is_object()) {
    err = "config_not_object";
    return false;
  }

  // Stage into a copy so a type error halfway through leaves cfg untouched.
  BrokerConfig next = cfg;
  int port = next.udp_port;
  if (!take(j, "local_path",      next.local_path,      err)) return false;
  if (!take(j, "udp_port",        port,                 err)) return false;
  if (!take(j, "interface",       next.interface,       err)) return false;
  if (!take(j, "recv_timeout_ms", next.recv_timeout_ms, err)) return false;
  if (!take(j, "target_prefix",   next.target_prefix,   err)) return false;
  if (!take(j, "link_wait_ms",    next.link_wait_ms,    err)) return false;
  if (!take(j, "address_wait_ms", next.address_wait_ms, err)) return false;
  if (!take(j, "poll_step_ms",    next.poll_step_ms,    err)) return false;
  if (!take(j, "wpa_ctrl_dir",    next.wpa_ctrl_dir,    err)) return false;
  if (!take(j, "wpa_request_ms",  next.wpa_request_ms,  err)) return false;
  if (!take(j, "scan_settle_ms",  next.scan_settle_ms,  err)) return false;

  if (port <= 0 || port > 65535) {
    err = "config_range_error key=udp_port";
    return false;
  }
  next.udp_port = static_cast<uint16_t>(port);

  cfg = next;
  return true;
}

// validate_config()
// POLICY: every timeout strictly positive; prefix 1..32 bytes so it can be
//         held in an SSID string.
bool validate_config(const BrokerConfig& cfg, std::string& err) {
  if (cfg.recv_timeout_ms <= 0) { err = "bad_value key=recv_timeout_ms"; return false; }
  if (cfg.link_wait_ms    <= 0) { err = "bad_value key=link_wait_ms";    return false; }
  if (cfg.address_wait_ms <= 0) { err = "bad_value key=address_wait_ms"; return false; }
  if (cfg.poll_step_ms    <= 0) { err = "bad_value key=poll_step_ms";    return false; }
  if (cfg.wpa_request_ms  <= 0) { err = "bad_value key=wpa_request_ms";  return false; }
  if (cfg.scan_settle_ms  <  0) { err = "bad_value key=scan_settle_ms";  return false; }
  if (cfg.target_prefix.empty() || cfg.target_prefix.size() > 32) {
    err = "bad_value key=target_prefix";
    return false;
  }
  if (cfg.transport == TransportMode::Local && cfg.local_path.empty()) {
    err = "bad_value key=local_path";
    return false;
  }
  return true;
}

const char* transport_name(TransportMode m) {
  switch (m) {
    case TransportMode::None:  return "none";
    case TransportMode::Local: return "local";
    case TransportMode::Udp:   return "udp";
  }
  return "none";
}

} // namespace wlanpipe
