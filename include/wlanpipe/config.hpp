/**
 * @file config.hpp
 * @brief Runtime settings for the broker: transport, timeouts, target naming.
 *
 * Precedence is defaults < JSON file < command line. main() builds a
 * BrokerConfig with the defaults below, layers load_config_file() on top, then
 * applies CLI11 flags.
 *
 * JSON keys (all optional, unknown keys ignored):
 * @code
 *   {
 *     "local_path":        "/tmp/wlanpipe-51000.sock",
 *     "udp_port":          51000,
 *     "interface":         "wlan0",
 *     "recv_timeout_ms":   1000,
 *     "target_prefix":     "WiiU",
 *     "link_wait_ms":      10000,
 *     "address_wait_ms":   15000,
 *     "poll_step_ms":      250,
 *     "wpa_ctrl_dir":      "/var/run/wpa_supplicant",
 *     "wpa_request_ms":    3000,
 *     "scan_settle_ms":    3000
 *   }
 * @endcode
 */
#ifndef WLANPIPE_CONFIG_HPP
#define WLANPIPE_CONFIG_HPP

#include <cstdint>
#include <string>

namespace wlanpipe {

constexpr uint16_t kDefaultPort = 51000;

enum class TransportMode : uint8_t { None = 0, Local, Udp };

struct BrokerConfig {
  TransportMode transport   = TransportMode::None;
  std::string   local_path  = "/tmp/wlanpipe-51000.sock";
  uint16_t      udp_port    = kDefaultPort;
  std::string   interface;                  // empty: provider default

  int recv_timeout_ms = 1000;

  std::string target_prefix = "WiiU";       // SYNC naming convention

  // CONNECT sequencing
  int link_wait_ms    = 10000;
  int address_wait_ms = 15000;
  int poll_step_ms    = 250;

  // wpa_supplicant provider
  std::string wpa_ctrl_dir   = "/var/run/wpa_supplicant";
  int         wpa_request_ms = 3000;
  int         scan_settle_ms = 3000;
};

/**
 * @brief Overlay values from a JSON file onto @p cfg.
 *
 * @param must_exist  When false, a missing file leaves @p cfg untouched and
 *                    returns true (the default path is optional).
 * @param err         Short reason on failure, e.g. "config_parse_error" or
 *                    "config_type_error key=udp_port".
 */
bool load_config_file(const std::string& path, BrokerConfig& cfg,
                      bool must_exist, std::string& err);

/// $XDG_CONFIG_HOME/wlanpipe/config.json, else $HOME/.config/wlanpipe/config.json.
std::string default_config_path();

/// Sanity checks that apply regardless of source (positive timeouts, non-empty prefix).
bool validate_config(const BrokerConfig& cfg, std::string& err);

const char* transport_name(TransportMode m);

} // namespace wlanpipe

#endif // WLANPIPE_CONFIG_HPP
