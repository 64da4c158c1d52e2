#pragma once
/**
 * @file wifi_wpa_supplicant.hpp
 * @brief Linux IWifiProvider that drives wpa_supplicant over its control socket.
 *
 * @details
 * PURPOSE
 * -------
 * wpa_supplicant exposes one AF_UNIX datagram socket per interface under its
 * control directory (usually /var/run/wpa_supplicant/<iface>). Each request is
 * a text command in one datagram and the reply is one datagram back. This
 * provider speaks that protocol directly, so the broker needs no libwpa_client
 * and no D-Bus.
 *
 * COMMANDS USED
 * -------------
 *   PING                       -> PONG              (init)
 *   SCAN                       -> OK | FAIL-BUSY    (scan_for_target)
 *   SCAN_RESULTS               -> header + rows     (scan_for_target)
 *   ADD_NETWORK                -> <id>              (associate)
 *   SET_NETWORK <id> <k> <v>   -> OK                (associate)
 *   SELECT_NETWORK <id>        -> OK                (associate)
 *   DISCONNECT                 -> OK                (disassociate)
 *   REMOVE_NETWORK <id>        -> OK                (disassociate, cleanup)
 *   STATUS                     -> key=value lines   (is_connected, get_ip_address)
 *
 * SECRET ENCODING
 * ---------------
 * The frontend hands over opaque bytes; this provider decides what they mean:
 *   - 0 bytes                      -> open network, key_mgmt NONE
 *   - 32 bytes                     -> raw WPA PSK, sent as 64 hex digits
 *   - 8..63 printable ASCII bytes  -> passphrase, sent quoted
 *   - anything else                -> rejected before touching wpa_supplicant
 *
 * SSIDs are always sent as hex so no byte in an SSID can break the command line.
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Needs write access to the control socket: root, or the group named by
 *   ctrl_interface_group in wpa_supplicant.conf.
 * - The network this provider adds is temporary. It is removed on
 *   disassociate() and cleanup() and never saved to the config file.
 * - IP configuration is left to the system DHCP client. get_ip_address() only
 *   reads what wpa_supplicant reports in STATUS.
 */

#include <map>
#include <ostream>
#include <string>
#include <vector>

#include "datagram_io.hpp"
#include "wlanpipe/wifi/wifi_base.hpp"

namespace wlanpipe::wifi {

// Reply parsers and encoders, free so tests can pin them without a socket.
namespace wpa {

struct ScanEntry {
  std::string bssid;
  int         freq   = 0;
  int         signal = 0;     // dBm
  std::string flags;
  std::string ssid;           // unescaped
};

enum class SecretKind : uint8_t { Open, RawPsk, Passphrase, Invalid };

/// Rows of SCAN_RESULTS. The header line and short rows are skipped.
std::vector<ScanEntry> parse_scan_results(const std::string& raw);

/// STATUS key=value lines into a map. Lines without '=' are skipped.
std::map<std::string, std::string> parse_status(const std::string& raw);

/// Undo wpa_supplicant's printf_encode(): \\, \", \n, \r, \t, \e, \xNN.
std::string unescape_ssid(const std::string& s);

/**
 * @brief Classify @p secret and produce the SET_NETWORK value for it.
 *
 * @param value  "" for Open, 64 lowercase hex digits for RawPsk, the quoted
 *               passphrase for Passphrase. Untouched for Invalid.
 */
SecretKind encode_secret(const SecretBytes& secret, std::string& value);

std::string hex_encode(const uint8_t* p, std::size_t n);

/// True if @p name is a usable interface socket (not p2p-*, not hidden).
bool is_interface_socket(const std::string& name);

} // namespace wpa

class WpaSupplicantProvider : public IWifiProvider {
public:
  struct Options {
    std::string ctrl_dir      = "/var/run/wpa_supplicant";
    std::string client_dir    = "/tmp";
    int         request_ms    = 3000;
    int         scan_settle_ms = 3000;
  };

  WpaSupplicantProvider(const Options& opts, std::ostream& diag);
  ~WpaSupplicantProvider() override;

  WpaSupplicantProvider(const WpaSupplicantProvider&) = delete;
  WpaSupplicantProvider& operator=(const WpaSupplicantProvider&) = delete;

  bool        init(const char* iface) override;
  WifiResult  scan_for_target(const SsidMatch& match, SsidStr& found) override;
  WifiResult  associate(const TargetNetwork& target) override;
  WifiResult  disassociate() override;
  bool        is_connected() override;
  WifiResult  get_ip_address(IpStr& out) override;
  void        cleanup() override;
  const char* name() const override { return "wpa_supplicant"; }
  const char* interface_name() const override { return iface_.c_str(); }

private:
  // Shape check for a reply; a reply that fails it belongs to an earlier,
  // timed-out command and is discarded.
  using ReplyFit = bool (*)(const std::string& reply);

  bool request(const std::string& cmd, std::string& reply, ReplyFit fit);
  void drain_stale();
  bool request_ok(const std::string& cmd);
  bool query_status(std::map<std::string, std::string>& out);
  bool pick_interface(std::string& out);
  void remove_added_network();

  Options       opts_;
  std::ostream& diag_;
  int           fd_ = -1;
  PeerAddress   peer_;
  std::string   own_path_;
  std::string   iface_;
  int           net_id_ = -1;      // network added by associate(), -1 if none
};

} // namespace wlanpipe::wifi
