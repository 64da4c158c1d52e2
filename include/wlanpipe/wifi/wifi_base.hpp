#pragma once
/**
 * @file wifi_base.hpp
 * @brief Platform-agnostic Wi-Fi capability interface the broker drives.
 *
 * Header-only. A provider owns every piece of OS-level Wi-Fi state; the broker
 * only sees the results below.
 */

#include <array>
#include <cstddef>
#include <cstdint>

#include <etl/string.h>
#include <etl/vector.h>

namespace wlanpipe::wifi {

constexpr std::size_t kSsidMax   = 32;
constexpr std::size_t kSecretMax = 64;

using SsidStr  = etl::string<kSsidMax>;
using IpStr    = etl::string<46>;       // fits an IPv6 text address
using IfaceStr = etl::string<16>;       // IFNAMSIZ
using Bssid    = std::array<uint8_t, 6>;
using SecretBytes = etl::vector<uint8_t, kSecretMax>;

enum class WifiResult : uint8_t { Ok=0, NotFound=1, AuthFailed=2, Timeout=3, Error=4 };

/**
 * @brief Network the frontend asked for. The secret is opaque to the core.
 */
struct TargetNetwork {
  SsidStr     ssid;
  bool        has_bssid = false;
  Bssid       bssid{};
  SecretBytes secret;
};

/**
 * @brief SSID predicate handed to scan_for_target().
 *
 * Prefix is the naming-convention scan used by SYNC; Exact is the named scan
 * used by CONNECT.
 */
struct SsidMatch {
  enum class Kind : uint8_t { Prefix, Exact };
  Kind    kind = Kind::Prefix;
  SsidStr pattern;

  bool matches(const char* ssid, std::size_t len) const {
    if (kind == Kind::Exact) {
      if (len != pattern.size()) return false;
    } else if (len < pattern.size()) {
      return false;
    }
    for (std::size_t i = 0; i < pattern.size(); ++i) {
      if (ssid[i] != pattern[i]) return false;
    }
    return true;
  }
};

/**
 * @brief Capability contract every provider implements.
 *
 * Contract:
 *  - init(iface) acquires the interface; nullptr or "" means platform default.
 *  - scan_for_target() fills @p found with the first matching network, or NotFound.
 *  - associate() joins @p target. Ok does not imply an IP address yet.
 *  - disassociate() is idempotent; calling it when not associated returns Ok.
 *  - is_connected() reports the link layer only.
 *  - get_ip_address() returns NotFound until the OS has an address.
 *  - cleanup() releases everything; safe to call twice.
 *
 * Not thread-safe. The owner serializes all calls.
 */
class IWifiProvider {
public:
  virtual ~IWifiProvider() = default;
  virtual bool        init(const char* iface) = 0;
  virtual WifiResult  scan_for_target(const SsidMatch& match, SsidStr& found) = 0;
  virtual WifiResult  associate(const TargetNetwork& target) = 0;
  virtual WifiResult  disassociate() = 0;
  virtual bool        is_connected() = 0;
  virtual WifiResult  get_ip_address(IpStr& out) = 0;
  virtual void        cleanup() = 0;
  virtual const char* name() const = 0;
  virtual const char* interface_name() const = 0;
};

inline const char* result_name(WifiResult r) {
  switch (r) {
    case WifiResult::Ok:         return "ok";
    case WifiResult::NotFound:   return "not_found";
    case WifiResult::AuthFailed: return "auth_failed";
    case WifiResult::Timeout:    return "timeout";
    case WifiResult::Error:      return "error";
  }
  return "error";
}

} // namespace wlanpipe::wifi
