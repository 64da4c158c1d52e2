/**
 * @file session.hpp
 * @brief Lifecycle state of the one Wi-Fi association the broker manages.
 *
 * @details
 * STATES
 * ------
 * ```
 *            SYNC (returns to origin)
 *          +-----------+
 *          v           |
 *   Idle ---------> Scanning
 *    |  ^
 *    |  | failure / UNBIND
 *    v  |
 *   Associating ---> Associated ---SYNC---> Scanning ---> Associated
 *                        |
 *                        +---UNBIND---> Idle
 *
 *   any state ---QUIT---> ShuttingDown (terminal)
 * ```
 *
 * Scanning and Associating are entered and left inside one command handler.
 * They exist so a log line or a test can see what the broker was doing, and
 * so a CONNECT that arrives mid-association can never be accepted.
 *
 * OWNERSHIP
 * ---------
 * The Session owns the "current association" fact. It holds a reference to the
 * provider but never calls it; the broker does that. Nothing here is global:
 * main() constructs one Session after the provider initializes.
 */
#ifndef WLANPIPE_SESSION_HPP
#define WLANPIPE_SESSION_HPP

#include <cstdint>
#include <optional>

#include "wlanpipe/wifi/wifi_base.hpp"

namespace wlanpipe {

enum class SessionState : uint8_t {
  Idle = 0,
  Scanning,
  Associating,
  Associated,
  ShuttingDown,
};

enum class CommandKind : uint8_t { Sync, Connect, Unbind, Quit };

class Session {
public:
  explicit Session(wifi::IWifiProvider& provider);

  SessionState state() const { return state_; }
  wifi::IWifiProvider& provider() { return provider_; }

  /// True if @p cmd is legal in the current state. ShuttingDown accepts nothing.
  bool can_accept(CommandKind cmd) const;

  // ---- transitions (the broker calls these in handler order) ----
  void enter_scanning();
  void leave_scanning();                      // back to the state before enter_scanning()
  void enter_associating();
  void mark_associated(const wifi::SsidStr& ssid, const wifi::IpStr& ip);
  void reset_to_idle();                       // clears the current network
  void shut_down();

  // ---- facts ----
  const std::optional<wifi::SsidStr>& current_network() const { return current_; }
  const wifi::IpStr& current_address() const { return address_; }

  const std::optional<wifi::SsidStr>& last_discovered() const { return discovered_; }
  void set_last_discovered(const wifi::SsidStr& ssid) { discovered_ = ssid; }
  void clear_last_discovered() { discovered_.reset(); }

private:
  wifi::IWifiProvider&         provider_;
  SessionState                 state_{SessionState::Idle};
  SessionState                 before_scan_{SessionState::Idle};
  std::optional<wifi::SsidStr> current_;
  wifi::IpStr                  address_;
  std::optional<wifi::SsidStr> discovered_;
};

const char* state_name(SessionState s);
const char* command_name(CommandKind c);

} // namespace wlanpipe

#endif // WLANPIPE_SESSION_HPP
