/**
 * @file broker.hpp
 * @brief wlanpipe Broker: the single-threaded command loop.
 *
 * @details
 * ## Field Brief
 * The Broker is the only piece of wlanpipe with real control flow. It owns the
 * bound datagram socket for the duration of run(), turns each datagram into a
 * Frame, checks the Session allows the command, calls the Wi-Fi provider, and
 * sends STATUS / BIND_ACK frames back to whoever sent the request.
 *
 * @par Operational Model
 * ```
 *   frontend ──datagram──► recv_datagram (timeout = recv_timeout_ms)
 *                                │
 *                         handle_datagram()
 *                                ├─ decode        (wrong size   -> drop, no reply)
 *                                ├─ shutting down (anything     -> drop, no reply)
 *                                ├─ command_kind  (STATUS, 0x7f -> drop, no reply)
 *                                ├─ can_accept    (bad state    -> STATUS err_generic)
 *                                └─ on_sync / on_connect / on_unbind / on_quit
 *                                         │
 *                                  IWifiProvider calls
 *                                         │
 *   frontend ◄──datagram── send_datagram(from)
 * ```
 *
 * @par Reply rules
 * | Command | Replies                                                       |
 * |---------|---------------------------------------------------------------|
 * | SYNC    | STATUS success, or err_generic if nothing matched             |
 * | CONNECT | BIND_ACK first, then STATUS success / err_* when done         |
 * |         | (bad payload: STATUS err_invalid_argument only)               |
 * | UNBIND  | STATUS success, or err_generic if the provider failed         |
 * | QUIT    | none                                                          |
 *
 * @par Threading
 * Single thread. Handlers run to completion, including the multi-second
 * association sequence, so at most one association is ever in flight. The stop
 * flag is read at the top of each iteration only; a handler in progress is
 * never interrupted.
 *
 * @par Diagnostics
 * Every event is one `wlanpipe: event=... key=value` line on the diag stream.
 * Secrets are never written there.
 */
#ifndef WLANPIPE_BROKER_HPP
#define WLANPIPE_BROKER_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>

#include "wlanpipe/config.hpp"
#include "wlanpipe/frame.hpp"
#include "wlanpipe/session.hpp"

namespace wlanpipe {

enum class DispatchStatus : uint8_t {
  Handled = 0,    // command ran; zero or more replies sent
  Malformed,      // wrong length; dropped
  Unknown,        // unrecognized or broker->frontend control code; dropped
  Ignored,        // session is shutting down; dropped
  Rejected,       // not legal in the current state; STATUS err_generic sent
};

struct BrokerStats {
  uint32_t received      = 0;
  uint32_t handled       = 0;
  uint32_t malformed     = 0;
  uint32_t unknown       = 0;
  uint32_t ignored       = 0;
  uint32_t rejected      = 0;
  uint32_t replies_sent  = 0;
  uint32_t send_failures = 0;
  uint32_t recv_errors   = 0;
};

class Broker {
public:
  /// Sends one reply frame to the sender of the datagram being handled.
  using ReplyFn = std::function<bool(const Frame&)>;

  Broker(Session& session, const BrokerConfig& cfg, std::ostream& diag);

  /**
   * @brief Process one received datagram.
   *
   * Usable without a socket: tests feed bytes and collect replies through
   * @p reply. The ReplyFn's return value is only counted in stats.
   */
  DispatchStatus handle_datagram(const uint8_t* data, std::size_t len, const ReplyFn& reply);

  /**
   * @brief Event loop over an already bound datagram socket.
   *
   * Returns when @p stop is set or a QUIT moved the session to ShuttingDown.
   * Per-datagram receive and send errors are logged and the loop continues.
   * Does not close @p fd or clean up the provider; the caller owns both.
   */
  void run(int fd, const std::atomic<bool>& stop);

  const BrokerStats& stats() const { return stats_; }
  void log_stats();

private:
  void on_sync(const Frame& f, const ReplyFn& reply);
  void on_connect(const Frame& f, const ReplyFn& reply);
  void on_unbind(const ReplyFn& reply);
  void on_quit();

  // CONNECT sequence after BIND_ACK; returns the final status to report.
  StatusCode associate_sequence(const wifi::TargetNetwork& target, wifi::IpStr& ip);
  bool wait_for_link();
  wifi::WifiResult wait_for_address(wifi::IpStr& ip);

  bool send(const ReplyFn& reply, const Frame& f);

  Session&            session_;
  const BrokerConfig& cfg_;
  std::ostream&       diag_;
  BrokerStats         stats_;
};

} // namespace wlanpipe

#endif // WLANPIPE_BROKER_HPP
