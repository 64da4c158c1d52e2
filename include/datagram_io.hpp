/**
 * @page wp-datagram-io wlanpipe Datagram I/O API (Header)
 * @file datagram_io.hpp
 * @brief Open local or UDP datagram endpoints and move whole frames through them.
 *
 * @details
 * PURPOSE
 * -------
 * The broker and wlanpipe-ctl both need the same small set of socket calls:
 * bind an endpoint, wait for one datagram with a timeout while remembering who
 * sent it, and send a datagram back to that exact address. This header keeps
 * those calls in one place so the broker loop reads as protocol logic only.
 *
 * ROLE IN WLANPIPE
 * ----------------
 * - open_local_endpoint / open_udp_endpoint: broker side, one bound socket.
 * - open_local_client / open_udp_client: wlanpipe-ctl side, a socket that can
 *   receive replies from the broker.
 * - recv_datagram: poll + recvfrom, capturing the sender in a PeerAddress.
 * - send_datagram: sendto a captured PeerAddress.
 * - close_endpoint: close and, for local sockets, unlink the path.
 *
 * DESIGN CHOICES
 * --------------
 * - Free functions over raw fds. No class hierarchy, no hidden threads.
 * - POSIX only: socket, bind, poll, recvfrom, sendto. Runs on any Linux box.
 * - Datagram boundaries are the frame boundaries. No extra framing layer.
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Local endpoints are AF_UNIX SOCK_DGRAM. A stale path left behind by a
 *   crashed broker is unlinked before bind.
 * - A local client must bind its own path, otherwise the broker has no address
 *   to reply to. open_local_client does this.
 * - recv_datagram distinguishes a clean timeout from an error so the broker can
 *   keep looping on timeouts and log real errors.
 * - EINTR during poll is reported as Timeout; the caller re-checks its stop flag.
 *
 * EXAMPLE
 * -------
 * @code
 *   using namespace wlanpipe;
 *   int fd = open_udp_endpoint(51000);
 *   if (fd < 0) { // fatal at startup  }
 *
 *   std::vector<uint8_t> in;
 *   PeerAddress from;
 *   if (recv_datagram(fd, in, from, 1000) == RecvStatus::Ok) {
 *     send_datagram(fd, in, from);   // echo
 *   }
 *   close_endpoint(fd);
 * @endcode
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <sys/socket.h>

namespace wlanpipe {

enum class RecvStatus : uint8_t { Ok = 0, Timeout = 1, Error = 2 };

/**
 * @brief Address captured from recvfrom(), reusable as a sendto() destination.
 */
struct PeerAddress {
  sockaddr_storage addr{};
  socklen_t        len = 0;

  bool empty() const { return len == 0; }
  /// "udp:1.2.3.4:5000", "local:/tmp/x.sock" or "local:(unnamed)".
  std::string to_string() const;
};

/// Bind an AF_UNIX datagram socket at @p path (stale path unlinked first). -1 on failure.
int open_local_endpoint(const std::string& path);

/// Bind a UDP socket on INADDR_ANY:@p port. -1 on failure.
int open_udp_endpoint(uint16_t port);

/**
 * @brief Client side of the local transport.
 *
 * Binds @p own_path so replies can come back, then fills @p peer with the
 * broker's address at @p broker_path. -1 on failure.
 */
int open_local_client(const std::string& own_path,
                      const std::string& broker_path,
                      PeerAddress& peer);

/// Unbound UDP socket plus a resolved @p peer for host:port. -1 on failure.
int open_udp_client(const std::string& host, uint16_t port, PeerAddress& peer);

/**
 * @brief Wait up to @p timeout_ms for one datagram.
 *
 * @param max_len  Receive buffer size. A datagram longer than this is truncated
 *                 and reported with its real length so callers can reject it.
 * @return Ok with @p out and @p from filled; Timeout; or Error.
 */
RecvStatus recv_datagram(int fd, std::vector<uint8_t>& out, PeerAddress& from,
                         int timeout_ms, std::size_t max_len = 2048);

/// One sendto(). True if the whole datagram was accepted by the kernel.
bool send_datagram(int fd, const std::vector<uint8_t>& bytes, const PeerAddress& to);

/// Close @p fd (no-op if negative) and unlink @p unlink_path when non-empty.
void close_endpoint(int fd, const std::string& unlink_path = std::string());

} // namespace wlanpipe
