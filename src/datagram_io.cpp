// ============================================================================
// datagram_io.cpp - implementation for datagram_io.hpp
// For API/overview see the matching .hpp. For usage, check tests/test_loop.cpp.
// ============================================================================

/**
 * @file datagram_io.cpp
 */

#include "datagram_io.hpp"

#include <arpa/inet.h>     // inet_ntop, htons, ntohs
#include <netdb.h>         // getaddrinfo for the UDP client
#include <netinet/in.h>    // sockaddr_in
#include <poll.h>          // poll(2) for timeout-based receive
#include <sys/un.h>        // sockaddr_un
#include <unistd.h>        // ::close, ::unlink
#include <cerrno>
#include <cstddef>         // offsetof
#include <cstring>         // std::memset, std::memcpy

namespace wlanpipe {

// ---------------------------------------------------------------------------
// fill_unix()
// -----------
// Build a sockaddr_un for @p path. Returns false if the path does not fit in
// sun_path (108 bytes on Linux including the terminator).
// ---------------------------------------------------------------------------
static bool fill_unix(const std::string& path, sockaddr_un& sa, socklen_t& len) {
  std::memset(&sa, 0, sizeof(sa));
  sa.sun_family = AF_UNIX;
  if (path.empty() || path.size() >= sizeof(sa.sun_path)) return false;
  std::memcpy(sa.sun_path, path.c_str(), path.size() + 1);
  len = static_cast<socklen_t>(offsetof(sockaddr_un, sun_path) + path.size() + 1);
  return true;
}

// ---------------------------------------------------------------------------
// bind_unix()
// -----------
// Shared by broker and client. Unlinks a stale path before bind; ENOENT from
// unlink is the normal case and is not an error.
// ---------------------------------------------------------------------------
static int bind_unix(const std::string& path) {
  sockaddr_un sa;
  socklen_t len = 0;
  if (!fill_unix(path, sa, len)) return -1;

  int fd = ::socket(AF_UNIX, SOCK_DGRAM | SOCK_CLOEXEC, 0);
  if (fd < 0) return -1;

  ::unlink(path.c_str());
  if (::bind(fd, reinterpret_cast<sockaddr*>(&sa), len) != 0) {
    ::close(fd);
    return -1;
  }
  return fd;
}

std::string PeerAddress::to_string() const {
  if (len == 0) return "none";
  if (addr.ss_family == AF_UNIX) {
    const auto* su = reinterpret_cast<const sockaddr_un*>(&addr);
    const socklen_t base = static_cast<socklen_t>(offsetof(sockaddr_un, sun_path));
    if (len <= base || su->sun_path[0] == '\0') return "local:(unnamed)";
    return std::string("local:") + su->sun_path;
  }
  if (addr.ss_family == AF_INET) {
    const auto* si = reinterpret_cast<const sockaddr_in*>(&addr);
    char buf[INET_ADDRSTRLEN] = {0};
    ::inet_ntop(AF_INET, &si->sin_addr, buf, sizeof(buf));
    return std::string("udp:") + buf + ":" + std::to_string(ntohs(si->sin_port));
  }
  if (addr.ss_family == AF_INET6) {
    const auto* si = reinterpret_cast<const sockaddr_in6*>(&addr);
    char buf[INET6_ADDRSTRLEN] = {0};
    ::inet_ntop(AF_INET6, &si->sin6_addr, buf, sizeof(buf));
    return std::string("udp:[") + buf + "]:" + std::to_string(ntohs(si->sin6_port));
  }
  return "unknown";
}

// ---------------------------------------------------------------------------
// open_local_endpoint() / open_udp_endpoint()
// -------------------------------------------
// Broker-side binds. Both return the fd or -1; errno is left as the failing
// syscall set it so the caller can print strerror().
// ---------------------------------------------------------------------------
int open_local_endpoint(const std::string& path) {
  return bind_unix(path);
}

int open_udp_endpoint(uint16_t port) {
  int fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
  if (fd < 0) return -1;

  int one = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

  sockaddr_in sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sin_family      = AF_INET;
  sa.sin_addr.s_addr = htonl(INADDR_ANY);
  sa.sin_port        = htons(port);
  if (::bind(fd, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
    const int saved = errno;
    ::close(fd);
    errno = saved;
    return -1;
  }
  return fd;
}

int open_local_client(const std::string& own_path,
                      const std::string& broker_path,
                      PeerAddress& peer) {
  sockaddr_un sa;
  socklen_t len = 0;
  if (!fill_unix(broker_path, sa, len)) return -1;

  int fd = bind_unix(own_path);
  if (fd < 0) return -1;

  std::memset(&peer.addr, 0, sizeof(peer.addr));
  std::memcpy(&peer.addr, &sa, len);
  peer.len = len;
  return fd;
}

int open_udp_client(const std::string& host, uint16_t port, PeerAddress& peer) {
  addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family   = AF_UNSPEC;
  hints.ai_socktype = SOCK_DGRAM;

  addrinfo* res = nullptr;
  const std::string service = std::to_string(port);
  if (::getaddrinfo(host.c_str(), service.c_str(), &hints, &res) != 0 || !res) return -1;

  int fd = ::socket(res->ai_family, SOCK_DGRAM | SOCK_CLOEXEC, 0);
  if (fd >= 0) {
    std::memset(&peer.addr, 0, sizeof(peer.addr));
    std::memcpy(&peer.addr, res->ai_addr, res->ai_addrlen);
    peer.len = static_cast<socklen_t>(res->ai_addrlen);
  }
  ::freeaddrinfo(res);
  return fd;
}

// ---------------------------------------------------------------------------
// recv_datagram()
// ---------------
// One poll() bounded by timeout_ms, then one recvfrom().
// - MSG_TRUNC makes recvfrom return the real datagram length even when it did
//   not fit, so an oversized datagram is reported at its true size.
// - EINTR is a Timeout: the signal handler has already flipped the stop flag
//   and the caller re-checks it at the top of its loop.
// ---------------------------------------------------------------------------
RecvStatus recv_datagram(int fd, std::vector<uint8_t>& out, PeerAddress& from,
                         int timeout_ms, std::size_t max_len) {
  out.clear();
  pollfd pfd{fd, POLLIN, 0};

  int pr = ::poll(&pfd, 1, timeout_ms);
  if (pr == 0) return RecvStatus::Timeout;
  if (pr < 0)  return (errno == EINTR) ? RecvStatus::Timeout : RecvStatus::Error;
  if (!(pfd.revents & POLLIN)) return RecvStatus::Error;

  out.resize(max_len);
  from.len = sizeof(from.addr);
  ssize_t n = ::recvfrom(fd, out.data(), out.size(), MSG_TRUNC,
                         reinterpret_cast<sockaddr*>(&from.addr), &from.len);
  if (n < 0) {
    out.clear();
    from.len = 0;
    return (errno == EINTR || errno == EAGAIN) ? RecvStatus::Timeout : RecvStatus::Error;
  }
  // Truncated datagrams keep their real length; bytes past max_len are zero.
  out.resize(static_cast<std::size_t>(n));
  return RecvStatus::Ok;
}

bool send_datagram(int fd, const std::vector<uint8_t>& bytes, const PeerAddress& to) {
  if (to.len == 0) return false;
  ssize_t n = ::sendto(fd, bytes.data(), bytes.size(), MSG_NOSIGNAL,
                       reinterpret_cast<const sockaddr*>(&to.addr), to.len);
  return n == static_cast<ssize_t>(bytes.size());
}

void close_endpoint(int fd, const std::string& unlink_path) {
  if (fd >= 0) ::close(fd);
  if (!unlink_path.empty()) ::unlink(unlink_path.c_str());
}

} // namespace wlanpipe
