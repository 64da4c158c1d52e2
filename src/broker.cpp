// -----------------------------------------------------------------------------
// broker.cpp - Implementation of the wlanpipe Broker
//
// API, reply rules and operational model:
//   see include/wlanpipe/broker.hpp
//
// Dispatch tests with a scripted provider: tests/test_broker.cpp
// Live socket loop tests:                  tests/test_loop.cpp
// -----------------------------------------------------------------------------
#include "wlanpipe/broker.hpp"

#include <chrono>
#include <thread>
#include <vector>

#include "datagram_io.hpp"

namespace wlanpipe {

namespace {

const char* kTag = "wlanpipe: ";

bool command_kind(uint8_t code, CommandKind& out) {
  switch (code) {
    case SYNC:    out = CommandKind::Sync;    return true;
    case CONNECT: out = CommandKind::Connect; return true;
    case UNBIND:  out = CommandKind::Unbind;  return true;
    case QUIT:    out = CommandKind::Quit;    return true;
    default:      return false;
  }
}

// Map a provider association outcome onto the wire vocabulary.
StatusCode status_for_associate(wifi::WifiResult r) {
  switch (r) {
    case wifi::WifiResult::Ok:         return StatusCode::Success;
    case wifi::WifiResult::NotFound:   return StatusCode::ErrNotFound;
    case wifi::WifiResult::AuthFailed: return StatusCode::ErrAssociation;
    case wifi::WifiResult::Timeout:    return StatusCode::ErrAssociation;
    case wifi::WifiResult::Error:      return StatusCode::ErrAssociation;
  }
  return StatusCode::ErrGeneric;
}

} // namespace

// ---------- public ----------

Broker::Broker(Session& session, const BrokerConfig& cfg, std::ostream& diag)
: session_(session), cfg_(cfg), diag_(diag) {
}

// handle_datagram()
// Gate order is fixed, first match wins:
//   1. length      -> Malformed, silent
//   2. shutdown    -> Ignored, silent
//   3. known code  -> Unknown, silent
//   4. state       -> Rejected, STATUS err_generic
//   5. dispatch    -> Handled
// Gates 1-3 never reply so the broker cannot be used to reflect traffic.
DispatchStatus Broker::handle_datagram(const uint8_t* data, std::size_t len, const ReplyFn& reply) {
  ++stats_.received;

  Frame f;
  if (decode(data, len, f) != DecodeStatus::Ok) {
    ++stats_.malformed;
    diag_ << kTag << "event=drop reason=malformed len=" << len
          << " expected=" << kFrameSize << "\n";
    return DispatchStatus::Malformed;
  }

  if (session_.state() == SessionState::ShuttingDown) {
    ++stats_.ignored;
    diag_ << kTag << "event=drop reason=shutting_down code=" << control_name(f.control_code) << "\n";
    return DispatchStatus::Ignored;
  }

  CommandKind cmd;
  if (!command_kind(f.control_code, cmd)) {
    ++stats_.unknown;
    diag_ << kTag << "event=drop reason=unknown_command " << describe(f) << "\n";
    return DispatchStatus::Unknown;
  }

  diag_ << kTag << "event=rx " << describe(f) << " state=" << state_name(session_.state()) << "\n";

  if (!session_.can_accept(cmd)) {
    ++stats_.rejected;
    diag_ << kTag << "event=reject cmd=" << command_name(cmd)
          << " state=" << state_name(session_.state()) << "\n";
    send(reply, make_status(StatusCode::ErrGeneric));
    return DispatchStatus::Rejected;
  }

  switch (cmd) {
    case CommandKind::Sync:    on_sync(f, reply);    break;
    case CommandKind::Connect: on_connect(f, reply); break;
    case CommandKind::Unbind:  on_unbind(reply);     break;
    case CommandKind::Quit:    on_quit();            break;
  }
  ++stats_.handled;
  return DispatchStatus::Handled;
}

// run()
// PRE:  fd bound by open_local_endpoint()/open_udp_endpoint().
// LOOP: stop flag and session state are checked before each wait; a timeout
//       just goes around again.
void Broker::run(int fd, const std::atomic<bool>& stop) {
  std::vector<uint8_t> in;
  PeerAddress from;

  while (!stop.load() && session_.state() != SessionState::ShuttingDown) {
    RecvStatus st = recv_datagram(fd, in, from, cfg_.recv_timeout_ms);
    if (st == RecvStatus::Timeout) continue;
    if (st == RecvStatus::Error) {
      ++stats_.recv_errors;
      diag_ << kTag << "event=recv_error\n";
      continue;
    }

    // Replies go to this datagram's sender and nowhere else.
    const PeerAddress sender = from;
    ReplyFn reply = [this, fd, sender](const Frame& out) {
      if (send_datagram(fd, encode(out), sender)) return true;
      diag_ << kTag << "event=send_error to=" << sender.to_string()
            << " code=" << control_name(out.control_code) << "\n";
      return false;
    };
    handle_datagram(in.data(), in.size(), reply);
  }

  diag_ << kTag << "event=loop_exit reason="
        << (session_.state() == SessionState::ShuttingDown ? "quit" : "signal") << "\n";
  log_stats();
}

void Broker::log_stats() {
  diag_ << kTag << "event=stats"
        << " received=" << stats_.received
        << " handled=" << stats_.handled
        << " malformed=" << stats_.malformed
        << " unknown=" << stats_.unknown
        << " ignored=" << stats_.ignored
        << " rejected=" << stats_.rejected
        << " replies=" << stats_.replies_sent
        << " send_failures=" << stats_.send_failures
        << " recv_errors=" << stats_.recv_errors << "\n";
}

// ---------- private: handlers ----------

// on_sync()
// Scanning is entered and left here; the session returns to Idle or
// Associated, whichever it was in. A scan never associates.
void Broker::on_sync(const Frame& f, const ReplyFn& reply) {
  wifi::SsidMatch match;
  match.kind = wifi::SsidMatch::Kind::Prefix;
  match.pattern.assign(cfg_.target_prefix.c_str(), cfg_.target_prefix.size());

  session_.enter_scanning();
  wifi::SsidStr found;
  const wifi::WifiResult r = session_.provider().scan_for_target(match, found);
  session_.leave_scanning();

  if (r == wifi::WifiResult::Ok) {
    session_.set_last_discovered(found);
    diag_ << kTag << "event=sync status=ok pair_code=" << f.sync_code()
          << " ssid=" << found.c_str() << "\n";
    send(reply, make_status(StatusCode::Success));
    return;
  }

  session_.clear_last_discovered();
  diag_ << kTag << "event=sync status=error result=" << wifi::result_name(r) << "\n";
  send(reply, make_status(StatusCode::ErrGeneric));
}

// on_connect()
// PRE:    session Idle (checked by can_accept).
// POLICY: BIND_ACK goes out before any provider call. A frontend with a short
//         retry timer sees the ack long before association finishes.
// POLICY: on any failure the provider is told to disassociate before the
//         session drops back to Idle, so no half-joined network is left behind.
void Broker::on_connect(const Frame& f, const ReplyFn& reply) {
  wifi::TargetNetwork target;
  if (!f.connect_target(target)) {
    diag_ << kTag << "event=connect status=error reason=invalid_payload\n";
    send(reply, make_status(StatusCode::ErrInvalidArgument));
    return;
  }

  send(reply, make_bind_ack());
  session_.enter_associating();

  wifi::IpStr ip;
  const StatusCode st = associate_sequence(target, ip);
  if (st == StatusCode::Success) {
    session_.mark_associated(target.ssid, ip);
    diag_ << kTag << "event=connect status=ok ssid=" << target.ssid.c_str()
          << " ip=" << ip.c_str() << "\n";
    send(reply, make_status(StatusCode::Success));
    return;
  }

  const wifi::WifiResult dr = session_.provider().disassociate();
  session_.reset_to_idle();
  diag_ << kTag << "event=connect status=error reason=" << status_name(static_cast<uint32_t>(st))
        << " ssid=" << target.ssid.c_str()
        << " cleanup=" << wifi::result_name(dr) << "\n";
  send(reply, make_status(st));
}

// associate_sequence()
// scan(exact ssid) -> associate -> link up -> address. First failure wins.
StatusCode Broker::associate_sequence(const wifi::TargetNetwork& target, wifi::IpStr& ip) {
  wifi::IWifiProvider& p = session_.provider();

  wifi::SsidMatch match;
  match.kind = wifi::SsidMatch::Kind::Exact;
  match.pattern = target.ssid;

  wifi::SsidStr found;
  const wifi::WifiResult sr = p.scan_for_target(match, found);
  if (sr == wifi::WifiResult::NotFound) return StatusCode::ErrNotFound;
  if (sr != wifi::WifiResult::Ok)       return StatusCode::ErrGeneric;

  const wifi::WifiResult ar = p.associate(target);
  if (ar != wifi::WifiResult::Ok) {
    diag_ << kTag << "event=associate status=error result=" << wifi::result_name(ar) << "\n";
    return status_for_associate(ar);
  }

  if (!wait_for_link()) return StatusCode::ErrNoLink;

  const wifi::WifiResult ir = wait_for_address(ip);
  if (ir != wifi::WifiResult::Ok) return StatusCode::ErrNoAddress;
  return StatusCode::Success;
}

bool Broker::wait_for_link() {
  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + std::chrono::milliseconds(cfg_.link_wait_ms);
  while (true) {
    if (session_.provider().is_connected()) return true;
    if (clock::now() >= deadline) {
      diag_ << kTag << "event=link_wait status=timeout waited_ms=" << cfg_.link_wait_ms << "\n";
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(cfg_.poll_step_ms));
  }
}

// wait_for_address()
// NotFound means "not yet" and is polled; Error ends the wait at once.
wifi::WifiResult Broker::wait_for_address(wifi::IpStr& ip) {
  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + std::chrono::milliseconds(cfg_.address_wait_ms);
  while (true) {
    const wifi::WifiResult r = session_.provider().get_ip_address(ip);
    if (r != wifi::WifiResult::NotFound) return r;
    if (clock::now() >= deadline) {
      diag_ << kTag << "event=address_wait status=timeout waited_ms=" << cfg_.address_wait_ms << "\n";
      return wifi::WifiResult::Timeout;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(cfg_.poll_step_ms));
  }
}

// on_unbind()
// Disassociate unconditionally; the session is Idle afterwards no matter what
// the provider said.
void Broker::on_unbind(const ReplyFn& reply) {
  const wifi::WifiResult r = session_.provider().disassociate();
  session_.reset_to_idle();
  diag_ << kTag << "event=unbind result=" << wifi::result_name(r) << "\n";
  send(reply, make_status(r == wifi::WifiResult::Ok ? StatusCode::Success
                                                    : StatusCode::ErrGeneric));
}

void Broker::on_quit() {
  session_.shut_down();
  diag_ << kTag << "event=quit\n";
}

bool Broker::send(const ReplyFn& reply, const Frame& f) {
  if (!reply) return false;
  if (reply(f)) {
    ++stats_.replies_sent;
    return true;
  }
  ++stats_.send_failures;
  return false;
}

} // namespace wlanpipe
