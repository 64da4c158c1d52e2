// -----------------------------------------------------------------------------
// session.cpp - wlanpipe session state machine
//
// State diagram and ownership notes: see include/wlanpipe/session.hpp
// -----------------------------------------------------------------------------
#include "wlanpipe/session.hpp"

namespace wlanpipe {

// ---------- public ----------

Session::Session(wifi::IWifiProvider& provider)
: provider_(provider) {
}

// can_accept()
// POLICY: table is fixed, first match wins.
//   ShuttingDown          -> nothing
//   Quit                  -> always
//   Unbind                -> Idle or Associated
//   Sync                  -> Idle or Associated
//   Connect               -> Idle only
// Transient states never see a command because handlers run to completion,
// but they reject everything except Quit all the same.
bool Session::can_accept(CommandKind cmd) const {
  if (state_ == SessionState::ShuttingDown) return false;
  if (cmd == CommandKind::Quit) return true;

  const bool settled = (state_ == SessionState::Idle || state_ == SessionState::Associated);
  switch (cmd) {
    case CommandKind::Sync:    return settled;
    case CommandKind::Unbind:  return settled;
    case CommandKind::Connect: return state_ == SessionState::Idle;
    case CommandKind::Quit:    return true;
  }
  return false;
}

void Session::enter_scanning() {
  before_scan_ = state_;
  state_ = SessionState::Scanning;
}

void Session::leave_scanning() {
  if (state_ == SessionState::Scanning) state_ = before_scan_;
}

void Session::enter_associating() {
  state_ = SessionState::Associating;
}

void Session::mark_associated(const wifi::SsidStr& ssid, const wifi::IpStr& ip) {
  current_ = ssid;
  address_ = ip;
  state_ = SessionState::Associated;
}

void Session::reset_to_idle() {
  current_.reset();
  address_.clear();
  state_ = SessionState::Idle;
}

void Session::shut_down() {
  state_ = SessionState::ShuttingDown;
}

// ---------- naming ----------

const char* state_name(SessionState s) {
  switch (s) {
    case SessionState::Idle:         return "idle";
    case SessionState::Scanning:     return "scanning";
    case SessionState::Associating:  return "associating";
    case SessionState::Associated:   return "associated";
    case SessionState::ShuttingDown: return "shutting_down";
  }
  return "unknown";
}

const char* command_name(CommandKind c) {
  switch (c) {
    case CommandKind::Sync:    return "sync";
    case CommandKind::Connect: return "connect";
    case CommandKind::Unbind:  return "unbind";
    case CommandKind::Quit:    return "quit";
  }
  return "unknown";
}

} // namespace wlanpipe
